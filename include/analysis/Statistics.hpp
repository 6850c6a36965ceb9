#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace GcTriage
{
    namespace Analysis
    {
        /**
         * Small deterministic statistics helpers used by the metric aggregator.
         *
         * Conventions:
         *  - median(): mean of the two middle values for even sizes.
         *  - percentile(): nearest-rank on the sorted sample (p in [0, 100]).
         *  - Empty input yields 0.0 (callers check sample counts first).
         */

        double median(std::vector<double> values);

        double percentile(std::vector<double> values, double p);

        /// Fraction of values strictly below the limit (0.0 for empty input).
        double fractionBelow(const std::vector<double> &values, double limit);

        /**
         * Result of a straight-line fit y = intercept + slope * x.
         */
        struct LinearFit
        {
            double slope = 0.0;
            double intercept = 0.0;
            std::size_t samples = 0;
        };

        /**
         * Fit a line through (x, y) pairs.
         *
         * - 2 points: exact two-point delta.
         * - 3+ points: ordinary least squares.
         * - Fewer than 2 points, or all x equal: std::nullopt.
         */
        std::optional<LinearFit> fitLine(const std::vector<double> &xs,
                                         const std::vector<double> &ys);

        /**
         * OnlineStats
         *
         * Welford running mean/variance, used where only a summary of a long
         * series is needed.
         */
        class OnlineStats
        {
        public:
            void add(double x) noexcept;

            std::size_t count() const noexcept { return m_count; }
            double mean() const noexcept { return m_mean; }
            double variance() const noexcept;
            double stddev() const noexcept;
            double min() const noexcept { return m_min; }
            double max() const noexcept { return m_max; }

        private:
            std::size_t m_count = 0;
            double m_mean = 0.0;
            double m_m2 = 0.0;
            double m_min = 0.0;
            double m_max = 0.0;
        };

    } // namespace Analysis
} // namespace GcTriage

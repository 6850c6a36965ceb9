#include "analysis/Statistics.hpp"

#include <algorithm>
#include <cmath>

namespace GcTriage
{
    namespace Analysis
    {
        double median(std::vector<double> values)
        {
            if (values.empty())
            {
                return 0.0;
            }

            std::sort(values.begin(), values.end());
            const std::size_t n = values.size();
            if (n % 2 == 1)
            {
                return values[n / 2];
            }
            return (values[n / 2 - 1] + values[n / 2]) / 2.0;
        }

        double percentile(std::vector<double> values, double p)
        {
            if (values.empty())
            {
                return 0.0;
            }

            std::sort(values.begin(), values.end());
            p = std::clamp(p, 0.0, 100.0);

            // Nearest rank: smallest value with at least p% of the sample at or below it.
            const auto n = static_cast<double>(values.size());
            auto rank = static_cast<std::size_t>(std::ceil(p / 100.0 * n));
            rank = std::clamp<std::size_t>(rank, 1, values.size());
            return values[rank - 1];
        }

        double fractionBelow(const std::vector<double> &values, double limit)
        {
            if (values.empty())
            {
                return 0.0;
            }

            const auto below = std::count_if(values.begin(), values.end(),
                                             [limit](double v) { return v < limit; });
            return static_cast<double>(below) / static_cast<double>(values.size());
        }

        std::optional<LinearFit> fitLine(const std::vector<double> &xs,
                                         const std::vector<double> &ys)
        {
            const std::size_t n = std::min(xs.size(), ys.size());
            if (n < 2)
            {
                return std::nullopt;
            }

            LinearFit fit;
            fit.samples = n;

            if (n == 2)
            {
                const double dx = xs[1] - xs[0];
                if (dx == 0.0)
                {
                    return std::nullopt;
                }
                fit.slope = (ys[1] - ys[0]) / dx;
                fit.intercept = ys[0] - fit.slope * xs[0];
                return fit;
            }

            // Centered sums keep precision for large uptimes.
            double meanX = 0.0;
            double meanY = 0.0;
            for (std::size_t i = 0; i < n; ++i)
            {
                meanX += xs[i];
                meanY += ys[i];
            }
            meanX /= static_cast<double>(n);
            meanY /= static_cast<double>(n);

            double sxx = 0.0;
            double sxy = 0.0;
            for (std::size_t i = 0; i < n; ++i)
            {
                const double dx = xs[i] - meanX;
                sxx += dx * dx;
                sxy += dx * (ys[i] - meanY);
            }

            if (sxx == 0.0)
            {
                return std::nullopt;
            }

            fit.slope = sxy / sxx;
            fit.intercept = meanY - fit.slope * meanX;
            return fit;
        }

        void OnlineStats::add(double x) noexcept
        {
            if (m_count == 0)
            {
                m_min = x;
                m_max = x;
            }
            else
            {
                m_min = std::min(m_min, x);
                m_max = std::max(m_max, x);
            }

            ++m_count;
            const double delta = x - m_mean;
            m_mean += delta / static_cast<double>(m_count);
            m_m2 += delta * (x - m_mean);
        }

        double OnlineStats::variance() const noexcept
        {
            return m_count > 1 ? m_m2 / static_cast<double>(m_count - 1) : 0.0;
        }

        double OnlineStats::stddev() const noexcept
        {
            return std::sqrt(variance());
        }

    } // namespace Analysis
} // namespace GcTriage

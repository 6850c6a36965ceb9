#pragma once

#include "analysis/EventStreamBuilder.hpp"
#include "analysis/Metrics.hpp"
#include "anomaly/ThresholdConfig.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        /**
         * MetricAggregator
         *
         * Responsibilities:
         *  - Walk the windowed events once and collect per-category series.
         *  - Reduce the series to Metrics: intervals, pause distribution,
         *    old-gen and metaspace trends, humongous/pause-spike correlation,
         *    TLAB rate, inter-GC gaps, collector identity, safepoints.
         *
         * Design notes:
         *  - Stateless apart from its thresholds; aggregate() is const and
         *    deterministic.
         *  - Sparse data still yields metrics; detectors decide how much to
         *    trust them.
         */
        class MetricAggregator
        {
        public:
            explicit MetricAggregator(const Anomaly::ThresholdConfig &thresholds);

            Metrics aggregate(const EventStream &stream) const;

        private:
            static TrendMetrics computeTrend(const std::vector<double> &uptimes,
                                             const std::vector<double> &values);

            static std::vector<double> computeFloor(const std::vector<RegionSample> &samples);

        private:
            Anomaly::ThresholdConfig m_thresholds;
        };

    } // namespace Analysis
} // namespace GcTriage

#pragma once

#include <cstddef>
#include <string>

#include "utils/ConfigLoader.hpp"

namespace GcTriage
{
    namespace Anomaly
    {
        /**
         * ThresholdConfig
         *
         * Every tunable of the aggregator and the suspect detectors in one
         * explicit value. Passed by const reference; never global.
         *
         * Config file keys are the snake_case field names, e.g.
         *   long_pause_ms = 1000
         */
        struct ThresholdConfig
        {
            // Retention / leak
            double oldTrendThreshold = 5.0;      ///< regions/min, old_trend_threshold

            // Long STW pauses
            double longPauseMs = 1000.0;         ///< long_pause_ms (inclusive)
            double pauseP99Ms = 500.0;           ///< pause_p99_ms

            // Allocation pressure
            double allocIntervalSec = 0.5;       ///< alloc_interval_sec
            double gcTimeRatio = 0.10;           ///< gc_time_ratio
            double intervalConsistency = 0.8;    ///< interval_consistency, share of intervals below alloc_interval_sec

            // Humongous pressure
            double humongousPerMin = 10.0;       ///< humongous_per_min
            double pauseSpikeFactor = 2.0;       ///< pause_spike_factor, x median pause
            double humongousLagSec = 5.0;        ///< humongous_lag_sec

            // GC starvation
            double gcGapSec = 120.0;             ///< gc_gap_sec
            double gapOccupancyPct = 80.0;       ///< gap_occupancy_pct

            // Metaspace
            double metaspaceMbPerMin = 2.0;      ///< metaspace_mb_per_min

            // TLAB
            double tlabSlowPerMin = 1000.0;      ///< tlab_slow_per_min

            // Shared
            std::size_t minSamples = 5;          ///< min_samples, below this confidence drops one level
            double criticalHeapPct = 90.0;       ///< critical_heap_pct
            std::size_t maxEvidenceLines = 10;   ///< max_evidence_lines

            /**
             * Overlay values found in a loaded config on top of the defaults.
             * Missing or unparseable keys keep the default.
             */
            static ThresholdConfig fromConfig(const Utils::ConfigLoader &config);

            /**
             * Check ranges. Throws std::invalid_argument naming the first bad key.
             */
            void validate() const;
        };

    } // namespace Anomaly
} // namespace GcTriage

#include "anomaly/ThresholdConfig.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <stdexcept>
#include <string>

namespace GcTriage
{
    namespace Anomaly
    {
        namespace
        {
            void requirePositive(double value, const char *key)
            {
                if (!(value > 0.0))
                {
                    throw std::invalid_argument(std::string(key) + " must be positive");
                }
            }

            void warnUnparsed(const Utils::ConfigLoader &config, const char *key, const std::string &fallback)
            {
                Utils::getLogger().warn(std::string("Config key '") + key + "' has invalid value '" +
                                        config.getStringOr(key, "") + "', using default " + fallback);
            }

            double doubleOr(const Utils::ConfigLoader &config, const char *key, double fallback)
            {
                if (!config.hasKey(key))
                {
                    return fallback;
                }
                auto v = config.getDouble(key);
                if (!v)
                {
                    warnUnparsed(config, key, Utils::formatFixed(fallback, 2));
                    return fallback;
                }
                return *v;
            }

            std::size_t sizeOr(const Utils::ConfigLoader &config, const char *key, std::size_t fallback)
            {
                if (!config.hasKey(key))
                {
                    return fallback;
                }
                auto v = config.getInt(key);
                if (!v || *v < 0)
                {
                    warnUnparsed(config, key, std::to_string(fallback));
                    return fallback;
                }
                return static_cast<std::size_t>(*v);
            }
        } // anonymous namespace

        ThresholdConfig ThresholdConfig::fromConfig(const Utils::ConfigLoader &config)
        {
            ThresholdConfig t;
            t.oldTrendThreshold   = doubleOr(config, "old_trend_threshold", t.oldTrendThreshold);
            t.longPauseMs         = doubleOr(config, "long_pause_ms", t.longPauseMs);
            t.pauseP99Ms          = doubleOr(config, "pause_p99_ms", t.pauseP99Ms);
            t.allocIntervalSec    = doubleOr(config, "alloc_interval_sec", t.allocIntervalSec);
            t.gcTimeRatio         = doubleOr(config, "gc_time_ratio", t.gcTimeRatio);
            t.intervalConsistency = doubleOr(config, "interval_consistency", t.intervalConsistency);
            t.humongousPerMin     = doubleOr(config, "humongous_per_min", t.humongousPerMin);
            t.pauseSpikeFactor    = doubleOr(config, "pause_spike_factor", t.pauseSpikeFactor);
            t.humongousLagSec     = doubleOr(config, "humongous_lag_sec", t.humongousLagSec);
            t.gcGapSec            = doubleOr(config, "gc_gap_sec", t.gcGapSec);
            t.gapOccupancyPct     = doubleOr(config, "gap_occupancy_pct", t.gapOccupancyPct);
            t.metaspaceMbPerMin   = doubleOr(config, "metaspace_mb_per_min", t.metaspaceMbPerMin);
            t.tlabSlowPerMin      = doubleOr(config, "tlab_slow_per_min", t.tlabSlowPerMin);
            t.minSamples          = sizeOr(config, "min_samples", t.minSamples);
            t.criticalHeapPct     = doubleOr(config, "critical_heap_pct", t.criticalHeapPct);
            t.maxEvidenceLines    = sizeOr(config, "max_evidence_lines", t.maxEvidenceLines);
            return t;
        }

        void ThresholdConfig::validate() const
        {
            requirePositive(oldTrendThreshold, "old_trend_threshold");
            requirePositive(longPauseMs, "long_pause_ms");
            requirePositive(pauseP99Ms, "pause_p99_ms");
            requirePositive(allocIntervalSec, "alloc_interval_sec");
            requirePositive(gcTimeRatio, "gc_time_ratio");
            requirePositive(intervalConsistency, "interval_consistency");
            requirePositive(humongousPerMin, "humongous_per_min");
            requirePositive(pauseSpikeFactor, "pause_spike_factor");
            requirePositive(humongousLagSec, "humongous_lag_sec");
            requirePositive(gcGapSec, "gc_gap_sec");
            requirePositive(gapOccupancyPct, "gap_occupancy_pct");
            requirePositive(metaspaceMbPerMin, "metaspace_mb_per_min");
            requirePositive(tlabSlowPerMin, "tlab_slow_per_min");
            requirePositive(criticalHeapPct, "critical_heap_pct");

            if (gcTimeRatio >= 1.0)
            {
                throw std::invalid_argument("gc_time_ratio must be below 1.0");
            }
            if (intervalConsistency > 1.0)
            {
                throw std::invalid_argument("interval_consistency must not exceed 1.0");
            }
            if (minSamples < 2)
            {
                throw std::invalid_argument("min_samples must be at least 2");
            }
            if (maxEvidenceLines == 0)
            {
                throw std::invalid_argument("max_evidence_lines must be positive");
            }
        }

    } // namespace Anomaly
} // namespace GcTriage

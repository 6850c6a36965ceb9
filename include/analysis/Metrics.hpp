#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/GcEvent.hpp"
#include "core/Report.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        /// One old-gen "regions after GC" observation.
        struct RegionSample
        {
            double uptimeSeconds = 0.0;
            std::size_t lineNumber = 0;
            double regions = 0.0;
            Core::PauseKind kind = Core::PauseKind::Young;
        };

        /// A pause at or above the long-pause threshold.
        struct LongPause
        {
            double uptimeSeconds = 0.0;
            std::size_t lineNumber = 0;
            double pauseMs = 0.0;
            Core::PauseKind kind = Core::PauseKind::Young;
            std::string cause;
        };

        struct YoungIntervalMetrics
        {
            std::size_t youngCount = 0;
            std::size_t intervalCount = 0;
            double medianSec = 0.0;
            double p99Sec = 0.0;
            double meanSec = 0.0;
            double stddevSec = 0.0;
            double fractionBelowThreshold = 0.0;   ///< share of intervals below alloc_interval_sec
        };

        struct PauseMetrics
        {
            std::size_t count = 0;
            double medianMs = 0.0;
            double p99Ms = 0.0;
            double maxMs = 0.0;
            double totalMs = 0.0;
            std::size_t longPauseCount = 0;        ///< pauses >= long_pause_ms
            std::vector<LongPause> longPauses;     ///< uptime order
            double gcTimeRatio = 0.0;              ///< total pause time / window duration
        };

        /// Growth rate of a series against uptime.
        struct TrendMetrics
        {
            std::size_t samples = 0;
            bool available = false;                ///< at least two samples at distinct uptimes
            double slopePerMin = 0.0;
            double first = 0.0;
            double last = 0.0;
            double delta = 0.0;                    ///< last - first
            double spanMinutes = 0.0;
        };

        struct OldGenMetrics
        {
            TrendMetrics trend;                    ///< regions/min
            std::vector<RegionSample> samples;
            std::size_t mixedCycles = 0;
            std::size_t fullCycles = 0;
            std::vector<double> floor;             ///< post-mixed/full minima, or quarter minima
            bool floorNonDecreasing = false;
            std::optional<double> capacityRegions;
            std::optional<double> occupancyPct;    ///< last sample / capacity
            std::optional<double> minutesToNinetyPct;
        };

        struct MetaspaceMetrics
        {
            TrendMetrics trend;                    ///< MB/min of used-after
            std::size_t growthSteps = 0;           ///< consecutive samples that grew
            double largestJumpMb = 0.0;
            std::size_t thresholdTriggered = 0;    ///< pauses caused by "Metadata GC Threshold"
        };

        struct HumongousMetrics
        {
            std::size_t count = 0;
            double perMinute = 0.0;
            std::int64_t peakLiveRegions = 0;
            std::int64_t newRegions = 0;
            std::size_t triggeredPauses = 0;       ///< "G1 Humongous Allocation" pauses
            double spikeThresholdMs = 0.0;
            std::size_t pauseSpikes = 0;
            std::size_t correlatedSpikes = 0;      ///< spikes within humongous_lag_sec after a marker
        };

        struct TlabMetrics
        {
            bool available = false;                ///< any TLAB sample in the whole file
            std::size_t samples = 0;               ///< in window
            std::uint64_t slowAllocs = 0;
            double slowAllocsPerMin = 0.0;
            std::optional<double> maxWastePct;
        };

        struct EvacFailureMetrics
        {
            std::size_t count = 0;
            std::vector<std::int64_t> gcIds;
        };

        struct GapMetrics
        {
            std::size_t gcCount = 0;
            double maxGapSec = 0.0;
            double gapStartUptime = 0.0;
            std::size_t gapStartLine = 0;
            std::optional<double> occupancyAtGapStartPct;
            bool occupancyFromOldGen = false;   // false: whole-heap figure
        };

        struct CollectorMetrics
        {
            Core::CollectorFamily family = Core::CollectorFamily::G1;
            std::string name = "G1";
            bool assumed = true;                   ///< no identity line seen
            std::size_t lineNumber = 0;
        };

        struct SafepointMetrics
        {
            std::size_t count = 0;
            double maxTotalMs = 0.0;
            double maxReachingMs = 0.0;
            double totalMs = 0.0;
        };

        /**
         * Metrics
         *
         * Immutable per-category summaries of one analysis window,
         * computed exactly once by MetricAggregator.
         */
        struct Metrics
        {
            Core::AnalysisWindow window;
            double windowMinutes = 0.0;

            YoungIntervalMetrics young;
            PauseMetrics pauses;
            OldGenMetrics oldGen;
            MetaspaceMetrics metaspace;
            HumongousMetrics humongous;
            TlabMetrics tlab;
            EvacFailureMetrics evacFailures;
            GapMetrics gaps;
            CollectorMetrics collector;
            SafepointMetrics safepoints;

            std::optional<double> heapCapacityMb;  ///< max capacity, else last committed total
            std::optional<double> regionSizeMb;
            std::optional<double> heapOccupancyPct;
        };

    } // namespace Analysis
} // namespace GcTriage

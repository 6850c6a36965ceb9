#include "anomaly/SuspectDetectors.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace GcTriage::Anomaly
{
    using Analysis::Metrics;
    using Core::Confidence;
    using Core::Finding;
    using Core::FindingStatus;
    using Core::SuspectId;
    using Utils::formatFixed;
    using Utils::formatMinutes;

    // ---------- small helpers ----------
    static Confidence withDensity(Confidence confidence, std::size_t samples, const ThresholdConfig &thresholds)
    {
        return samples < thresholds.minSamples ? Core::lowered(confidence) : confidence;
    }

    static std::string percent(double ratio)
    {
        return formatFixed(ratio * 100.0, 1) + "%";
    }

    // ---------- Allocation pressure ----------
    std::optional<Finding> detectAllocationPressure(const Metrics &m, const ThresholdConfig &t)
    {
        const bool intervalSignal = m.young.intervalCount > 0 && m.young.medianSec < t.allocIntervalSec;
        const bool ratioSignal = m.pauses.gcTimeRatio > t.gcTimeRatio;
        if (!intervalSignal && !ratioSignal)
        {
            return std::nullopt;
        }

        const bool consistent = m.young.fractionBelowThreshold >= t.intervalConsistency;
        Confidence confidence = (intervalSignal && ratioSignal && consistent) ? Confidence::High : Confidence::Medium;
        confidence = withDensity(confidence, intervalSignal ? m.young.intervalCount : m.pauses.count, t);

        std::vector<std::string> evidence;
        if (m.young.intervalCount > 0)
        {
            evidence.push_back("Median young GC interval: " + formatFixed(m.young.medianSec, 3) + " s (p99 " +
                               formatFixed(m.young.p99Sec, 3) + " s, threshold " +
                               formatFixed(t.allocIntervalSec, 3) + " s) over " +
                               std::to_string(m.young.intervalCount) + " intervals");
            evidence.push_back(percent(m.young.fractionBelowThreshold) + " of young GC intervals below " +
                               formatFixed(t.allocIntervalSec, 3) + " s");
        }
        evidence.push_back("GC time ratio: " + percent(m.pauses.gcTimeRatio) + " of " +
                           formatMinutes(m.window.durationSeconds()) + " (threshold " + percent(t.gcTimeRatio) + ")");
        evidence.push_back("Young GCs in window: " + std::to_string(m.young.youngCount));
        if (m.evacFailures.count > 0)
        {
            evidence.push_back("Evacuation failures: " + std::to_string(m.evacFailures.count));
        }

        std::string summary = intervalSignal
                                  ? "Young GC every " + formatFixed(m.young.medianSec, 3) + " s (median)"
                                  : "GC consumes " + percent(m.pauses.gcTimeRatio) + " of uptime";

        return Finding(SuspectId::AllocationPressure, FindingStatus::Detected, confidence, std::move(summary),
                       std::move(evidence),
                       {"Short JFR capture (10-30 min, focus on allocation samples)",
                        "Compare young generation sizing (-Xmn / G1NewSizePercent) with the allocation rate",
                        "Increase logging: -Xlog:gc+heap=debug"},
                       {}, m.heapOccupancyPct);
    }

    // ---------- Humongous allocation pressure ----------
    std::optional<Finding> detectHumongousPressure(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &h = m.humongous;
        if (!(h.perMinute > t.humongousPerMin) || h.correlatedSpikes == 0)
        {
            return std::nullopt;
        }

        const double share = h.pauseSpikes > 0
                                 ? static_cast<double>(h.correlatedSpikes) / static_cast<double>(h.pauseSpikes)
                                 : 0.0;
        Confidence confidence = share >= 0.5 ? Confidence::High
                                : share >= 0.25 ? Confidence::Medium
                                                : Confidence::Low;
        confidence = withDensity(confidence, h.count, t);

        std::vector<std::string> evidence;
        evidence.push_back(std::to_string(h.count) + " humongous allocations in window (" +
                           formatFixed(h.perMinute, 1) + "/min, threshold " + formatFixed(t.humongousPerMin, 1) + ")");
        evidence.push_back("Peak live humongous regions: " + std::to_string(h.peakLiveRegions));
        evidence.push_back(std::to_string(h.pauseSpikes) + " pause spikes >= " + formatFixed(h.spikeThresholdMs, 1) +
                           " ms, " + std::to_string(h.correlatedSpikes) + " within " +
                           formatFixed(t.humongousLagSec, 1) + " s after a humongous allocation");
        if (h.triggeredPauses > 0)
        {
            evidence.push_back(std::to_string(h.triggeredPauses) + " pauses caused by G1 Humongous Allocation");
        }

        return Finding(SuspectId::HumongousPressure, FindingStatus::Detected, confidence,
                       formatFixed(h.perMinute, 1) + " humongous allocations/min with correlated pause spikes",
                       std::move(evidence),
                       {"JFR capture with jdk.ObjectAllocationOutsideTLAB to find large allocation sites",
                        "Try a larger region size: -XX:G1HeapRegionSize",
                        "Increase logging: -Xlog:gc+humongous=debug"});
    }

    // ---------- Long STW pauses ----------
    std::optional<Finding> detectLongStwPauses(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &p = m.pauses;
        if (p.longPauseCount == 0 || !(p.p99Ms > t.pauseP99Ms))
        {
            return std::nullopt;
        }

        Confidence confidence = p.longPauseCount >= 3 ? Confidence::High : Confidence::Medium;
        confidence = withDensity(confidence, p.count, t);

        std::vector<std::string> evidence;
        evidence.push_back(std::to_string(p.longPauseCount) + " pauses >= " + formatFixed(t.longPauseMs, 0) +
                           " ms; p99 " + formatFixed(p.p99Ms, 1) + " ms, max " + formatFixed(p.maxMs, 1) +
                           " ms over " + std::to_string(p.count) + " pauses");

        const std::size_t shown = std::min(p.longPauses.size(), t.maxEvidenceLines);
        for (std::size_t i = 0; i < shown; ++i)
        {
            const auto &lp = p.longPauses[i];
            std::string line = "Pause of " + formatFixed(lp.pauseMs, 1) + " ms at line " +
                               std::to_string(lp.lineNumber) + " (" + Core::toString(lp.kind);
            if (!lp.cause.empty())
                line += ", " + lp.cause;
            line += ")";
            evidence.push_back(std::move(line));
        }
        if (p.longPauses.size() > shown)
        {
            evidence.push_back("... " + std::to_string(p.longPauses.size() - shown) + " more long pauses");
        }

        return Finding(SuspectId::LongStwPauses, FindingStatus::Detected, confidence,
                       "Max pause " + formatFixed(p.maxMs, 1) + " ms, p99 " + formatFixed(p.p99Ms, 1) + " ms",
                       std::move(evidence),
                       {"JFR recording (GC + safepoint + pause phases)",
                        "Increase logging: -Xlog:gc*,safepoint*",
                        "Thread dump during long pause if reproducible"});
    }

    // ---------- GC starvation / finalizer backlog ----------
    std::optional<Finding> detectGcStarvation(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &g = m.gaps;
        if (!(g.maxGapSec > t.gcGapSec) || !g.occupancyAtGapStartPct ||
            *g.occupancyAtGapStartPct < t.gapOccupancyPct)
        {
            return std::nullopt;
        }

        const double occupancy = *g.occupancyAtGapStartPct;
        Confidence confidence = (g.maxGapSec >= 2.0 * t.gcGapSec && occupancy >= 90.0) ? Confidence::High
                                                                                        : Confidence::Medium;
        confidence = withDensity(confidence, g.gcCount, t);
        const std::string space = g.occupancyFromOldGen ? "old gen" : "heap";

        std::vector<std::string> evidence{
            "Longest gap between GCs: " + formatFixed(g.maxGapSec, 1) + " s (threshold " +
                formatFixed(t.gcGapSec, 1) + " s) starting at line " + std::to_string(g.gapStartLine) +
                " (uptime " + Utils::formatUptime(g.gapStartUptime) + ")",
            (g.occupancyFromOldGen ? "Old gen" : "Heap") + std::string(" occupancy at gap start: ") +
                formatFixed(occupancy, 1) + "% (threshold " +
                formatFixed(t.gapOccupancyPct, 1) + "%)",
        };

        return Finding(SuspectId::GcStarvation, FindingStatus::Detected, confidence,
                       "No GC for " + formatFixed(g.maxGapSec, 1) + " s with " + space + " " + formatFixed(occupancy, 1) +
                           "% full",
                       std::move(evidence),
                       {"Thread dump during the gap (jcmd <pid> Thread.print), check the Finalizer thread",
                        "jcmd <pid> GC.finalizer_info",
                        "Increase logging: -Xlog:gc*,safepoint*"},
                       {}, occupancy);
    }

    // ---------- Metaspace leak ----------
    std::optional<Finding> detectMetaspaceLeak(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &ms = m.metaspace;
        // Sustained: several growth steps and no single jump carrying most of the growth.
        const bool sustained = ms.growthSteps >= 2 && ms.trend.delta > 0.0 && ms.largestJumpMb <= 0.5 * ms.trend.delta;
        if (!ms.trend.available || !(ms.trend.slopePerMin > t.metaspaceMbPerMin) || !sustained)
        {
            return std::nullopt;
        }

        Confidence confidence = ms.thresholdTriggered > 0 ? Confidence::High : Confidence::Medium;
        confidence = withDensity(confidence, ms.trend.samples, t);

        std::vector<std::string> evidence;
        evidence.push_back("Metaspace used after GC: " + formatFixed(ms.trend.first, 1) + " MB -> " +
                           formatFixed(ms.trend.last, 1) + " MB (+" + formatFixed(ms.trend.delta, 1) + " MB over " +
                           formatFixed(ms.trend.spanMinutes, 1) + " min)");
        evidence.push_back("Growth rate: " + formatFixed(ms.trend.slopePerMin, 2) + " MB/min (threshold " +
                           formatFixed(t.metaspaceMbPerMin, 2) + ")");
        evidence.push_back(std::to_string(ms.growthSteps) + " of " + std::to_string(ms.trend.samples) +
                           " samples grew; largest single jump " + formatFixed(ms.largestJumpMb, 1) + " MB");
        evidence.push_back(std::to_string(ms.thresholdTriggered) + " collections triggered by Metadata GC Threshold");

        return Finding(SuspectId::MetaspaceLeak, FindingStatus::Detected, confidence,
                       "Metaspace growing " + formatFixed(ms.trend.slopePerMin, 2) + " MB/min",
                       std::move(evidence),
                       {"jcmd <pid> VM.metaspace",
                        "jcmd <pid> VM.classloader_stats (look for class loaders that keep growing)",
                        "Increase logging: -Xlog:class+load=info"});
    }

    // ---------- TLAB exhaustion ----------
    std::optional<Finding> detectTlabExhaustion(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &tl = m.tlab;
        if (!tl.available)
        {
            return Finding(SuspectId::TlabExhaustion, FindingStatus::None, Confidence::Low,
                           "TLAB data unavailable",
                           {"No TLAB lines in the log (gc+tlab=debug was not enabled)"},
                           {"Enable -Xlog:gc+tlab=debug to assess TLAB behavior"});
        }
        if (!(tl.slowAllocsPerMin > t.tlabSlowPerMin))
        {
            return std::nullopt;
        }

        const Confidence confidence = withDensity(Confidence::High, tl.samples, t);

        std::vector<std::string> evidence{
            "Slow-path allocations: " + std::to_string(tl.slowAllocs) + " in window (" +
                formatFixed(tl.slowAllocsPerMin, 1) + "/min, threshold " + formatFixed(t.tlabSlowPerMin, 1) + ")",
            "TLAB samples in window: " + std::to_string(tl.samples),
        };
        if (tl.maxWastePct)
        {
            evidence.push_back("Max TLAB waste: " + formatFixed(*tl.maxWastePct, 1) + "%");
        }

        return Finding(SuspectId::TlabExhaustion, FindingStatus::Detected, confidence,
                       formatFixed(tl.slowAllocsPerMin, 1) + " slow-path allocations/min",
                       std::move(evidence),
                       {"JFR capture with jdk.ObjectAllocationOutsideTLAB",
                        "Review -XX:TLABSize / -XX:MinTLABSize only after confirming the allocation sites"});
    }

    // ---------- Wrong collector choice ----------
    std::optional<Finding> detectWrongCollector(const Metrics &m, const ThresholdConfig &)
    {
        const auto &c = m.collector;
        if (c.assumed || !Core::isLegacyCollector(c.family))
        {
            return std::nullopt;
        }

        return Finding(SuspectId::WrongCollector, FindingStatus::Detected, Confidence::High,
                       std::string("Collector is ") + Core::toString(c.family) + ", not G1",
                       {"Line " + std::to_string(c.lineNumber) + ": Using " + c.name},
                       {"Switch to G1 (-XX:+UseG1GC) and re-capture the log",
                        "Confirm the JVM flags actually applied: jcmd <pid> VM.flags"});
    }

    // ---------- Retention / leak pattern ----------
    std::optional<Finding> detectRetention(const Metrics &m, const ThresholdConfig &t)
    {
        const auto &old = m.oldGen;
        if (!old.trend.available || !(old.trend.slopePerMin > t.oldTrendThreshold))
        {
            return std::nullopt;
        }

        Confidence confidence = Confidence::Low;
        if (old.mixedCycles >= 2 && old.floorNonDecreasing)
            confidence = Confidence::High;
        else if (old.floorNonDecreasing || old.mixedCycles + old.fullCycles >= 1)
            confidence = Confidence::Medium;
        confidence = withDensity(confidence, old.trend.samples, t);

        std::vector<std::string> evidence;
        evidence.push_back("Old gen trend: +" + formatFixed(old.trend.slopePerMin, 2) + " regions/min over " +
                           formatFixed(old.trend.spanMinutes, 1) + " min (threshold " +
                           formatFixed(t.oldTrendThreshold, 1) + ")");
        evidence.push_back("Old regions after GC: " + formatFixed(old.trend.first, 0) + " -> " +
                           formatFixed(old.trend.last, 0) + " (delta " + formatFixed(old.trend.delta, 0) + ")");
        evidence.push_back("Mixed collections: " + std::to_string(old.mixedCycles) + ", full collections: " +
                           std::to_string(old.fullCycles) + ", floor " +
                           (old.floorNonDecreasing ? "non-decreasing" : "not monotonic"));
        if (old.occupancyPct)
        {
            std::string line = "Old gen occupancy: " + formatFixed(*old.occupancyPct, 1) + "% of heap";
            if (old.minutesToNinetyPct)
                line += ", projected 90% in " + formatFixed(*old.minutesToNinetyPct, 1) + " min";
            evidence.push_back(std::move(line));
        }

        // Evenly spaced samples, first and last always included.
        const std::size_t n = old.samples.size();
        const std::size_t shown = std::min(n, t.maxEvidenceLines);
        for (std::size_t i = 0; i < shown; ++i)
        {
            const std::size_t idx = shown > 1 ? i * (n - 1) / (shown - 1) : n - 1;
            const auto &s = old.samples[idx];
            evidence.push_back("Line " + std::to_string(s.lineNumber) + ": " + formatFixed(s.regions, 0) +
                               " regions at " + formatMinutes(s.uptimeSeconds));
        }

        std::string note =
            "This pattern shows a steady increase in old generation occupancy. However, if the application is "
            "still in warmup/initial loading phase (e.g. caches, data structures filling up), this may be nominal "
            "growth until a plateau is reached. If a plateau is reached and growth continues, this is a very "
            "strong leak signal. If there is no plateau after a long runtime (several hours), a leak is almost "
            "certain. Always compare with a baseline healthy run to distinguish nominal from leak-like behavior.";

        return Finding(SuspectId::RetentionLeak, FindingStatus::Suspected, confidence,
                       "Old gen growing " + formatFixed(old.trend.slopePerMin, 2) + " regions/min",
                       std::move(evidence),
                       {"jcmd <pid> GC.class_histogram (check dominant classes)",
                        "Short JFR capture (10-30 min, focus on allocations + GC phases)",
                        "Heap dump + Eclipse MAT analysis (especially if trend persists after warmup/plateau)"},
                       std::move(note), m.heapOccupancyPct);
    }

    // ---------- Catalog ----------
    Core::FindingSet runAllDetectors(const Metrics &metrics, const ThresholdConfig &thresholds)
    {
        using DetectorFn = std::optional<Finding> (*)(const Metrics &, const ThresholdConfig &);
        static constexpr DetectorFn kCatalog[] = {
            &detectAllocationPressure,
            &detectHumongousPressure,
            &detectLongStwPauses,
            &detectGcStarvation,
            &detectMetaspaceLeak,
            &detectTlabExhaustion,
            &detectWrongCollector,
            &detectRetention,
        };

        Core::FindingSet findings;
        for (DetectorFn detect : kCatalog)
        {
            if (auto finding = detect(metrics, thresholds))
            {
                Utils::getLogger().debug(std::string("Detector fired: ") + Core::toString(finding->suspect()) +
                                         " [" + Core::toString(finding->status()) + ", " +
                                         Core::toString(finding->confidence()) + "]");
                findings.push_back(std::move(*finding));
            }
        }
        return findings;
    }

} // namespace GcTriage::Anomaly

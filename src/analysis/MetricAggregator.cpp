#include "analysis/MetricAggregator.hpp"
#include "analysis/Statistics.hpp"

#include <algorithm>
#include <set>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        using namespace Core;
        using namespace Utils;

        namespace
        {
            constexpr const char *kMetadataCause = "Metadata GC Threshold";
            constexpr double kTargetOccupancy = 0.90;

            std::optional<double> occupancyPct(double usedMb, std::optional<double> capacityMb, double fallbackMb)
            {
                const double capacity = capacityMb.value_or(fallbackMb);
                if (capacity <= 0.0)
                {
                    return std::nullopt;
                }
                return usedMb / capacity * 100.0;
            }
        } // anonymous namespace

        MetricAggregator::MetricAggregator(const Anomaly::ThresholdConfig &thresholds)
            : m_thresholds(thresholds)
        {
        }

        Metrics MetricAggregator::aggregate(const EventStream &stream) const
        {
            Metrics m;
            m.window = stream.window;
            m.windowMinutes = toMinutes(stream.window.durationSeconds());

            // --- Run-scoped facts ---
            for (const auto &e : stream.runScoped)
            {
                if (const auto *id = e.tryGet<CollectorIdentity>())
                {
                    if (m.collector.assumed)
                    {
                        m.collector.family = id->family;
                        m.collector.name = id->name;
                        m.collector.assumed = false;
                        m.collector.lineNumber = e.lineNumber;
                    }
                }
                else if (const auto *geometry = e.tryGet<HeapGeometry>())
                {
                    if (!m.regionSizeMb && geometry->regionSizeMb)
                        m.regionSizeMb = geometry->regionSizeMb;
                    if (!m.heapCapacityMb && geometry->maxCapacityMb)
                        m.heapCapacityMb = geometry->maxCapacityMb;
                }
            }
            const std::optional<double> heapMaxMb = m.heapCapacityMb;

            // --- Single pass: collect series ---
            std::vector<double> youngIntervals;
            std::optional<double> lastYoungUptime;
            std::size_t lastYoungSegment = 0;

            std::vector<double> pauseMs;
            std::vector<const Event *> pauseEvents;

            std::vector<double> oldUptimes;
            std::vector<double> oldValues;

            std::vector<double> metaUptimes;
            std::vector<double> metaValues;

            std::vector<double> humongousUptimes;
            std::set<std::int64_t> evacIds;
            std::size_t anonymousEvac = 0;

            const GcPause *lastPause = nullptr;

            for (const auto &e : stream.events)
            {
                switch (e.category)
                {
                case EventCategory::YoungGC:
                case EventCategory::MixedGC:
                case EventCategory::FullGC:
                case EventCategory::ConcurrentPause:
                {
                    const auto &gc = e.get<GcPause>();
                    pauseMs.push_back(gc.pause.pauseMs);
                    pauseEvents.push_back(&e);
                    m.pauses.totalMs += gc.pause.pauseMs;
                    m.pauses.maxMs = std::max(m.pauses.maxMs, gc.pause.pauseMs);
                    lastPause = &gc;

                    if (gc.pause.pauseMs >= m_thresholds.longPauseMs)
                    {
                        ++m.pauses.longPauseCount;
                        m.pauses.longPauses.push_back(LongPause{ .uptimeSeconds = e.uptimeSeconds,
                                                                 .lineNumber = e.lineNumber,
                                                                 .pauseMs = gc.pause.pauseMs,
                                                                 .kind = gc.pause.kind,
                                                                 .cause = gc.pause.cause });
                    }

                    if (e.category == EventCategory::YoungGC)
                    {
                        ++m.young.youngCount;
                        if (lastYoungUptime && lastYoungSegment == e.segment)
                        {
                            youngIntervals.push_back(e.uptimeSeconds - *lastYoungUptime);
                        }
                        lastYoungUptime = e.uptimeSeconds;
                        lastYoungSegment = e.segment;
                    }
                    else if (e.category == EventCategory::MixedGC)
                    {
                        ++m.oldGen.mixedCycles;
                    }
                    else if (e.category == EventCategory::FullGC)
                    {
                        ++m.oldGen.fullCycles;
                    }

                    if (gc.oldRegionsAfter)
                    {
                        m.oldGen.samples.push_back(RegionSample{ .uptimeSeconds = e.uptimeSeconds,
                                                                 .lineNumber = e.lineNumber,
                                                                 .regions = static_cast<double>(*gc.oldRegionsAfter),
                                                                 .kind = gc.pause.kind });
                        oldUptimes.push_back(e.uptimeSeconds);
                        oldValues.push_back(static_cast<double>(*gc.oldRegionsAfter));
                    }

                    if (gc.humongousRegionsBefore)
                    {
                        m.humongous.peakLiveRegions = std::max(m.humongous.peakLiveRegions, *gc.humongousRegionsBefore);
                    }

                    if (gc.pause.cause == kMetadataCause)
                    {
                        ++m.metaspace.thresholdTriggered;
                    }
                    break;
                }
                case EventCategory::HumongousAlloc:
                {
                    const auto &h = e.get<HumongousAllocation>();
                    ++m.humongous.count;
                    m.humongous.newRegions += h.newRegions;
                    m.humongous.peakLiveRegions = std::max(m.humongous.peakLiveRegions, h.liveRegions);
                    if (h.triggeredPause)
                        ++m.humongous.triggeredPauses;
                    humongousUptimes.push_back(e.uptimeSeconds);
                    break;
                }
                case EventCategory::EvacFailure:
                {
                    const auto &f = e.get<EvacuationFailure>();
                    if (f.gcId >= 0)
                        evacIds.insert(f.gcId);
                    else
                        ++anonymousEvac;
                    break;
                }
                case EventCategory::MetaspaceSample:
                {
                    const auto &s = e.get<MetaspaceSample>();
                    metaUptimes.push_back(e.uptimeSeconds);
                    metaValues.push_back(s.usedAfterMb);
                    break;
                }
                case EventCategory::TLABSample:
                {
                    const auto &t = e.get<TlabTotals>();
                    ++m.tlab.samples;
                    m.tlab.slowAllocs += t.slowAllocs;
                    if (t.wastePct)
                    {
                        m.tlab.maxWastePct = std::max(m.tlab.maxWastePct.value_or(0.0), *t.wastePct);
                    }
                    break;
                }
                case EventCategory::SafepointMarker:
                {
                    const auto &s = e.get<SafepointStats>();
                    ++m.safepoints.count;
                    m.safepoints.totalMs += s.totalMs;
                    m.safepoints.maxTotalMs = std::max(m.safepoints.maxTotalMs, s.totalMs);
                    m.safepoints.maxReachingMs = std::max(m.safepoints.maxReachingMs, s.reachingMs);
                    break;
                }
                case EventCategory::CollectorIdentity:
                case EventCategory::HeapGeometry:
                    break;
                }
            }

            // --- Young-GC interval ---
            m.young.intervalCount = youngIntervals.size();
            if (!youngIntervals.empty())
            {
                OnlineStats stats;
                for (double v : youngIntervals)
                    stats.add(v);
                m.young.meanSec = stats.mean();
                m.young.stddevSec = stats.stddev();
                m.young.medianSec = median(youngIntervals);
                m.young.p99Sec = percentile(youngIntervals, 99.0);
                m.young.fractionBelowThreshold = fractionBelow(youngIntervals, m_thresholds.allocIntervalSec);
            }

            // --- Pause distribution ---
            m.pauses.count = pauseMs.size();
            if (!pauseMs.empty())
            {
                m.pauses.medianMs = median(pauseMs);
                m.pauses.p99Ms = percentile(pauseMs, 99.0);
            }
            const double windowMs = stream.window.durationSeconds() * 1000.0;
            if (windowMs > 0.0)
            {
                m.pauses.gcTimeRatio = m.pauses.totalMs / windowMs;
            }

            // --- Heap capacity and occupancy ---
            if (!m.heapCapacityMb && lastPause)
            {
                m.heapCapacityMb = lastPause->pause.heapTotalMb;
            }
            if (lastPause)
            {
                m.heapOccupancyPct = occupancyPct(lastPause->pause.heapAfterMb, heapMaxMb, lastPause->pause.heapTotalMb);
            }

            // --- Old-gen trend ---
            m.oldGen.trend = computeTrend(oldUptimes, oldValues);
            m.oldGen.floor = computeFloor(m.oldGen.samples);
            m.oldGen.floorNonDecreasing = m.oldGen.floor.size() >= 2 &&
                                          std::is_sorted(m.oldGen.floor.begin(), m.oldGen.floor.end());
            if (m.regionSizeMb && *m.regionSizeMb > 0.0 && m.heapCapacityMb)
            {
                m.oldGen.capacityRegions = *m.heapCapacityMb / *m.regionSizeMb;
            }
            if (m.oldGen.capacityRegions && *m.oldGen.capacityRegions > 0.0 && !m.oldGen.samples.empty())
            {
                const double current = m.oldGen.samples.back().regions;
                const double capacity = *m.oldGen.capacityRegions;
                m.oldGen.occupancyPct = current / capacity * 100.0;

                const double target = kTargetOccupancy * capacity;
                if (current >= target)
                {
                    m.oldGen.minutesToNinetyPct = 0.0;
                }
                else if (m.oldGen.trend.available && m.oldGen.trend.slopePerMin > 0.0)
                {
                    m.oldGen.minutesToNinetyPct = (target - current) / m.oldGen.trend.slopePerMin;
                }
            }

            // --- Metaspace trend ---
            m.metaspace.trend = computeTrend(metaUptimes, metaValues);
            for (std::size_t i = 1; i < metaValues.size(); ++i)
            {
                const double jump = metaValues[i] - metaValues[i - 1];
                if (jump > 0.0)
                {
                    ++m.metaspace.growthSteps;
                    m.metaspace.largestJumpMb = std::max(m.metaspace.largestJumpMb, jump);
                }
            }

            // --- Humongous pressure and pause spikes ---
            if (m.windowMinutes > 0.0)
            {
                m.humongous.perMinute = static_cast<double>(m.humongous.count) / m.windowMinutes;
            }
            if (m.pauses.medianMs > 0.0)
            {
                m.humongous.spikeThresholdMs = m_thresholds.pauseSpikeFactor * m.pauses.medianMs;
                for (const Event *e : pauseEvents)
                {
                    if (e->get<GcPause>().pause.pauseMs < m.humongous.spikeThresholdMs)
                        continue;

                    ++m.humongous.pauseSpikes;
                    const double from = e->uptimeSeconds - m_thresholds.humongousLagSec;
                    auto it = std::lower_bound(humongousUptimes.begin(), humongousUptimes.end(), from);
                    if (it != humongousUptimes.end() && *it <= e->uptimeSeconds)
                    {
                        ++m.humongous.correlatedSpikes;
                    }
                }
            }

            // --- TLAB ---
            m.tlab.available = countOf(stream.summary.totals, EventCategory::TLABSample) > 0;
            if (m.tlab.available && m.windowMinutes > 0.0)
            {
                m.tlab.slowAllocsPerMin = static_cast<double>(m.tlab.slowAllocs) / m.windowMinutes;
            }

            // --- Evacuation failures ---
            m.evacFailures.gcIds.assign(evacIds.begin(), evacIds.end());
            m.evacFailures.count = evacIds.size() + anonymousEvac;

            // --- Inter-GC gap ---
            m.gaps.gcCount = pauseEvents.size();
            for (std::size_t i = 1; i < pauseEvents.size(); ++i)
            {
                const Event *prev = pauseEvents[i - 1];
                const Event *next = pauseEvents[i];
                if (prev->segment != next->segment)
                    continue;

                const double gap = next->uptimeSeconds - prev->uptimeSeconds;
                if (gap > m.gaps.maxGapSec)
                {
                    const auto &gc = prev->get<GcPause>();
                    const auto &start = gc.pause;
                    m.gaps.maxGapSec = gap;
                    m.gaps.gapStartUptime = prev->uptimeSeconds;
                    m.gaps.gapStartLine = prev->lineNumber;
                    // Old gen when its regions were logged, whole heap otherwise.
                    m.gaps.occupancyFromOldGen = gc.oldRegionsAfter && m.regionSizeMb && *m.regionSizeMb > 0.0;
                    const double usedMb = m.gaps.occupancyFromOldGen
                                              ? static_cast<double>(*gc.oldRegionsAfter) * *m.regionSizeMb
                                              : start.heapAfterMb;
                    m.gaps.occupancyAtGapStartPct = occupancyPct(usedMb, heapMaxMb, start.heapTotalMb);
                }
            }

            getLogger().info("Metrics: " + std::to_string(m.pauses.count) + " pauses (p99 " +
                             formatFixed(m.pauses.p99Ms, 1) + " ms), young interval median " +
                             formatFixed(m.young.medianSec, 3) + " s, old-gen trend " +
                             formatFixed(m.oldGen.trend.slopePerMin, 2) + " regions/min over " +
                             std::to_string(m.oldGen.trend.samples) + " samples");
            return m;
        }

        TrendMetrics MetricAggregator::computeTrend(const std::vector<double> &uptimes,
                                                    const std::vector<double> &values)
        {
            TrendMetrics t;
            t.samples = values.size();
            if (values.empty())
            {
                return t;
            }

            t.first = values.front();
            t.last = values.back();
            t.delta = t.last - t.first;
            t.spanMinutes = toMinutes(uptimes.back() - uptimes.front());

            std::vector<double> minutes;
            minutes.reserve(uptimes.size());
            for (double u : uptimes)
            {
                minutes.push_back(toMinutes(u));
            }

            if (auto fit = fitLine(minutes, values))
            {
                t.available = true;
                t.slopePerMin = fit->slope;
            }
            return t;
        }

        std::vector<double> MetricAggregator::computeFloor(const std::vector<RegionSample> &samples)
        {
            // Floor after old-gen reclaiming collections, when there are enough of them.
            std::vector<double> floor;
            for (const auto &s : samples)
            {
                if (s.kind == PauseKind::Mixed || s.kind == PauseKind::Full)
                    floor.push_back(s.regions);
            }
            if (floor.size() >= 2)
            {
                return floor;
            }

            // Otherwise the minimum of each quarter of the window.
            floor.clear();
            const std::size_t n = samples.size();
            if (n < 4)
            {
                return floor;
            }
            for (std::size_t q = 0; q < 4; ++q)
            {
                const std::size_t begin = q * n / 4;
                const std::size_t end = (q + 1) * n / 4;
                double low = samples[begin].regions;
                for (std::size_t i = begin + 1; i < end; ++i)
                {
                    low = std::min(low, samples[i].regions);
                }
                floor.push_back(low);
            }
            return floor;
        }

    } // namespace Analysis
} // namespace GcTriage

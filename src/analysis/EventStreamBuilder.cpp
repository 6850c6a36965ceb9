#include "analysis/EventStreamBuilder.hpp"

#include <algorithm>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        using namespace Core;
        using namespace Utils;

        namespace
        {
            constexpr const char *kHumongousCause = "G1 Humongous Allocation";
            constexpr const char *kMetadataCause  = "Metadata GC Threshold";
        } // anonymous namespace

        std::uint64_t EventStreamBuilder::PendingGc::snapshotCount() const noexcept
        {
            std::uint64_t n = 0;
            if (oldBefore || oldAfter)             ++n;
            if (humongousBefore || humongousAfter) ++n;
            if (metaspace)                         ++n;
            if (toSpaceExhausted)                  ++n;
            return n;
        }

        EventStreamBuilder::EventStreamBuilder(std::optional<double> tailWindowMinutes)
        {
            if (tailWindowMinutes)
            {
                m_windowSeconds = *tailWindowMinutes * 60.0;
            }
        }

        EventStream EventStreamBuilder::build(Input::ILineSource &source)
        {
            while (auto line = source.nextLine())
            {
                addLine(*line);
            }
            return finish();
        }

        void EventStreamBuilder::addLine(const Input::LogLine &line)
        {
            ++m_summary.linesRead;

            auto result = m_classifier.classifyDetailed(line.text, line.number);
            if (result.malformed)
            {
                ++m_summary.malformedLines;
                Logger &logger = getLogger();
                if (logger.isEnabled(LogLevel::DEBUG))
                {
                    logger.debug("Line " + std::to_string(line.number) + " skipped: " + result.error);
                }
            }

            if (result.line)
            {
                ++m_summary.linesClassified;
                addClassified(*result.line);
            }
        }

        void EventStreamBuilder::addClassified(const Input::ClassifiedLine &line)
        {
            const double uptime = canonicalUptime(line.uptimeSeconds);
            const std::size_t number = line.lineNumber;

            if (const auto *pause = std::get_if<PauseRecord>(&line.record))
            {
                onPause(*pause, uptime, number);
            }
            else if (const auto *regions = std::get_if<Input::RegionRecord>(&line.record))
            {
                onRegions(*regions);
            }
            else if (const auto *metaspace = std::get_if<Input::MetaspaceRecord>(&line.record))
            {
                onMetaspace(*metaspace, uptime, number);
            }
            else if (const auto *tlab = std::get_if<TlabTotals>(&line.record))
            {
                push(uptime, number, EventCategory::TLABSample, *tlab);
            }
            else if (const auto *failure = std::get_if<Input::EvacFailureRecord>(&line.record))
            {
                onEvacFailure(*failure, uptime, number);
            }
            else if (const auto *collector = std::get_if<CollectorIdentity>(&line.record))
            {
                pushRunScoped(uptime, number, EventCategory::CollectorIdentity, *collector);
            }
            else if (const auto *safepoint = std::get_if<SafepointStats>(&line.record))
            {
                push(uptime, number, EventCategory::SafepointMarker, *safepoint);
            }
            else if (const auto *geometry = std::get_if<HeapGeometry>(&line.record))
            {
                pushRunScoped(uptime, number, EventCategory::HeapGeometry, *geometry);
            }
        }

        EventStream EventStreamBuilder::finish()
        {
            dropPending();

            EventStream out;
            out.summary = m_summary;
            out.summary.segments = m_firstUptime ? m_segment + 1 : 0;
            out.events.assign(m_events.begin(), m_events.end());
            out.runScoped = m_runScoped;

            const double first = m_firstUptime.value_or(0.0);
            const double span  = m_latestUptime - first;

            AnalysisWindow window;
            window.endUptime = m_latestUptime;
            window.startUptime = first;
            window.fullSpan = true;
            if (m_windowSeconds)
            {
                window.requestedMinutes = toMinutes(*m_windowSeconds);
                if (span > *m_windowSeconds)
                {
                    window.startUptime = m_latestUptime - *m_windowSeconds;
                    window.fullSpan = false;
                }
                else
                {
                    out.notes.push_back("Requested tail window of " + formatMinutes(*m_windowSeconds) +
                                        " covers the whole log (span " + formatMinutes(span) +
                                        "); analyzing the full log.");
                }
            }
            out.window = window;

            for (const auto &e : out.events)
            {
                ++out.windowCounts[static_cast<std::size_t>(e.category)];
            }
            for (const auto &e : out.runScoped)
            {
                ++out.windowCounts[static_cast<std::size_t>(e.category)];
            }

            if (out.summary.segments > 1)
            {
                out.notes.push_back("Log contains " + std::to_string(out.summary.segments) +
                                    " JVM runs (uptime restarted); later runs are placed after earlier ones.");
            }
            if (out.summary.malformedLines > 0)
            {
                out.notes.push_back(std::to_string(out.summary.malformedLines) +
                                    " malformed line(s) skipped.");
            }
            if (out.summary.droppedSnapshots > 0)
            {
                out.notes.push_back(std::to_string(out.summary.droppedSnapshots) +
                                    " heap snapshot(s) without a completed pause discarded.");
            }

            getLogger().info("Event stream: " + std::to_string(out.summary.linesRead) + " lines, " +
                             std::to_string(out.summary.linesClassified) + " classified, " +
                             std::to_string(out.events.size()) + " events in window [" +
                             formatUptime(window.startUptime) + ", " + formatUptime(window.endUptime) + "], " +
                             std::to_string(m_evicted) + " evicted");

            return out;
        }

        // --- Private Implementation ---

        double EventStreamBuilder::canonicalUptime(double rawUptime)
        {
            if (m_lastRawUptime && rawUptime < *m_lastRawUptime)
            {
                if (*m_lastRawUptime - rawUptime >= kRestartToleranceSeconds)
                {
                    startSegment(rawUptime);
                }
                else
                {
                    // Interleaved writer threads; keep the timeline monotone.
                    return m_lastCanonical;
                }
            }

            m_lastRawUptime = rawUptime;
            m_lastCanonical = std::max(m_lastCanonical, rawUptime + m_offset);
            return m_lastCanonical;
        }

        void EventStreamBuilder::startSegment(double rawUptime)
        {
            getLogger().warn("JVM uptime went back from " + formatUptime(*m_lastRawUptime) + " to " +
                             formatUptime(rawUptime) + "; starting segment " +
                             std::to_string(m_segment + 2));

            // GC ids restart with the JVM, so snapshots of the old run can never complete.
            dropPending();

            ++m_segment;
            m_offset = m_lastCanonical - rawUptime;
            m_lastHumongousAfter = 0;
        }

        void EventStreamBuilder::dropPending()
        {
            for (const auto &[gcId, pending] : m_pending)
            {
                const auto n = pending.snapshotCount();
                m_summary.droppedSnapshots += n;
                Logger &logger = getLogger();
                if (n > 0 && logger.isEnabled(LogLevel::DEBUG))
                {
                    logger.debug("GC(" + std::to_string(gcId) + ") never completed; dropped " +
                                 std::to_string(n) + " snapshot(s)");
                }
            }
            m_pending.clear();
        }

        void EventStreamBuilder::onPause(const PauseRecord &pause, double uptime, std::size_t line)
        {
            GcPause event;
            event.pause = pause;

            PendingGc pending;
            if (pause.gcId >= 0)
            {
                auto it = m_pending.find(pause.gcId);
                if (it != m_pending.end())
                {
                    pending = std::move(it->second);
                    m_pending.erase(it);
                }
            }

            event.oldRegionsBefore       = pending.oldBefore;
            event.oldRegionsAfter        = pending.oldAfter;
            event.humongousRegionsBefore = pending.humongousBefore;
            event.humongousRegionsAfter  = pending.humongousAfter;
            event.pause.evacuationFailure = pause.evacuationFailure || pending.toSpaceExhausted;

            push(uptime, line, categoryOf(pause.kind), event);

            if (event.pause.evacuationFailure)
            {
                push(uptime, line, EventCategory::EvacFailure, EvacuationFailure{ .gcId = pause.gcId });
            }

            const bool humongousCause = pause.cause == kHumongousCause;
            std::int64_t newRegions = 0;
            if (event.humongousRegionsBefore && *event.humongousRegionsBefore > m_lastHumongousAfter)
            {
                newRegions = *event.humongousRegionsBefore - m_lastHumongousAfter;
            }
            if (humongousCause || newRegions > 0)
            {
                push(uptime, line, EventCategory::HumongousAlloc,
                     HumongousAllocation{ .gcId = pause.gcId,
                                          .newRegions = newRegions,
                                          .liveRegions = event.humongousRegionsBefore.value_or(0),
                                          .triggeredPause = humongousCause });
            }
            if (event.humongousRegionsAfter)
            {
                m_lastHumongousAfter = *event.humongousRegionsAfter;
            }

            if (pending.metaspace)
            {
                const auto &m = *pending.metaspace;
                push(uptime, pending.metaspaceLine, EventCategory::MetaspaceSample,
                     MetaspaceSample{ .gcId = m.gcId,
                                      .usedBeforeMb = m.usedBeforeMb,
                                      .usedAfterMb = m.usedAfterMb,
                                      .committedMb = m.committedMb,
                                      .metadataThresholdTriggered = pause.cause == kMetadataCause });
            }
        }

        void EventStreamBuilder::onRegions(const Input::RegionRecord &regions)
        {
            switch (regions.kind)
            {
            case Input::RegionKind::Old:
            {
                auto &pending = m_pending[regions.gcId];
                pending.oldBefore = regions.before;
                pending.oldAfter  = regions.after;
                break;
            }
            case Input::RegionKind::Humongous:
            {
                auto &pending = m_pending[regions.gcId];
                pending.humongousBefore = regions.before;
                pending.humongousAfter  = regions.after;
                break;
            }
            case Input::RegionKind::Eden:
            case Input::RegionKind::Survivor:
                break;
            }
        }

        void EventStreamBuilder::onMetaspace(const Input::MetaspaceRecord &metaspace, double uptime, std::size_t line)
        {
            if (metaspace.gcId)
            {
                auto &pending = m_pending[*metaspace.gcId];
                pending.metaspace = metaspace;
                pending.metaspaceLine = line;
                return;
            }

            push(uptime, line, EventCategory::MetaspaceSample,
                 MetaspaceSample{ .gcId = std::nullopt,
                                  .usedBeforeMb = metaspace.usedBeforeMb,
                                  .usedAfterMb = metaspace.usedAfterMb,
                                  .committedMb = metaspace.committedMb,
                                  .metadataThresholdTriggered = false });
        }

        void EventStreamBuilder::onEvacFailure(const Input::EvacFailureRecord &failure, double uptime, std::size_t line)
        {
            if (failure.gcId)
            {
                // Reported once, together with the pause of the same GC.
                m_pending[*failure.gcId].toSpaceExhausted = true;
                return;
            }

            push(uptime, line, EventCategory::EvacFailure, EvacuationFailure{ .gcId = -1 });
        }

        void EventStreamBuilder::push(double uptime, std::size_t line, EventCategory category, EventPayload payload)
        {
            noteUptime(uptime);
            ++m_summary.totals[static_cast<std::size_t>(category)];

            m_events.push_back(Event{ .uptimeSeconds = uptime,
                                      .lineNumber = line,
                                      .segment = m_segment,
                                      .category = category,
                                      .payload = std::move(payload) });

            if (m_windowSeconds)
            {
                const double cutoff = m_latestUptime - *m_windowSeconds;
                while (!m_events.empty() && m_events.front().uptimeSeconds < cutoff)
                {
                    m_events.pop_front();
                    ++m_evicted;
                }
            }
        }

        void EventStreamBuilder::pushRunScoped(double uptime, std::size_t line, EventCategory category, EventPayload payload)
        {
            noteUptime(uptime);
            ++m_summary.totals[static_cast<std::size_t>(category)];

            m_runScoped.push_back(Event{ .uptimeSeconds = uptime,
                                         .lineNumber = line,
                                         .segment = m_segment,
                                         .category = category,
                                         .payload = std::move(payload) });
        }

        void EventStreamBuilder::noteUptime(double uptime)
        {
            if (!m_firstUptime)
            {
                m_firstUptime = uptime;
            }
            m_latestUptime = std::max(m_latestUptime, uptime);
        }

    } // namespace Analysis
} // namespace GcTriage

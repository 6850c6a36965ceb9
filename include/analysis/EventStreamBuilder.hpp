#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/GcEvent.hpp"
#include "core/Report.hpp"
#include "input/LineClassifier.hpp"
#include "input/LineSource.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        /**
         * Output of one pass: the windowed events plus whole-file facts.
         */
        struct EventStream
        {
            Core::EventList events;          ///< Inside the analysis window, uptime order.
            Core::EventList runScoped;       ///< Collector identity and heap geometry (never windowed).
            Core::AnalysisWindow window;
            Core::CategoryCounts windowCounts{};
            Core::StreamSummary summary;
            std::vector<std::string> notes;  ///< Informational, e.g. window fallback.
        };

        /**
         * EventStreamBuilder
         *
         * Responsibilities:
         *  - Pull lines from a source once, classify them and build Events.
         *  - Join region and metaspace snapshots to the pause of the same GC id.
         *  - Derive humongous, evacuation-failure and metaspace-trigger markers.
         *  - Keep a canonical, non-decreasing uptime across JVM restarts.
         *  - Apply the trailing window by JVM uptime.
         *
         * Design notes:
         *  - Trailing window uses a deque with front eviction, so memory stays
         *    proportional to the window, not to the file.
         *  - Single use: construct a new builder for every run.
         */
        class EventStreamBuilder
        {
        public:
            /// Restarts smaller than this are treated as interleaving jitter, not a new JVM.
            static constexpr double kRestartToleranceSeconds = 1.0;

            explicit EventStreamBuilder(std::optional<double> tailWindowMinutes = std::nullopt);

            EventStreamBuilder(const EventStreamBuilder &)            = delete;
            EventStreamBuilder &operator=(const EventStreamBuilder &) = delete;

            /// Consume the whole source and return the finished stream.
            EventStream build(Input::ILineSource &source);

            /// Classify and ingest one raw line.
            void addLine(const Input::LogLine &line);

            /// Ingest a line that has already been classified.
            void addClassified(const Input::ClassifiedLine &line);

            /// Close the stream: drop orphan snapshots and compute the window.
            EventStream finish();

        private:
            /// Snapshots logged for a GC id before its pause completion line.
            struct PendingGc
            {
                std::optional<std::int64_t> oldBefore;
                std::optional<std::int64_t> oldAfter;
                std::optional<std::int64_t> humongousBefore;
                std::optional<std::int64_t> humongousAfter;
                std::optional<Input::MetaspaceRecord> metaspace;
                std::size_t metaspaceLine = 0;
                bool toSpaceExhausted = false;

                std::uint64_t snapshotCount() const noexcept;
            };

            double canonicalUptime(double rawUptime);
            void startSegment(double rawUptime);
            void dropPending();

            void onPause(const Core::PauseRecord &pause, double uptime, std::size_t line);
            void onRegions(const Input::RegionRecord &regions);
            void onMetaspace(const Input::MetaspaceRecord &metaspace, double uptime, std::size_t line);
            void onEvacFailure(const Input::EvacFailureRecord &failure, double uptime, std::size_t line);

            void push(double uptime, std::size_t line, Core::EventCategory category, Core::EventPayload payload);
            void pushRunScoped(double uptime, std::size_t line, Core::EventCategory category, Core::EventPayload payload);
            void noteUptime(double uptime);

        private:
            Input::LineClassifier m_classifier;
            std::optional<double> m_windowSeconds;

            std::deque<Core::Event> m_events;
            Core::EventList m_runScoped;
            std::map<std::int64_t, PendingGc> m_pending;

            // Segment tracking
            std::optional<double> m_lastRawUptime;
            double m_offset = 0.0;
            double m_lastCanonical = 0.0;
            std::size_t m_segment = 0;
            std::int64_t m_lastHumongousAfter = 0;

            std::optional<double> m_firstUptime;
            double m_latestUptime = 0.0;
            std::uint64_t m_evicted = 0;

            Core::StreamSummary m_summary;
        };

    } // namespace Analysis
} // namespace GcTriage

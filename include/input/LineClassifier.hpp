#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/GcEvent.hpp"
#include "input/LineSource.hpp"

namespace GcTriage
{
    namespace Input
    {
        enum class RegionKind
        {
            Eden,
            Survivor,
            Old,
            Humongous,
        };

        /// "GC(10) Old regions: 214->227"
        struct RegionRecord
        {
            std::int64_t gcId = -1;
            RegionKind kind = RegionKind::Old;
            std::int64_t before = 0;
            std::int64_t after = 0;
        };

        /// "GC(3) Metaspace: 1234K(1408K)->1234K(1408K)" or the JDK 11 "20480K->20480K(1067008K)"
        struct MetaspaceRecord
        {
            std::optional<std::int64_t> gcId;
            double usedBeforeMb = 0.0;
            double usedAfterMb = 0.0;
            std::optional<double> committedMb;
        };

        /// "GC(1074) To-space exhausted"
        struct EvacFailureRecord
        {
            std::optional<std::int64_t> gcId;
        };

        using LineRecord = std::variant<Core::PauseRecord,
                                        RegionRecord,
                                        MetaspaceRecord,
                                        Core::TlabTotals,
                                        EvacFailureRecord,
                                        Core::CollectorIdentity,
                                        Core::SafepointStats,
                                        Core::HeapGeometry>;

        /**
         * A line the classifier recognized: JVM uptime, origin line and one typed record.
         */
        struct ClassifiedLine
        {
            double uptimeSeconds = 0.0;
            std::size_t lineNumber = 0;
            LineRecord record;
        };

        /**
         * LineClassifier
         *
         * Responsibilities:
         *  - Recognize the unified-logging lines the triage engine cares about
         *    (pauses, region and metaspace snapshots, TLAB totals, evacuation
         *    failures, collector identity, safepoints, heap geometry).
         *  - Extract the JVM uptime decoration ([22.113s] or [22113ms]).
         *  - Never fail: anything unrecognized is "unclassified".
         *
         * Design notes:
         *  - Stateless after construction; regexes are compiled once.
         *  - Matching keys on message content, not on tag columns, so lines
         *    with any decorator set and tag padding are accepted.
         *  - Pause start lines (no heap sizes, no elapsed time) are ignored;
         *    the completion line carries every field.
         */
        class LineClassifier
        {
        public:
            /// Detailed result, used to count malformed lines.
            struct ClassifyResult
            {
                std::optional<ClassifiedLine> line;
                bool malformed = false;
                std::string error;   // best-effort reason for malformed lines
            };

            LineClassifier();

            LineClassifier(const LineClassifier &)            = default;
            LineClassifier &operator=(const LineClassifier &) = default;

            /**
             * Classify one line.
             *
             * Returns std::nullopt for unclassified lines.
             */
            std::optional<ClassifiedLine> classify(const LogLine &line) const;

            /**
             * Classify and report diagnostics.
             *
             * - Recognized: result.line has value.
             * - Looked like a GC record but a field failed to parse, or the
             *   decorations carried no uptime: result.malformed=true.
             * - Anything else: neither.
             */
            ClassifyResult classifyDetailed(std::string_view text, std::size_t lineNumber) const;

            /// Convert "<number><unit>" (B, K, M, G) to megabytes.
            static std::optional<double> toMegabytes(std::string_view number, char unit);

        private:
            struct Decorations
            {
                std::optional<double> uptimeSeconds;
                std::string_view message;
                bool decorated = false;
            };

            static Decorations splitDecorations(std::string_view text);

            std::optional<LineRecord> tryCollector(std::string_view message) const;
            std::optional<LineRecord> tryHeapGeometry(std::string_view message) const;
            std::optional<LineRecord> tryPause(std::string_view message, bool &malformed) const;
            std::optional<LineRecord> tryRegions(std::string_view message) const;
            std::optional<LineRecord> tryMetaspace(std::string_view message, bool &malformed) const;
            std::optional<LineRecord> tryTlab(std::string_view message, bool &malformed) const;
            std::optional<LineRecord> trySafepoint(std::string_view message) const;
            std::optional<LineRecord> tryEvacFailure(std::string_view message) const;

            std::optional<std::int64_t> extractGcId(const std::string &message) const;

        private:
            std::regex m_gcId;
            std::regex m_pauseHead;
            std::regex m_pauseTail;
            std::regex m_regions;
            std::regex m_metaspaceJdk17;
            std::regex m_metaspaceJdk11;
            std::regex m_tlabTotals;
            std::regex m_tlabWaste;
            std::regex m_collector;
            std::regex m_safepointJdk17;
            std::regex m_safepointReaching;
            std::regex m_safepointTotal;
            std::regex m_safepointJdk11;
            std::regex m_regionSize;
            std::regex m_maxCapacity;
        };

    } // namespace Input
} // namespace GcTriage

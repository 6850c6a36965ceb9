#include "input/LineClassifier.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <array>

namespace GcTriage
{
    namespace Input
    {
        using namespace Utils;

        namespace
        {
            constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

            // Time decorations at or above this are epoch stamps (tm, tn), not JVM uptime (um, un).
            constexpr double kEpochFloorSeconds = 1e8;

            // Top-level "( ... )" groups, allowing nested parentheses as in "(System.gc())".
            std::vector<std::string> parenGroups(std::string_view sv)
            {
                std::vector<std::string> groups;
                std::size_t depth = 0;
                std::size_t start = 0;
                for (std::size_t i = 0; i < sv.size(); ++i)
                {
                    if (sv[i] == '(')
                    {
                        if (depth == 0)
                            start = i + 1;
                        ++depth;
                    }
                    else if (sv[i] == ')' && depth > 0)
                    {
                        --depth;
                        if (depth == 0)
                            groups.emplace_back(trim(sv.substr(start, i - start)));
                    }
                }
                return groups;
            }

            bool isYoungPhase(std::string_view tag)
            {
                static constexpr std::array<std::string_view, 5> kPhases = {
                    "Normal", "Concurrent Start", "Prepare Mixed", "Mixed", "Concurrent End"
                };
                for (auto phase : kPhases)
                {
                    if (tag == phase)
                        return true;
                }
                return false;
            }

            std::optional<Core::CollectorFamily> collectorFamilyOf(std::string_view name)
            {
                if (name == "G1")                        return Core::CollectorFamily::G1;
                if (name == "Parallel")                  return Core::CollectorFamily::Parallel;
                if (name == "Serial")                    return Core::CollectorFamily::Serial;
                if (name == "The Z Garbage Collector")   return Core::CollectorFamily::Z;
                if (name == "Shenandoah")                return Core::CollectorFamily::Shenandoah;
                if (name == "Concurrent Mark Sweep")     return Core::CollectorFamily::ConcurrentMarkSweep;
                if (name == "Epsilon")                   return Core::CollectorFamily::Epsilon;
                return std::nullopt;
            }

            std::optional<std::int64_t> toInt64(const std::ssub_match &m)
            {
                return parseInteger<std::int64_t>(m.str());
            }
        } // anonymous namespace

        LineClassifier::LineClassifier()
            : m_gcId(R"(GC\((\d+)\))", kRegexFlags),
              m_pauseHead(R"(Pause (Young|Full|Remark|Cleanup)\b)", kRegexFlags),
              m_pauseTail(R"((\d+(?:\.\d+)?)([BKMG])->(\d+(?:\.\d+)?)([BKMG])\((\d+(?:\.\d+)?)([BKMG])\)\s+(\d+(?:\.\d+)?)ms\s*$)",
                          kRegexFlags),
              m_regions(R"((Eden|Survivor|Old|Humongous|Archive) regions:\s*(\d+)->(\d+))", kRegexFlags),
              m_metaspaceJdk17(R"(Metaspace:\s*(\d+(?:\.\d+)?)([BKMG])\((\d+(?:\.\d+)?)([BKMG])\)->(\d+(?:\.\d+)?)([BKMG])\((\d+(?:\.\d+)?)([BKMG])\))",
                               kRegexFlags),
              m_metaspaceJdk11(R"(Metaspace:\s*(\d+(?:\.\d+)?)([BKMG])->(\d+(?:\.\d+)?)([BKMG])\((\d+(?:\.\d+)?)([BKMG])\))",
                               kRegexFlags),
              m_tlabTotals(R"(TLAB totals:\s*thrds:\s*(\d+)\s+refills:\s*(\d+).*slow allocs:\s*(\d+))", kRegexFlags),
              m_tlabWaste(R"(waste:\s*(\d+(?:\.\d+)?)%)", kRegexFlags),
              m_collector(R"(^Using (G1|Parallel|Serial|The Z Garbage Collector|Shenandoah|Concurrent Mark Sweep|Epsilon)\b)",
                          kRegexFlags),
              m_safepointJdk17(R"re(Safepoint "([^"]+)")re", kRegexFlags),
              m_safepointReaching(R"(Reaching safepoint:\s*(\d+) ns)", kRegexFlags),
              m_safepointTotal(R"(Total:\s*(\d+) ns)", kRegexFlags),
              m_safepointJdk11(R"(Total time for which application threads were stopped:\s*(\d+(?:\.\d+)?) seconds, Stopping threads took:\s*(\d+(?:\.\d+)?) seconds)",
                               kRegexFlags),
              m_regionSize(R"(Heap [Rr]egion [Ss]ize:\s*(\d+(?:\.\d+)?)([BKMG]))", kRegexFlags),
              m_maxCapacity(R"(Heap Max Capacity:\s*(\d+(?:\.\d+)?)([BKMG]))", kRegexFlags)
        {
        }

        std::optional<ClassifiedLine> LineClassifier::classify(const LogLine &line) const
        {
            return classifyDetailed(line.text, line.number).line;
        }

        LineClassifier::ClassifyResult LineClassifier::classifyDetailed(std::string_view text,
                                                                         std::size_t lineNumber) const
        {
            ClassifyResult r;

            const Decorations deco = splitDecorations(text);
            if (deco.message.empty())
            {
                return r;
            }

            if (!deco.uptimeSeconds)
            {
                if (deco.decorated)
                {
                    r.malformed = true;
                    r.error = "no uptime decoration";
                }
                return r;
            }

            bool malformed = false;
            std::optional<LineRecord> record = tryCollector(deco.message);
            if (!record) record = tryHeapGeometry(deco.message);
            if (!record) record = tryPause(deco.message, malformed);
            if (!record && !malformed) record = tryRegions(deco.message);
            if (!record && !malformed) record = tryMetaspace(deco.message, malformed);
            if (!record && !malformed) record = tryTlab(deco.message, malformed);
            if (!record && !malformed) record = trySafepoint(deco.message);
            if (!record && !malformed) record = tryEvacFailure(deco.message);

            if (record)
            {
                r.line = ClassifiedLine{ .uptimeSeconds = *deco.uptimeSeconds,
                                         .lineNumber = lineNumber,
                                         .record = std::move(*record) };
            }
            else if (malformed)
            {
                r.malformed = true;
                r.error = "unparseable GC record: " + std::string(deco.message);
            }
            return r;
        }

        std::optional<double> LineClassifier::toMegabytes(std::string_view number, char unit)
        {
            auto value = parseFloat<double>(number);
            if (!value)
            {
                return std::nullopt;
            }

            switch (unit)
            {
            case 'B': return *value / (1024.0 * 1024.0);
            case 'K': return *value / 1024.0;
            case 'M': return *value;
            case 'G': return *value * 1024.0;
            default:  return std::nullopt;
            }
        }

        LineClassifier::Decorations LineClassifier::splitDecorations(std::string_view text)
        {
            Decorations d;
            std::string_view rest = ltrim(text);

            // "[2026-02-05T05:43:52.074+0200][22.113s][info][gc,heap     ] message"
            while (!rest.empty() && rest.front() == '[')
            {
                const auto close = rest.find(']');
                if (close == std::string_view::npos)
                {
                    break;
                }

                d.decorated = true;
                if (!d.uptimeSeconds)
                {
                    const auto seconds = parseUptimeDecoration(rest.substr(1, close - 1));
                    if (seconds && *seconds < kEpochFloorSeconds)
                    {
                        d.uptimeSeconds = seconds;
                    }
                }
                rest = ltrim(rest.substr(close + 1));
            }

            d.message = trim(rest);
            return d;
        }

        std::optional<std::int64_t> LineClassifier::extractGcId(const std::string &message) const
        {
            std::smatch m;
            if (!std::regex_search(message, m, m_gcId))
            {
                return std::nullopt;
            }
            return toInt64(m[1]);
        }

        std::optional<LineRecord> LineClassifier::tryCollector(std::string_view message) const
        {
            if (!startsWith(message, "Using "))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            std::smatch m;
            if (!std::regex_search(msg, m, m_collector))
            {
                return std::nullopt;
            }

            auto family = collectorFamilyOf(m[1].str());
            if (!family)
            {
                return std::nullopt;
            }
            return Core::CollectorIdentity{ .family = *family, .name = m[1].str() };
        }

        std::optional<LineRecord> LineClassifier::tryHeapGeometry(std::string_view message) const
        {
            if (!contains(message, "Heap Region Size:") &&
                !contains(message, "Heap region size:") &&
                !contains(message, "Heap Max Capacity:"))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            Core::HeapGeometry geometry;
            std::smatch m;
            if (std::regex_search(msg, m, m_regionSize))
            {
                geometry.regionSizeMb = toMegabytes(m[1].str(), m[2].str().front());
            }
            if (std::regex_search(msg, m, m_maxCapacity))
            {
                geometry.maxCapacityMb = toMegabytes(m[1].str(), m[2].str().front());
            }

            if (!geometry.regionSizeMb && !geometry.maxCapacityMb)
            {
                return std::nullopt;
            }
            return geometry;
        }

        std::optional<LineRecord> LineClassifier::tryPause(std::string_view message, bool &malformed) const
        {
            if (!contains(message, "Pause "))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            std::smatch head;
            if (!std::regex_search(msg, head, m_pauseHead))
            {
                return std::nullopt;
            }

            std::smatch tail;
            if (!std::regex_search(msg, tail, m_pauseTail))
            {
                // Start lines carry neither sizes nor elapsed time.
                if (contains(message, "->") || endsWith(message, "ms"))
                {
                    malformed = true;
                }
                return std::nullopt;
            }

            const auto headEnd   = static_cast<std::size_t>(head.position(0) + head.length(0));
            const auto tailStart = static_cast<std::size_t>(tail.position(0));
            if (tailStart < headEnd)
            {
                malformed = true;
                return std::nullopt;
            }

            Core::PauseRecord record;
            record.gcId = extractGcId(msg).value_or(-1);

            const std::string kind = head[1].str();
            if (kind == "Full")
                record.kind = Core::PauseKind::Full;
            else if (kind == "Remark")
                record.kind = Core::PauseKind::Remark;
            else if (kind == "Cleanup")
                record.kind = Core::PauseKind::Cleanup;
            else
                record.kind = Core::PauseKind::Young;

            for (const auto &tag : parenGroups(std::string_view(msg).substr(headEnd, tailStart - headEnd)))
            {
                if (startsWith(tag, "Evacuation Failure"))
                {
                    record.evacuationFailure = true;
                }
                else if (record.kind == Core::PauseKind::Young && record.phase.empty() && isYoungPhase(tag))
                {
                    record.phase = tag;
                    if (tag == "Mixed")
                        record.kind = Core::PauseKind::Mixed;
                }
                else if (record.cause.empty())
                {
                    record.cause = tag;
                }
            }

            auto before  = toMegabytes(tail[1].str(), tail[2].str().front());
            auto after   = toMegabytes(tail[3].str(), tail[4].str().front());
            auto total   = toMegabytes(tail[5].str(), tail[6].str().front());
            auto pauseMs = parseFloat<double>(tail[7].str());
            if (!before || !after || !total || !pauseMs)
            {
                malformed = true;
                return std::nullopt;
            }

            record.heapBeforeMb = *before;
            record.heapAfterMb  = *after;
            record.heapTotalMb  = *total;
            record.pauseMs      = *pauseMs;
            return record;
        }

        std::optional<LineRecord> LineClassifier::tryRegions(std::string_view message) const
        {
            if (!contains(message, " regions:"))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            std::smatch m;
            if (!std::regex_search(msg, m, m_regions))
            {
                return std::nullopt;
            }

            auto gcId = extractGcId(msg);
            if (!gcId)
            {
                return std::nullopt;
            }

            RegionRecord record;
            const std::string kind = m[1].str();
            if (kind == "Eden")
                record.kind = RegionKind::Eden;
            else if (kind == "Survivor")
                record.kind = RegionKind::Survivor;
            else if (kind == "Old")
                record.kind = RegionKind::Old;
            else if (kind == "Humongous")
                record.kind = RegionKind::Humongous;
            else
                return std::nullopt;   // archive regions are not tracked

            auto before = toInt64(m[2]);
            auto after  = toInt64(m[3]);
            if (!before || !after)
            {
                return std::nullopt;
            }

            record.gcId   = *gcId;
            record.before = *before;
            record.after  = *after;
            return record;
        }

        std::optional<LineRecord> LineClassifier::tryMetaspace(std::string_view message, bool &malformed) const
        {
            if (!contains(message, "Metaspace:"))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            MetaspaceRecord record;
            record.gcId = extractGcId(msg);

            std::smatch m;
            if (std::regex_search(msg, m, m_metaspaceJdk17))
            {
                auto usedBefore = toMegabytes(m[1].str(), m[2].str().front());
                auto usedAfter  = toMegabytes(m[5].str(), m[6].str().front());
                auto committed  = toMegabytes(m[7].str(), m[8].str().front());
                if (usedBefore && usedAfter)
                {
                    record.usedBeforeMb = *usedBefore;
                    record.usedAfterMb  = *usedAfter;
                    record.committedMb  = committed;
                    return record;
                }
            }
            else if (std::regex_search(msg, m, m_metaspaceJdk11))
            {
                auto usedBefore = toMegabytes(m[1].str(), m[2].str().front());
                auto usedAfter  = toMegabytes(m[3].str(), m[4].str().front());
                if (usedBefore && usedAfter)
                {
                    // The parenthesized JDK 11 figure is reserved space, not committed.
                    record.usedBeforeMb = *usedBefore;
                    record.usedAfterMb  = *usedAfter;
                    return record;
                }
            }

            malformed = true;
            return std::nullopt;
        }

        std::optional<LineRecord> LineClassifier::tryTlab(std::string_view message, bool &malformed) const
        {
            if (!contains(message, "TLAB totals:"))
            {
                return std::nullopt;
            }

            const std::string msg(message);
            std::smatch m;
            if (!std::regex_search(msg, m, m_tlabTotals))
            {
                malformed = true;
                return std::nullopt;
            }

            auto threads = parseInteger<std::uint64_t>(m[1].str());
            auto refills = parseInteger<std::uint64_t>(m[2].str());
            auto slow    = parseInteger<std::uint64_t>(m[3].str());
            if (!threads || !refills || !slow)
            {
                malformed = true;
                return std::nullopt;
            }

            Core::TlabTotals totals{ .threads = *threads, .refills = *refills, .slowAllocs = *slow };
            if (std::regex_search(msg, m, m_tlabWaste))
            {
                totals.wastePct = parseFloat<double>(m[1].str());
            }
            return totals;
        }

        std::optional<LineRecord> LineClassifier::trySafepoint(std::string_view message) const
        {
            const std::string msg(message);
            std::smatch m;

            if (contains(message, "Safepoint \""))
            {
                if (!std::regex_search(msg, m, m_safepointJdk17))
                {
                    return std::nullopt;
                }
                Core::SafepointStats stats;
                stats.operation = m[1].str();

                if (!std::regex_search(msg, m, m_safepointTotal))
                {
                    return std::nullopt;
                }
                auto totalNs = parseInteger<std::int64_t>(m[1].str());
                if (!totalNs)
                {
                    return std::nullopt;
                }
                stats.totalMs = static_cast<double>(*totalNs) / 1e6;

                if (std::regex_search(msg, m, m_safepointReaching))
                {
                    auto reachingNs = parseInteger<std::int64_t>(m[1].str());
                    if (reachingNs)
                        stats.reachingMs = static_cast<double>(*reachingNs) / 1e6;
                }
                return stats;
            }

            if (contains(message, "Total time for which application threads were stopped"))
            {
                if (!std::regex_search(msg, m, m_safepointJdk11))
                {
                    return std::nullopt;
                }
                auto total    = parseFloat<double>(m[1].str());
                auto stopping = parseFloat<double>(m[2].str());
                if (!total || !stopping)
                {
                    return std::nullopt;
                }
                return Core::SafepointStats{ .operation = {},
                                             .reachingMs = *stopping * 1000.0,
                                             .totalMs = *total * 1000.0 };
            }

            return std::nullopt;
        }

        std::optional<LineRecord> LineClassifier::tryEvacFailure(std::string_view message) const
        {
            if (!contains(message, "To-space exhausted"))
            {
                return std::nullopt;
            }
            return EvacFailureRecord{ .gcId = extractGcId(std::string(message)) };
        }

    } // namespace Input
} // namespace GcTriage

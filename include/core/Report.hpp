// Core data model for the outcome of one triage run. Consumed by the
// report generator and the exit-code mapper; produced by TriageEngine.

#ifndef GCTRIAGE_CORE_REPORT_HPP
#define GCTRIAGE_CORE_REPORT_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Finding.hpp"
#include "core/GcEvent.hpp"

namespace GcTriage
{
namespace Core
{

/// Per-category event counts, indexed by EventCategory.
using CategoryCounts = std::array<std::uint64_t, kEventCategoryCount>;

inline std::uint64_t countOf(const CategoryCounts &counts, EventCategory category) noexcept
{
    return counts[static_cast<std::size_t>(category)];
}

/**
 * @brief The uptime interval actually analyzed.
 *
 * When a tail window was requested and the data span is longer, the interval
 * is [endUptime - window, endUptime]. Otherwise it is the full data span.
 */
struct AnalysisWindow
{
    double startUptime{0.0};
    double endUptime{0.0};
    std::optional<double> requestedMinutes;   ///< Tail window as configured.
    bool fullSpan{true};                      ///< True when no event was cut by the window.

    double durationSeconds() const noexcept { return endUptime - startUptime; }
};

/**
 * @brief Whole-file statistics of one pass over the input.
 */
struct StreamSummary
{
    std::uint64_t linesRead{0};
    std::uint64_t linesClassified{0};
    std::uint64_t malformedLines{0};
    std::uint64_t segments{0};               ///< JVM runs detected (uptime restarts + 1).
    std::uint64_t droppedSnapshots{0};       ///< Region/metaspace snapshots whose GC never completed.
    CategoryCounts totals{};                 ///< Events per category over the whole file.
};

/**
 * @brief Result of one triage run.
 *
 * Responsibilities:
 *  - Hold the ordered finding set and the window it was computed over.
 *  - Carry enough figures for a renderer to produce any output format
 *    without re-deriving anything.
 *
 * Design notes:
 *  - Value type, built once by the engine and then only read.
 *  - Informational notes (window fallback, segments) live here and never
 *    in the finding set, so they cannot change the verdicts.
 */
class TriageReport
{
public:
    TriageReport() = default;

    // ---------- Accessors ----------

    const FindingSet &findings() const noexcept { return m_findings; }
    const AnalysisWindow &window() const noexcept { return m_window; }
    const CategoryCounts &windowCounts() const noexcept { return m_windowCounts; }
    const StreamSummary &stream() const noexcept { return m_stream; }
    const std::vector<std::string> &notes() const noexcept { return m_notes; }
    const std::optional<double> &heapOccupancyPct() const noexcept { return m_heapOccupancyPct; }
    CollectorFamily collector() const noexcept { return m_collector; }
    bool collectorAssumed() const noexcept { return m_collectorAssumed; }
    const std::optional<std::string> &sourceName() const noexcept { return m_sourceName; }

    /// Number of DETECTED or SUSPECTED findings.
    std::size_t activeFindingCount() const noexcept
    {
        std::size_t n = 0;
        for (const auto &f : m_findings)
        {
            if (f.isActive())
                ++n;
        }
        return n;
    }

    // ---------- Mutators (builder-style) ----------

    void setFindings(FindingSet findings) { m_findings = std::move(findings); }
    void setWindow(const AnalysisWindow &window) noexcept { m_window = window; }
    void setWindowCounts(const CategoryCounts &counts) noexcept { m_windowCounts = counts; }
    void setStream(const StreamSummary &stream) noexcept { m_stream = stream; }
    void addNote(std::string note) { m_notes.push_back(std::move(note)); }
    void setHeapOccupancyPct(std::optional<double> pct) noexcept { m_heapOccupancyPct = pct; }

    void setCollector(CollectorFamily family, bool assumed) noexcept
    {
        m_collector = family;
        m_collectorAssumed = assumed;
    }

    void setSourceName(std::optional<std::string> name) { m_sourceName = std::move(name); }

private:
    FindingSet m_findings;
    AnalysisWindow m_window;
    CategoryCounts m_windowCounts{};
    StreamSummary m_stream;
    std::vector<std::string> m_notes;
    std::optional<double> m_heapOccupancyPct;
    CollectorFamily m_collector{CollectorFamily::G1};
    bool m_collectorAssumed{true};
    std::optional<std::string> m_sourceName;
};

} // namespace Core
} // namespace GcTriage

#endif // GCTRIAGE_CORE_REPORT_HPP

#include "report/ReportGenerator.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace GcTriage
{
namespace Report
{
    // ---- Helpers (local to this translation unit) ----

    static std::vector<const Core::Finding*> activeFindings(const Core::TriageReport& report)
    {
        std::vector<const Core::Finding*> active;
        for (const auto& f : report.findings())
        {
            if (f.isActive())
                active.push_back(&f);
        }
        return active;
    }

    static std::string describeWindow(const Core::AnalysisWindow& w)
    {
        std::string text = Utils::formatUptime(w.startUptime) + " -> " + Utils::formatUptime(w.endUptime) +
                           " (" + Utils::formatMinutes(w.durationSeconds()) + ")";
        if (w.requestedMinutes)
        {
            text += w.fullSpan ? ", tail window " + Utils::formatFixed(*w.requestedMinutes, 1) + " min covers the whole log"
                               : ", tail window " + Utils::formatFixed(*w.requestedMinutes, 1) + " min";
        }
        else
        {
            text += ", whole log";
        }
        return text;
    }

    static std::string describeCollector(const Core::TriageReport& report)
    {
        std::string text = Core::toString(report.collector());
        if (report.collectorAssumed())
            text += " (assumed, no collector line)";
        return text;
    }

    static std::string findingHeading(const Core::Finding& f, SuspectSeverity severity)
    {
        return std::string(Core::toString(f.suspect())) + ": " + Core::toString(f.status()) + " (" +
               Core::toString(f.confidence()) + " confidence) [" + toString(severity) + "]";
    }

    // ---- ReportGenerator ----

    ReportGenerator::ReportGenerator(OutputFormat format, Anomaly::ThresholdConfig thresholds)
        : m_format(format)
        , m_thresholds(thresholds)
    {
        Utils::getLogger().debug(
            "ReportGenerator created (" + std::to_string(static_cast<int>(format)) + ")");
    }

    void ReportGenerator::generateReport(const Core::TriageReport& report)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_report = report;

        Utils::getLogger().info(
            "Report generated: " + std::to_string(m_report.activeFindingCount()) + " active of " +
            std::to_string(m_report.findings().size()) + " findings");
    }

    bool ReportGenerator::writeReport(std::ostream& output) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        switch (m_format)
        {
            case OutputFormat::MARKDOWN:
                renderMarkdown(output);
                break;
            case OutputFormat::TEXT:
                renderText(output);
                break;
            case OutputFormat::JSON:
                renderJson(output);
                break;
        }

        return output.good();
    }

    bool ReportGenerator::writeReportToFile(const std::string& filePath)
    {
        std::ofstream file(filePath);
        if (!file.is_open())
        {
            Utils::getLogger().error("Failed to open report file: " + filePath);
            return false;
        }

        return writeReport(file);
    }

    std::string ReportGenerator::getReportString() const
    {
        std::ostringstream oss;
        writeReport(oss);
        return oss.str();
    }

    void ReportGenerator::setFormat(OutputFormat format) noexcept
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_format = format;
    }

    std::string ReportGenerator::summaryLine() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return buildSummaryLine();
    }

    std::optional<ReportGenerator::OutputFormat> ReportGenerator::parseFormat(std::string_view name)
    {
        const std::string lower = Utils::toLower(std::string(name));
        if (lower == "md" || lower == "markdown")
            return OutputFormat::MARKDOWN;
        if (lower == "txt" || lower == "text")
            return OutputFormat::TEXT;
        if (lower == "json")
            return OutputFormat::JSON;
        return std::nullopt;
    }

    std::string ReportGenerator::buildSummaryLine() const
    {
        const auto active = activeFindings(m_report);
        if (active.empty())
            return "NO STRONG SIGNAL";

        if (active.size() == 1)
        {
            const auto& f = *active.front();
            return std::string(Core::toString(f.status())) + " - " + Core::toString(f.suspect()) + " (" +
                   Core::toString(f.confidence()) + " confidence)";
        }

        std::vector<std::string> names;
        for (const auto* f : active)
            names.emplace_back(Core::toString(f->suspect()));

        return std::to_string(active.size()) + " issues DETECTED -> " + Utils::join(names, ", ");
    }

    // ---- Rendering ----

    void ReportGenerator::renderMarkdown(std::ostream& output) const
    {
        const ExitCode code = computeExitCode(m_report, m_thresholds);

        output << "# GC Triage Report\n\n";
        if (m_report.sourceName())
            output << "**Source:** `" << *m_report.sourceName() << "`\n\n";
        output << "**Result:** " << buildSummaryLine() << "\n\n";
        output << "**Exit code:** " << static_cast<int>(code) << "\n\n";

        output << "## Analysis window\n\n";
        output << "- Uptime: " << describeWindow(m_report.window()) << "\n";
        output << "- Collector: " << describeCollector(m_report) << "\n";
        if (m_report.heapOccupancyPct())
            output << "- Heap occupancy after last GC: " << Utils::formatFixed(*m_report.heapOccupancyPct(), 1) << "%\n";

        const auto& s = m_report.stream();
        output << "- Lines read: " << s.linesRead << ", classified: " << s.linesClassified
               << ", malformed: " << s.malformedLines << ", JVM runs: " << s.segments << "\n\n";

        output << "| Category | In window | Whole log |\n";
        output << "|---|---:|---:|\n";
        for (std::size_t i = 0; i < Core::kEventCategoryCount; ++i)
        {
            const auto category = static_cast<Core::EventCategory>(i);
            output << "| " << Core::toString(category) << " | " << Core::countOf(m_report.windowCounts(), category)
                   << " | " << Core::countOf(s.totals, category) << " |\n";
        }
        output << "\n";

        output << "## Findings\n\n";
        if (m_report.findings().empty())
        {
            output << "No suspect matched.\n\n";
        }

        std::size_t index = 0;
        for (const auto& f : m_report.findings())
        {
            const auto severity = computeSuspectSeverity(f, m_thresholds.criticalHeapPct);
            output << "### " << ++index << ". " << findingHeading(f, severity) << "\n\n";
            output << f.summary() << "\n\n";

            output << "**Evidence:**\n";
            for (const auto& e : f.evidence())
                output << "- " << e << "\n";
            output << "\n";

            if (!f.note().empty())
                output << "**Business note:** " << f.note() << "\n\n";

            output << "**Next low-effort data:**\n";
            for (const auto& step : f.nextSteps())
                output << "- " << step << "\n";
            output << "\n";
        }

        if (!m_report.notes().empty())
        {
            output << "## Notes\n\n";
            for (const auto& note : m_report.notes())
                output << "- " << note << "\n";
            output << "\n";
        }
    }

    void ReportGenerator::renderText(std::ostream& output) const
    {
        const ExitCode code = computeExitCode(m_report, m_thresholds);

        output << "=== GC Triage Report ===\n";
        if (m_report.sourceName())
            output << "Source:      " << *m_report.sourceName() << "\n";
        output << "Result:      " << buildSummaryLine() << "\n";
        output << "Exit code:   " << static_cast<int>(code) << "\n";
        output << "Window:      " << describeWindow(m_report.window()) << "\n";
        output << "Collector:   " << describeCollector(m_report) << "\n";
        if (m_report.heapOccupancyPct())
            output << "Heap:        " << Utils::formatFixed(*m_report.heapOccupancyPct(), 1) << "% after last GC\n";

        const auto& s = m_report.stream();
        output << "Lines:       " << s.linesRead << " read, " << s.linesClassified << " classified, "
               << s.malformedLines << " malformed\n\n";

        std::size_t index = 0;
        for (const auto& f : m_report.findings())
        {
            const auto severity = computeSuspectSeverity(f, m_thresholds.criticalHeapPct);
            output << "[" << ++index << "] " << findingHeading(f, severity) << "\n";
            output << "    " << f.summary() << "\n";

            output << "    Evidence:\n";
            for (const auto& e : f.evidence())
                output << "      - " << e << "\n";

            if (!f.note().empty())
                output << "    Business note: " << f.note() << "\n";

            output << "    Next low-effort data:\n";
            for (const auto& step : f.nextSteps())
                output << "      - " << step << "\n";
            output << "\n";
        }

        for (const auto& note : m_report.notes())
            output << "Note: " << note << "\n";

        output << "=== END REPORT ===\n";
    }

    void ReportGenerator::renderJson(std::ostream& output) const
    {
        const auto& w = m_report.window();
        const auto& s = m_report.stream();

        output << "{\n";
        output << "  \"source\": ";
        if (m_report.sourceName())
            output << "\"" << Utils::escapeJson(*m_report.sourceName()) << "\"";
        else
            output << "null";
        output << ",\n";
        output << "  \"summary\": \"" << Utils::escapeJson(buildSummaryLine()) << "\",\n";
        output << "  \"exitCode\": " << static_cast<int>(computeExitCode(m_report, m_thresholds)) << ",\n";

        output << "  \"window\": {\"startUptime\": " << Utils::formatFixed(w.startUptime, 3)
               << ", \"endUptime\": " << Utils::formatFixed(w.endUptime, 3)
               << ", \"requestedMinutes\": ";
        if (w.requestedMinutes)
            output << Utils::formatFixed(*w.requestedMinutes, 3);
        else
            output << "null";
        output << ", \"fullSpan\": " << (w.fullSpan ? "true" : "false") << "},\n";

        output << "  \"collector\": {\"name\": \"" << Core::toString(m_report.collector())
               << "\", \"assumed\": " << (m_report.collectorAssumed() ? "true" : "false") << "},\n";

        output << "  \"heapOccupancyPct\": ";
        if (m_report.heapOccupancyPct())
            output << Utils::formatFixed(*m_report.heapOccupancyPct(), 1);
        else
            output << "null";
        output << ",\n";

        output << "  \"lines\": {\"read\": " << s.linesRead << ", \"classified\": " << s.linesClassified
               << ", \"malformed\": " << s.malformedLines << ", \"segments\": " << s.segments << "},\n";

        output << "  \"windowCounts\": {";
        for (std::size_t i = 0; i < Core::kEventCategoryCount; ++i)
        {
            const auto category = static_cast<Core::EventCategory>(i);
            output << (i > 0 ? ", " : "") << "\"" << Core::toString(category) << "\": "
                   << Core::countOf(m_report.windowCounts(), category);
        }
        output << "},\n";

        const auto& findings = m_report.findings();
        output << "  \"findings\": [\n";
        for (std::size_t i = 0; i < findings.size(); ++i)
        {
            const auto& f = findings[i];
            output << "    {\n";
            output << "      \"suspect\": \"" << Core::toSlug(f.suspect()) << "\",\n";
            output << "      \"name\": \"" << Utils::escapeJson(Core::toString(f.suspect())) << "\",\n";
            output << "      \"status\": \"" << Core::toString(f.status()) << "\",\n";
            output << "      \"confidence\": \"" << Core::toString(f.confidence()) << "\",\n";
            output << "      \"severity\": \""
                   << toString(computeSuspectSeverity(f, m_thresholds.criticalHeapPct)) << "\",\n";
            output << "      \"summary\": \"" << Utils::escapeJson(f.summary()) << "\",\n";

            output << "      \"evidence\": [";
            for (std::size_t j = 0; j < f.evidence().size(); ++j)
                output << (j > 0 ? ", " : "") << "\"" << Utils::escapeJson(f.evidence()[j]) << "\"";
            output << "],\n";

            output << "      \"nextSteps\": [";
            for (std::size_t j = 0; j < f.nextSteps().size(); ++j)
                output << (j > 0 ? ", " : "") << "\"" << Utils::escapeJson(f.nextSteps()[j]) << "\"";
            output << "]";

            if (!f.note().empty())
                output << ",\n      \"note\": \"" << Utils::escapeJson(f.note()) << "\"";
            output << "\n    }" << (i + 1 < findings.size() ? "," : "") << "\n";
        }
        output << "  ],\n";

        output << "  \"notes\": [";
        for (std::size_t i = 0; i < m_report.notes().size(); ++i)
            output << (i > 0 ? ", " : "") << "\"" << Utils::escapeJson(m_report.notes()[i]) << "\"";
        output << "]\n";
        output << "}\n";
    }

} // namespace Report
} // namespace GcTriage

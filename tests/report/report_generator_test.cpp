#include <catch2/catch.hpp>

#include <string>

#include "report/ExitCode.hpp"
#include "report/ReportGenerator.hpp"

using GcTriage::Core::CollectorFamily;
using GcTriage::Core::Confidence;
using GcTriage::Core::Finding;
using GcTriage::Core::FindingStatus;
using GcTriage::Core::SuspectId;
using GcTriage::Core::TriageReport;
using GcTriage::Report::ExitCode;
using GcTriage::Report::ReportGenerator;
using GcTriage::Report::SuspectSeverity;
using GcTriage::Report::computeExitCode;
using GcTriage::Report::computeSuspectSeverity;

namespace
{
    Finding allocationPressure(Confidence confidence = Confidence::Medium)
    {
        return Finding(SuspectId::AllocationPressure, FindingStatus::Detected, confidence,
                       "Young GC every 0.390 s (median)",
                       {"Median young GC interval: 0.390 s"},
                       {"Short JFR capture (10-30 min, focus on allocation samples)"});
    }

    Finding retention(Confidence confidence = Confidence::Medium, std::optional<double> occupancy = 40.0)
    {
        return Finding(SuspectId::RetentionLeak, FindingStatus::Suspected, confidence,
                       "Old gen growing 7.48 regions/min",
                       {"Old gen trend: +7.48 regions/min over 28.1 min (threshold 5.0)",
                        "Line 12: 120 regions at 0.2 min"},
                       {"jcmd <pid> GC.class_histogram (check dominant classes)"},
                       "Compare with a \"healthy\" baseline run.", occupancy);
    }

    Finding tlabUnavailable()
    {
        return Finding(SuspectId::TlabExhaustion, FindingStatus::None, Confidence::Low,
                       "TLAB data unavailable",
                       {"No TLAB lines in the log (gc+tlab=debug was not enabled)"},
                       {"Enable -Xlog:gc+tlab=debug to assess TLAB behavior"});
    }

    TriageReport makeReport(GcTriage::Core::FindingSet findings)
    {
        TriageReport report;
        report.setSourceName(std::string("gc.log"));
        GcTriage::Core::AnalysisWindow window;
        window.startUptime = 10.0;
        window.endUptime = 1694.41;
        report.setWindow(window);
        report.setHeapOccupancyPct(34.2);
        report.setCollector(CollectorFamily::G1, false);
        report.setFindings(std::move(findings));
        return report;
    }

    std::string render(const TriageReport &report, ReportGenerator::OutputFormat format)
    {
        ReportGenerator generator(format);
        generator.generateReport(report);
        return generator.getReportString();
    }

    bool contains(const std::string &haystack, const std::string &needle)
    {
        return haystack.find(needle) != std::string::npos;
    }
} // namespace

TEST_CASE("Summary line reflects the active findings", "[report][summary]")
{
    ReportGenerator generator;

    SECTION("nothing active")
    {
        generator.generateReport(makeReport({tlabUnavailable()}));
        CHECK(generator.summaryLine() == "NO STRONG SIGNAL");
    }

    SECTION("a single suspicion")
    {
        generator.generateReport(makeReport({tlabUnavailable(), retention()}));
        CHECK(generator.summaryLine() == "SUSPECTED - Retention / Leak Pattern (medium confidence)");
    }

    SECTION("several issues in catalog order")
    {
        generator.generateReport(makeReport({allocationPressure(), tlabUnavailable(), retention()}));
        CHECK(generator.summaryLine() == "2 issues DETECTED -> Allocation Pressure, Retention / Leak Pattern");
    }
}

TEST_CASE("Severity mapping per finding", "[report][exitcode]")
{
    CHECK(computeSuspectSeverity(tlabUnavailable(), 90.0) == SuspectSeverity::OK);
    CHECK(computeSuspectSeverity(allocationPressure(), 90.0) == SuspectSeverity::WARNING);
    CHECK(computeSuspectSeverity(allocationPressure(Confidence::High), 90.0) == SuspectSeverity::CRITICAL);
    CHECK(computeSuspectSeverity(retention(), 90.0) == SuspectSeverity::WARNING);
    CHECK(computeSuspectSeverity(retention(Confidence::High), 90.0) == SuspectSeverity::CRITICAL);
    CHECK(computeSuspectSeverity(retention(Confidence::Low, 93.0), 90.0) == SuspectSeverity::CRITICAL);

    const Finding legacy(SuspectId::WrongCollector, FindingStatus::Detected, Confidence::High,
                         "Collector is Parallel, not G1", {"Line 1: Using Parallel"}, {});
    CHECK(computeSuspectSeverity(legacy, 90.0) == SuspectSeverity::CRITICAL);
}

TEST_CASE("Exit code is the worst finding severity", "[report][exitcode]")
{
    const GcTriage::Anomaly::ThresholdConfig thresholds;

    CHECK(computeExitCode(makeReport({}), thresholds) == ExitCode::OK);
    CHECK(computeExitCode(makeReport({tlabUnavailable()}), thresholds) == ExitCode::OK);
    CHECK(computeExitCode(makeReport({allocationPressure(), retention()}), thresholds) == ExitCode::WARNING);
    CHECK(computeExitCode(makeReport({allocationPressure(Confidence::High)}), thresholds) == ExitCode::CRITICAL);

    SECTION("a full heap escalates any active finding")
    {
        auto report = makeReport({allocationPressure()});
        report.setHeapOccupancyPct(95.0);
        CHECK(computeExitCode(report, thresholds) == ExitCode::CRITICAL);
    }

    SECTION("a full heap alone does not")
    {
        auto report = makeReport({tlabUnavailable()});
        report.setHeapOccupancyPct(95.0);
        CHECK(computeExitCode(report, thresholds) == ExitCode::OK);
    }
}

TEST_CASE("Markdown report sections", "[report][markdown]")
{
    const auto text = render(makeReport({allocationPressure(), tlabUnavailable(), retention()}),
                             ReportGenerator::OutputFormat::MARKDOWN);

    CHECK(text.rfind("# GC Triage Report\n", 0) == 0);
    CHECK(contains(text, "**Source:** `gc.log`"));
    CHECK(contains(text, "**Result:** 2 issues DETECTED -> Allocation Pressure, Retention / Leak Pattern"));
    CHECK(contains(text, "**Exit code:** 1"));
    CHECK(contains(text, "## Analysis window"));
    CHECK(contains(text, "- Heap occupancy after last GC: 34.2%"));
    CHECK(contains(text, "### 1. Allocation Pressure: DETECTED (medium confidence) [WARNING]"));
    CHECK(contains(text, "### 2. TLAB Exhaustion: NONE (low confidence) [OK]"));
    CHECK(contains(text, "### 3. Retention / Leak Pattern: SUSPECTED (medium confidence) [WARNING]"));
    CHECK(contains(text, "**Business note:** Compare with a \"healthy\" baseline run."));
    CHECK(contains(text, "**Next low-effort data:**\n- jcmd <pid> GC.class_histogram (check dominant classes)"));

    // Findings appear in catalog order.
    CHECK(text.find("Allocation Pressure:") < text.find("TLAB Exhaustion:"));
    CHECK(text.find("TLAB Exhaustion:") < text.find("Retention / Leak Pattern:"));
}

TEST_CASE("Text report framing", "[report][text]")
{
    const auto text = render(makeReport({retention()}), ReportGenerator::OutputFormat::TEXT);
    CHECK(text.rfind("=== GC Triage Report ===\n", 0) == 0);
    CHECK(contains(text, "Result:      SUSPECTED - Retention / Leak Pattern (medium confidence)"));
    CHECK(contains(text, "[1] Retention / Leak Pattern: SUSPECTED"));
    CHECK(contains(text, "=== END REPORT ===\n"));
}

TEST_CASE("JSON report carries machine readable fields", "[report][json]")
{
    const auto json = render(makeReport({allocationPressure(), retention()}), ReportGenerator::OutputFormat::JSON);

    CHECK(json.front() == '{');
    CHECK(contains(json, "\"source\": \"gc.log\""));
    CHECK(contains(json, "\"exitCode\": 1"));
    CHECK(contains(json, "\"collector\": {\"name\": \"G1\", \"assumed\": false}"));
    CHECK(contains(json, "\"suspect\": \"allocation_pressure\""));
    CHECK(contains(json, "\"suspect\": \"retention_leak\""));
    CHECK(contains(json, "\"status\": \"SUSPECTED\""));
    CHECK(contains(json, "\"note\": \"Compare with a \\\"healthy\\\" baseline run.\""));
    CHECK(contains(json, "\"requestedMinutes\": null"));
}

TEST_CASE("Rendering is deterministic", "[report]")
{
    const auto report = makeReport({allocationPressure(), tlabUnavailable(), retention()});
    for (auto format : {ReportGenerator::OutputFormat::MARKDOWN, ReportGenerator::OutputFormat::TEXT,
                        ReportGenerator::OutputFormat::JSON})
    {
        CHECK(render(report, format) == render(report, format));
    }
}

TEST_CASE("Output format names", "[report]")
{
    CHECK(ReportGenerator::parseFormat("md") == ReportGenerator::OutputFormat::MARKDOWN);
    CHECK(ReportGenerator::parseFormat("Markdown") == ReportGenerator::OutputFormat::MARKDOWN);
    CHECK(ReportGenerator::parseFormat("txt") == ReportGenerator::OutputFormat::TEXT);
    CHECK(ReportGenerator::parseFormat("JSON") == ReportGenerator::OutputFormat::JSON);
    CHECK_FALSE(ReportGenerator::parseFormat("html").has_value());
}

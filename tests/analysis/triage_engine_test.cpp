#include <catch2/catch.hpp>

#include <stdexcept>

#include "analysis/TriageEngine.hpp"
#include "common/GcLogBuilder.hpp"
#include "core/Errors.hpp"
#include "report/ExitCode.hpp"

using GcTriage::Analysis::EngineConfig;
using GcTriage::Analysis::TriageEngine;
using GcTriage::Core::Confidence;
using GcTriage::Core::FindingStatus;
using GcTriage::Core::SuspectId;
using GcTriage::Core::TriageReport;
using GcTriage::Core::UnsupportedLogError;
using GcTriage::Input::MemoryLineSource;
using GcTriage::Report::ExitCode;
using GcTriage::Report::computeExitCode;
using GcTriage::Testing::GcLogBuilder;

namespace
{
    /// ~28 minutes of young GCs every 0.39 s while old regions climb 120 -> 330.
    GcLogBuilder leakingService()
    {
        constexpr int kPauses = 4320;
        GcLogBuilder log;
        log.collector("G1").heapGeometry(1, 1024);
        for (int i = 0; i < kPauses; ++i)
        {
            const int oldRegions = 120 + (210 * i) / (kPauses - 1);
            log.youngPause(10.0 + i * 0.39, 5.0, oldRegions);
        }
        return log;
    }

    TriageReport triage(const GcLogBuilder &log, EngineConfig config = {})
    {
        auto source = log.source();
        return TriageEngine(std::move(config)).run(source);
    }

    const GcTriage::Core::Finding *findingFor(const TriageReport &report, SuspectId id)
    {
        for (const auto &f : report.findings())
        {
            if (f.suspect() == id)
                return &f;
        }
        return nullptr;
    }
} // namespace

TEST_CASE("Fast young GCs with rising old regions", "[analysis][engine]")
{
    const auto report = triage(leakingService());

    REQUIRE(report.activeFindingCount() == 2);

    const auto *alloc = findingFor(report, SuspectId::AllocationPressure);
    REQUIRE(alloc != nullptr);
    CHECK(alloc->status() == FindingStatus::Detected);
    CHECK(alloc->confidence() == Confidence::Medium);
    CHECK(alloc->summary() == "Young GC every 0.390 s (median)");

    const auto *retention = findingFor(report, SuspectId::RetentionLeak);
    REQUIRE(retention != nullptr);
    CHECK(retention->status() == FindingStatus::Suspected);
    CHECK(retention->confidence() == Confidence::Medium);
    CHECK(retention->evidence().front().rfind("Old gen trend: +7.4", 0) == 0);

    const auto *tlab = findingFor(report, SuspectId::TlabExhaustion);
    REQUIRE(tlab != nullptr);
    CHECK(tlab->status() == FindingStatus::None);

    CHECK_FALSE(report.collectorAssumed());
    REQUIRE(report.heapOccupancyPct().has_value());
    CHECK(*report.heapOccupancyPct() == Approx(350.0 / 1024.0 * 100.0));
    CHECK(report.sourceName() == std::optional<std::string>("<memory>"));
    CHECK(computeExitCode(report, {}) == ExitCode::WARNING);
}

TEST_CASE("Repeated runs over the same input produce identical findings", "[analysis][engine]")
{
    const auto log = leakingService();
    const auto first = triage(log);
    const auto second = triage(log);
    CHECK(first.findings() == second.findings());
    CHECK(first.notes() == second.notes());
}

TEST_CASE("A tail window at least as long as the data changes nothing", "[analysis][engine]")
{
    const auto log = leakingService();
    const auto whole = triage(log);

    EngineConfig wide;
    wide.tailWindowMinutes = 120.0;
    const auto windowed = triage(log, wide);

    CHECK(windowed.window().fullSpan);
    CHECK(windowed.findings() == whole.findings());
}

TEST_CASE("A tail window restricts the analysis to the last minutes", "[analysis][engine]")
{
    EngineConfig config;
    config.tailWindowMinutes = 10.0;
    const auto report = triage(leakingService(), config);

    CHECK_FALSE(report.window().fullSpan);
    CHECK(report.window().durationSeconds() == Approx(600.0));
    REQUIRE(findingFor(report, SuspectId::RetentionLeak) != nullptr);
    REQUIRE(findingFor(report, SuspectId::AllocationPressure) != nullptr);
}

TEST_CASE("Retention fires exactly when the trend exceeds the threshold", "[analysis][engine]")
{
    const auto log = leakingService();

    EngineConfig below;
    below.thresholds.oldTrendThreshold = 7.0;
    CHECK(findingFor(triage(log, below), SuspectId::RetentionLeak) != nullptr);

    EngineConfig above;
    above.thresholds.oldTrendThreshold = 8.0;
    CHECK(findingFor(triage(log, above), SuspectId::RetentionLeak) == nullptr);
}

TEST_CASE("A Parallel collector log is critical", "[analysis][engine]")
{
    GcLogBuilder log;
    log.raw("[0.004s][info][gc] Using Parallel");
    log.raw("[1.200s][info][gc] GC(0) Pause Young (Allocation Failure) 24M->4M(96M) 3.456ms");

    const auto report = triage(log);
    const auto *wrong = findingFor(report, SuspectId::WrongCollector);
    REQUIRE(wrong != nullptr);
    CHECK(wrong->status() == FindingStatus::Detected);
    CHECK(wrong->confidence() == Confidence::High);
    CHECK(wrong->evidence().front() == "Line 1: Using Parallel");
    CHECK(computeExitCode(report, {}) == ExitCode::CRITICAL);
}

TEST_CASE("A log without an identity line notes the G1 assumption", "[analysis][engine]")
{
    GcLogBuilder log;
    log.youngPause(1.0).youngPause(11.0);

    const auto report = triage(log);
    CHECK(report.collectorAssumed());
    CHECK(report.activeFindingCount() == 0);
    CHECK(computeExitCode(report, {}) == ExitCode::OK);

    bool noted = false;
    for (const auto &note : report.notes())
        noted = noted || note == "No collector identity line found; assuming G1.";
    CHECK(noted);
}

TEST_CASE("Input without any GC event is rejected", "[analysis][engine]")
{
    TriageEngine engine{EngineConfig{}};

    SECTION("empty input")
    {
        MemoryLineSource empty(std::vector<std::string>{});
        CHECK_THROWS_AS(engine.run(empty), UnsupportedLogError);
    }

    SECTION("application log")
    {
        MemoryLineSource text({"2026-01-01 INFO Starting service", "2026-01-01 INFO Listening on :8080"});
        try
        {
            engine.run(text);
            FAIL("expected UnsupportedLogError");
        }
        catch (const UnsupportedLogError &e)
        {
            CHECK(e.linesRead() == 2);
        }
    }
}

TEST_CASE("Logs of collectors other than G1 and the legacy ones are rejected", "[analysis][engine]")
{
    TriageEngine engine{EngineConfig{}};

    for (const std::string name : {"The Z Garbage Collector", "Shenandoah", "Epsilon", "Concurrent Mark Sweep"})
    {
        GcLogBuilder log;
        log.collector(name);
        log.raw("[1.500s][info][gc] GC(0) Garbage Collection (Warmup) 208M(10%)->46M(2%)");
        log.raw("[2.900s][info][gc] GC(1) Garbage Collection (Allocation Rate) 412M(20%)->64M(3%)");

        auto source = log.source();
        try
        {
            engine.run(source);
            FAIL("expected UnsupportedLogError for " << name);
        }
        catch (const UnsupportedLogError &e)
        {
            CHECK(std::string(e.what()).rfind("not a supported G1 log", 0) == 0);
            CHECK(e.linesRead() == 3);
        }
    }
}

TEST_CASE("A G1 log without any pause is rejected", "[analysis][engine]")
{
    GcLogBuilder log;
    log.collector("G1").heapGeometry(1, 1024);
    log.raw("[5.000s][info][safepoint] Total time for which application threads were stopped: 0.0010 seconds, "
            "Stopping threads took: 0.0001 seconds");

    auto source = log.source();
    CHECK_THROWS_AS(TriageEngine(EngineConfig{}).run(source), UnsupportedLogError);
}

TEST_CASE("A legacy collector identity alone still reports the wrong collector", "[analysis][engine]")
{
    GcLogBuilder log;
    log.collector("Serial");

    const auto report = triage(log);
    const auto *wrong = findingFor(report, SuspectId::WrongCollector);
    REQUIRE(wrong != nullptr);
    CHECK(wrong->summary() == "Collector is Serial, not G1");
    CHECK(computeExitCode(report, {}) == ExitCode::CRITICAL);
}

TEST_CASE("Invalid engine configuration is refused at construction", "[analysis][engine]")
{
    EngineConfig zeroWindow;
    zeroWindow.tailWindowMinutes = 0.0;
    CHECK_THROWS_AS(TriageEngine(zeroWindow), std::invalid_argument);

    EngineConfig negativeThreshold;
    negativeThreshold.thresholds.longPauseMs = -1.0;
    CHECK_THROWS_AS(TriageEngine(negativeThreshold), std::invalid_argument);
}

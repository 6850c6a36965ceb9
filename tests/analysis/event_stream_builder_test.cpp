#include <catch2/catch.hpp>

#include "analysis/EventStreamBuilder.hpp"
#include "common/GcLogBuilder.hpp"

using GcTriage::Analysis::EventStream;
using GcTriage::Analysis::EventStreamBuilder;
using GcTriage::Core::EventCategory;
using GcTriage::Core::GcPause;
using GcTriage::Core::HumongousAllocation;
using GcTriage::Core::MetaspaceSample;
using GcTriage::Core::countOf;
using GcTriage::Testing::GcLogBuilder;
using GcTriage::Testing::PauseShape;

namespace
{
    EventStream buildFrom(const GcLogBuilder &log, std::optional<double> windowMinutes = std::nullopt)
    {
        auto source = log.source();
        EventStreamBuilder builder(windowMinutes);
        return builder.build(source);
    }
} // namespace

TEST_CASE("Region and metaspace snapshots are attached to their pause", "[analysis][stream]")
{
    GcLogBuilder log;
    PauseShape shape;
    shape.oldBefore = 100;
    shape.oldAfter = 104;
    shape.humongousBefore = 6;
    shape.humongousAfter = 2;
    shape.metaspaceMb = std::make_pair(20.0, 21.5);
    shape.cause = "Metadata GC Threshold";
    log.collector("G1").pause(10.0, shape);

    const auto stream = buildFrom(log);

    REQUIRE(countOf(stream.windowCounts, EventCategory::YoungGC) == 1);
    const auto &pauseEvent = stream.events.front();
    REQUIRE(pauseEvent.category == EventCategory::YoungGC);
    const auto &gc = pauseEvent.get<GcPause>();
    REQUIRE(gc.oldRegionsAfter.has_value());
    CHECK(*gc.oldRegionsAfter == 104);
    CHECK(*gc.humongousRegionsBefore == 6);

    // Humongous regions rose from 0 to 6 since the previous GC.
    REQUIRE(countOf(stream.windowCounts, EventCategory::HumongousAlloc) == 1);
    REQUIRE(countOf(stream.windowCounts, EventCategory::MetaspaceSample) == 1);
    for (const auto &e : stream.events)
    {
        if (const auto *h = e.tryGet<HumongousAllocation>())
        {
            CHECK(h->newRegions == 6);
            CHECK_FALSE(h->triggeredPause);
        }
        if (const auto *m = e.tryGet<MetaspaceSample>())
        {
            CHECK(m->usedAfterMb == Approx(21.5));
            CHECK(m->metadataThresholdTriggered);
            CHECK(e.uptimeSeconds == Approx(10.0));
        }
    }

    CHECK(stream.runScoped.size() == 1);
    CHECK(stream.summary.droppedSnapshots == 0);
}

TEST_CASE("Evacuation failure tag and humongous cause derive marker events", "[analysis][stream]")
{
    GcLogBuilder log;
    PauseShape failed;
    failed.evacuationFailure = true;
    PauseShape humongous;
    humongous.cause = "G1 Humongous Allocation";
    log.pause(1.0, failed).pause(2.0, humongous);

    const auto stream = buildFrom(log);
    CHECK(countOf(stream.windowCounts, EventCategory::EvacFailure) == 1);
    CHECK(countOf(stream.windowCounts, EventCategory::HumongousAlloc) == 1);
}

TEST_CASE("Snapshots of a GC that never completes are dropped and counted", "[analysis][stream]")
{
    GcLogBuilder log;
    log.youngPause(1.0);
    log.raw("[2.000s][info][gc,heap] GC(99) Old regions: 10->12");

    const auto stream = buildFrom(log);
    CHECK(stream.summary.droppedSnapshots == 1);
    CHECK(countOf(stream.windowCounts, EventCategory::YoungGC) == 1);
    CHECK_FALSE(stream.notes.empty());
}

TEST_CASE("Trailing window keeps only the last minutes of uptime", "[analysis][stream]")
{
    GcLogBuilder log;
    log.collector("G1");
    for (int i = 1; i <= 600; ++i)
        log.youngPause(static_cast<double>(i));   // one pause per second for 10 minutes

    const auto stream = buildFrom(log, 2.0);

    CHECK_FALSE(stream.window.fullSpan);
    CHECK(stream.window.endUptime == Approx(600.0));
    CHECK(stream.window.startUptime == Approx(480.0));
    CHECK(stream.window.durationSeconds() == Approx(120.0));
    CHECK(countOf(stream.windowCounts, EventCategory::YoungGC) == 121);
    CHECK(countOf(stream.summary.totals, EventCategory::YoungGC) == 600);

    // Run-scoped facts survive eviction.
    CHECK(countOf(stream.windowCounts, EventCategory::CollectorIdentity) == 1);
    for (const auto &e : stream.events)
        CHECK(e.uptimeSeconds >= 480.0);
}

TEST_CASE("A window wider than the data falls back to the full span", "[analysis][stream]")
{
    GcLogBuilder log;
    for (int i = 1; i <= 30; ++i)
        log.youngPause(i * 2.0);

    const auto whole = buildFrom(log);
    const auto wide = buildFrom(log, 60.0);

    CHECK(wide.window.fullSpan);
    CHECK(wide.window.startUptime == Approx(whole.window.startUptime));
    CHECK(wide.window.endUptime == Approx(whole.window.endUptime));
    CHECK(wide.events.size() == whole.events.size());
    REQUIRE(wide.notes.size() == 1);
    CHECK(wide.notes.front().find("covers the whole log") != std::string::npos);
}

TEST_CASE("Uptime restart starts a new segment on a monotone timeline", "[analysis][stream]")
{
    GcLogBuilder log;
    log.youngPause(100.0).youngPause(200.0);
    log.raw("[0.005s][info][gc,init] Using G1");
    log.raw("[5.000s][info][gc] GC(0) Pause Young (Normal) (G1 Evacuation Pause) 40M->10M(1024M) 3.000ms");

    const auto stream = buildFrom(log);

    CHECK(stream.summary.segments == 2);
    REQUIRE(stream.events.size() == 3);
    CHECK(stream.events[2].segment == 1);
    CHECK(stream.events[2].uptimeSeconds > stream.events[1].uptimeSeconds);
    CHECK(stream.events[2].uptimeSeconds == Approx(200.0 + 5.0 - 0.005));
}

TEST_CASE("Malformed lines are counted and skipped", "[analysis][stream]")
{
    GcLogBuilder log;
    log.youngPause(1.0);
    log.raw("[1.500s][info][gc] GC(7) Pause Young (Normal) (G1 Evacuation Pause) 40M->");
    log.raw("[info][gc] no uptime here");
    log.youngPause(2.0);

    const auto stream = buildFrom(log);
    CHECK(stream.summary.linesRead == 4);
    CHECK(stream.summary.linesClassified == 2);
    CHECK(stream.summary.malformedLines == 2);
}

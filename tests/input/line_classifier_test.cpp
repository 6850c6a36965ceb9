#include <catch2/catch.hpp>

#include <variant>

#include "input/LineClassifier.hpp"

using GcTriage::Core::CollectorFamily;
using GcTriage::Core::CollectorIdentity;
using GcTriage::Core::HeapGeometry;
using GcTriage::Core::PauseKind;
using GcTriage::Core::PauseRecord;
using GcTriage::Core::SafepointStats;
using GcTriage::Core::TlabTotals;
using GcTriage::Input::EvacFailureRecord;
using GcTriage::Input::LineClassifier;
using GcTriage::Input::MetaspaceRecord;
using GcTriage::Input::RegionKind;
using GcTriage::Input::RegionRecord;

namespace
{
    template <typename T>
    T classifyAs(const LineClassifier &classifier, const std::string &line)
    {
        auto result = classifier.classifyDetailed(line, 1);
        REQUIRE_FALSE(result.malformed);
        REQUIRE(result.line.has_value());
        REQUIRE(std::holds_alternative<T>(result.line->record));
        return std::get<T>(result.line->record);
    }
} // namespace

TEST_CASE("Young pause completion line yields sizes, cause and elapsed time", "[input][classifier]")
{
    LineClassifier classifier;
    const auto result = classifier.classifyDetailed(
        "[22.113s][info][gc] GC(12) Pause Young (Normal) (G1 Evacuation Pause) 22M->19M(256M) 8.657ms", 7);

    REQUIRE(result.line.has_value());
    CHECK(result.line->uptimeSeconds == Approx(22.113));
    CHECK(result.line->lineNumber == 7);

    const auto &pause = std::get<PauseRecord>(result.line->record);
    CHECK(pause.gcId == 12);
    CHECK(pause.kind == PauseKind::Young);
    CHECK(pause.phase == "Normal");
    CHECK(pause.cause == "G1 Evacuation Pause");
    CHECK_FALSE(pause.evacuationFailure);
    CHECK(pause.heapBeforeMb == Approx(22.0));
    CHECK(pause.heapAfterMb == Approx(19.0));
    CHECK(pause.heapTotalMb == Approx(256.0));
    CHECK(pause.pauseMs == Approx(8.657));
}

TEST_CASE("Pause kinds are told apart by head and phase tag", "[input][classifier]")
{
    LineClassifier classifier;

    SECTION("Mixed phase")
    {
        auto p = classifyAs<PauseRecord>(classifier,
            "[90.000s][info][gc] GC(40) Pause Young (Mixed) (G1 Evacuation Pause) 700M->420M(1024M) 31.2ms");
        CHECK(p.kind == PauseKind::Mixed);
    }

    SECTION("Full collection with nested parentheses in the cause")
    {
        auto p = classifyAs<PauseRecord>(classifier,
            "[91.500s][info][gc] GC(41) Pause Full (System.gc()) 600M->210M(1024M) 812.004ms");
        CHECK(p.kind == PauseKind::Full);
        CHECK(p.cause == "System.gc()");
        CHECK(p.pauseMs == Approx(812.004));
    }

    SECTION("Remark and Cleanup")
    {
        CHECK(classifyAs<PauseRecord>(classifier, "[5.0s][info][gc] GC(3) Pause Remark 50M->50M(256M) 1.1ms").kind ==
              PauseKind::Remark);
        CHECK(classifyAs<PauseRecord>(classifier, "[5.1s][info][gc] GC(3) Pause Cleanup 50M->50M(256M) 0.2ms").kind ==
              PauseKind::Cleanup);
    }

    SECTION("Young with evacuation failure")
    {
        auto p = classifyAs<PauseRecord>(classifier,
            "[120.0s][info][gc] GC(77) Pause Young (Normal) (G1 Evacuation Pause) (Evacuation Failure) "
            "1010M->1000M(1024M) 250.5ms");
        CHECK(p.kind == PauseKind::Young);
        CHECK(p.evacuationFailure);
    }

    SECTION("Gigabyte units are converted to megabytes")
    {
        auto p = classifyAs<PauseRecord>(classifier,
            "[1.0s][info][gc] GC(1) Pause Young (Normal) (G1 Evacuation Pause) 2G->1G(4G) 10.0ms");
        CHECK(p.heapBeforeMb == Approx(2048.0));
        CHECK(p.heapTotalMb == Approx(4096.0));
    }
}

TEST_CASE("Pause start lines are ignored, truncated completions are malformed", "[input][classifier]")
{
    LineClassifier classifier;

    auto start = classifier.classifyDetailed("[22.100s][info][gc,start] GC(12) Pause Young (Normal) (G1 Evacuation Pause)", 1);
    CHECK_FALSE(start.line.has_value());
    CHECK_FALSE(start.malformed);

    auto truncated = classifier.classifyDetailed("[22.113s][info][gc] GC(12) Pause Young (Normal) (G1 Evacuation Pause) 22M->", 2);
    CHECK_FALSE(truncated.line.has_value());
    CHECK(truncated.malformed);
    CHECK_FALSE(truncated.error.empty());
}

TEST_CASE("Uptime decoration is required on decorated lines", "[input][classifier]")
{
    LineClassifier classifier;

    SECTION("millisecond uptime decoration")
    {
        auto r = classifier.classifyDetailed("[22113ms][info][gc] GC(2) Pause Young (Normal) (G1 Evacuation Pause) 8M->2M(64M) 1.0ms", 1);
        REQUIRE(r.line.has_value());
        CHECK(r.line->uptimeSeconds == Approx(22.113));
    }

    SECTION("epoch millisecond decoration is skipped in favour of uptime")
    {
        auto r = classifier.classifyDetailed("[1707000000000ms][22113ms][info][gc] GC(2) Pause Young (Normal) (G1 Evacuation Pause) 8M->2M(64M) 1.0ms", 1);
        REQUIRE(r.line.has_value());
        CHECK(r.line->uptimeSeconds == Approx(22.113));
    }

    SECTION("epoch-only decoration is malformed")
    {
        auto r = classifier.classifyDetailed("[1707000000000ms][info][gc] GC(2) Pause Young (Normal) (G1 Evacuation Pause) 8M->2M(64M) 1.0ms", 1);
        CHECK_FALSE(r.line.has_value());
        CHECK(r.malformed);
    }

    SECTION("wall-clock only decoration is malformed")
    {
        auto r = classifier.classifyDetailed("[2026-02-05T05:43:52.074+0200][info][gc] GC(2) Pause Young (Normal) 8M->2M(64M) 1.0ms", 1);
        CHECK_FALSE(r.line.has_value());
        CHECK(r.malformed);
    }

    SECTION("free text is unclassified, not malformed")
    {
        auto r = classifier.classifyDetailed("java.lang.OutOfMemoryError: Java heap space", 1);
        CHECK_FALSE(r.line.has_value());
        CHECK_FALSE(r.malformed);
    }
}

TEST_CASE("Region snapshot lines carry GC id and before/after counts", "[input][classifier]")
{
    LineClassifier classifier;

    auto old = classifyAs<RegionRecord>(classifier, "[30.5s][info][gc,heap] GC(10) Old regions: 214->227");
    CHECK(old.gcId == 10);
    CHECK(old.kind == RegionKind::Old);
    CHECK(old.before == 214);
    CHECK(old.after == 227);

    auto humongous = classifyAs<RegionRecord>(classifier, "[30.5s][info][gc,heap] GC(10) Humongous regions: 12->3");
    CHECK(humongous.kind == RegionKind::Humongous);
    CHECK(humongous.before == 12);

    CHECK_FALSE(classifier.classifyDetailed("[30.5s][info][gc,heap] GC(10) Archive regions: 2->2", 1).line.has_value());
}

TEST_CASE("Metaspace lines of JDK 17 and JDK 11 are both recognized", "[input][classifier]")
{
    LineClassifier classifier;

    auto jdk17 = classifyAs<MetaspaceRecord>(classifier,
        "[3.2s][info][gc,metaspace] GC(3) Metaspace: 20480K(20736K)->20608K(20864K) NonClass: 18M(18M)->18M(18M) Class: 2M(2M)->2M(2M)");
    REQUIRE(jdk17.gcId.has_value());
    CHECK(*jdk17.gcId == 3);
    CHECK(jdk17.usedBeforeMb == Approx(20.0));
    CHECK(jdk17.usedAfterMb == Approx(20.125));
    REQUIRE(jdk17.committedMb.has_value());
    CHECK(*jdk17.committedMb == Approx(20.375));

    auto jdk11 = classifyAs<MetaspaceRecord>(classifier,
        "[3.2s][info][gc,metaspace] GC(3) Metaspace: 20480K->20480K(1067008K)");
    CHECK(jdk11.usedAfterMb == Approx(20.0));
    CHECK_FALSE(jdk11.committedMb.has_value());
}

TEST_CASE("TLAB debug totals line yields slow allocation count", "[input][classifier]")
{
    LineClassifier classifier;
    auto tlab = classifyAs<TlabTotals>(classifier,
        "[4.0s][debug][gc,tlab] GC(5) TLAB totals: thrds: 12  refills: 340 max: 60 slow allocs: 17 max 4 waste:  2.5% "
        "gc: 1024B max: 512B slow: 0B max: 0B");
    CHECK(tlab.threads == 12);
    CHECK(tlab.refills == 340);
    CHECK(tlab.slowAllocs == 17);
    REQUIRE(tlab.wastePct.has_value());
    CHECK(*tlab.wastePct == Approx(2.5));
}

TEST_CASE("Collector identity and heap geometry lines", "[input][classifier]")
{
    LineClassifier classifier;

    auto g1 = classifyAs<CollectorIdentity>(classifier, "[0.005s][info][gc,init] Using G1");
    CHECK(g1.family == CollectorFamily::G1);

    auto parallel = classifyAs<CollectorIdentity>(classifier, "[0.004s][info][gc] Using Parallel");
    CHECK(parallel.family == CollectorFamily::Parallel);
    CHECK(parallel.name == "Parallel");

    auto z = classifyAs<CollectorIdentity>(classifier, "[0.004s][info][gc] Using The Z Garbage Collector");
    CHECK(z.family == CollectorFamily::Z);

    auto region = classifyAs<HeapGeometry>(classifier, "[0.006s][info][gc,init] Heap Region Size: 2M");
    REQUIRE(region.regionSizeMb.has_value());
    CHECK(*region.regionSizeMb == Approx(2.0));

    auto capacity = classifyAs<HeapGeometry>(classifier, "[0.006s][info][gc,init] Heap Max Capacity: 4G");
    REQUIRE(capacity.maxCapacityMb.has_value());
    CHECK(*capacity.maxCapacityMb == Approx(4096.0));
}

TEST_CASE("Safepoint lines of both JDK generations", "[input][classifier]")
{
    LineClassifier classifier;

    auto jdk17 = classifyAs<SafepointStats>(classifier,
        "[8.0s][info][safepoint] Safepoint \"G1CollectForAllocation\", Time since last: 1203 ns, "
        "Reaching safepoint: 2000000 ns, At safepoint: 1000000 ns, Total: 3000000 ns");
    CHECK(jdk17.operation == "G1CollectForAllocation");
    CHECK(jdk17.reachingMs == Approx(2.0));
    CHECK(jdk17.totalMs == Approx(3.0));

    auto jdk11 = classifyAs<SafepointStats>(classifier,
        "[8.0s][info][safepoint] Total time for which application threads were stopped: 0.0123 seconds, "
        "Stopping threads took: 0.0004 seconds");
    CHECK(jdk11.totalMs == Approx(12.3));
    CHECK(jdk11.reachingMs == Approx(0.4));
}

TEST_CASE("To-space exhausted marker is an evacuation failure", "[input][classifier]")
{
    LineClassifier classifier;
    auto failure = classifyAs<EvacFailureRecord>(classifier, "[50.0s][info][gc] GC(1074) To-space exhausted");
    REQUIRE(failure.gcId.has_value());
    CHECK(*failure.gcId == 1074);
}

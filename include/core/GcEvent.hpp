// Core data model for GC events extracted from a unified-logging file.
//
// The line classifier produces typed records, the event stream builder
// turns them into Events, and the metric aggregator consumes Events.

#ifndef GCTRIAGE_CORE_GCEVENT_HPP
#define GCTRIAGE_CORE_GCEVENT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace GcTriage
{
namespace Core
{

/**
 * @brief Event category. The order is the order used in reports.
 */
enum class EventCategory : std::uint8_t
{
    YoungGC = 0,        ///< Young (Normal / Concurrent Start / Prepare Mixed) pause.
    MixedGC,            ///< Young (Mixed) pause.
    FullGC,             ///< Pause Full.
    ConcurrentPause,    ///< Remark and Cleanup pauses of the concurrent cycle.
    HumongousAlloc,     ///< Humongous allocation marker.
    EvacFailure,        ///< Evacuation failure / to-space exhausted.
    MetaspaceSample,    ///< Metaspace used/committed after a GC.
    TLABSample,         ///< TLAB totals (gc+tlab=debug only).
    CollectorIdentity,  ///< "Using G1" style startup line.
    SafepointMarker,    ///< Safepoint statistics line.
    HeapGeometry,       ///< Region size / max capacity from gc,init.
};

inline constexpr std::size_t kEventCategoryCount = 11;

inline constexpr const char *toString(EventCategory category) noexcept
{
    switch (category)
    {
    case EventCategory::YoungGC:           return "YoungGC";
    case EventCategory::MixedGC:           return "MixedGC";
    case EventCategory::FullGC:            return "FullGC";
    case EventCategory::ConcurrentPause:   return "ConcurrentPause";
    case EventCategory::HumongousAlloc:    return "HumongousAlloc";
    case EventCategory::EvacFailure:       return "EvacFailure";
    case EventCategory::MetaspaceSample:   return "MetaspaceSample";
    case EventCategory::TLABSample:        return "TLABSample";
    case EventCategory::CollectorIdentity: return "CollectorIdentity";
    case EventCategory::SafepointMarker:   return "SafepointMarker";
    case EventCategory::HeapGeometry:      return "HeapGeometry";
    }
    return "Unknown";
}

/// Run-scoped categories describe the JVM, not a point in time; windowing never drops them.
inline constexpr bool isRunScoped(EventCategory category) noexcept
{
    return category == EventCategory::CollectorIdentity ||
           category == EventCategory::HeapGeometry;
}

/// Pause categories: every event that carries a stop-the-world pause_ms.
inline constexpr bool isPause(EventCategory category) noexcept
{
    return category == EventCategory::YoungGC ||
           category == EventCategory::MixedGC ||
           category == EventCategory::FullGC ||
           category == EventCategory::ConcurrentPause;
}

/**
 * @brief Pause type as printed after "Pause ".
 */
enum class PauseKind : std::uint8_t
{
    Young = 0,
    Mixed,
    Full,
    Remark,
    Cleanup,
};

inline constexpr const char *toString(PauseKind kind) noexcept
{
    switch (kind)
    {
    case PauseKind::Young:   return "Young";
    case PauseKind::Mixed:   return "Mixed";
    case PauseKind::Full:    return "Full";
    case PauseKind::Remark:  return "Remark";
    case PauseKind::Cleanup: return "Cleanup";
    }
    return "Unknown";
}

inline constexpr EventCategory categoryOf(PauseKind kind) noexcept
{
    switch (kind)
    {
    case PauseKind::Young:   return EventCategory::YoungGC;
    case PauseKind::Mixed:   return EventCategory::MixedGC;
    case PauseKind::Full:    return EventCategory::FullGC;
    case PauseKind::Remark:
    case PauseKind::Cleanup: return EventCategory::ConcurrentPause;
    }
    return EventCategory::YoungGC;
}

/**
 * @brief Collector families that can appear in the "Using ..." line.
 */
enum class CollectorFamily : std::uint8_t
{
    G1 = 0,
    Parallel,
    Serial,
    Z,
    Shenandoah,
    ConcurrentMarkSweep,
    Epsilon,
};

inline constexpr const char *toString(CollectorFamily family) noexcept
{
    switch (family)
    {
    case CollectorFamily::G1:                  return "G1";
    case CollectorFamily::Parallel:            return "Parallel";
    case CollectorFamily::Serial:              return "Serial";
    case CollectorFamily::Z:                   return "ZGC";
    case CollectorFamily::Shenandoah:          return "Shenandoah";
    case CollectorFamily::ConcurrentMarkSweep: return "CMS";
    case CollectorFamily::Epsilon:             return "Epsilon";
    }
    return "Unknown";
}

/// Serial and Parallel are the legacy stop-the-world families.
inline constexpr bool isLegacyCollector(CollectorFamily family) noexcept
{
    return family == CollectorFamily::Serial || family == CollectorFamily::Parallel;
}

// ---------------------------------------------------------------------------
// Payloads shared by classified lines and events
// ---------------------------------------------------------------------------

/**
 * @brief Fields of one pause completion line, e.g.
 *   GC(12) Pause Young (Normal) (G1 Evacuation Pause) 22M->19M(256M) 8.657ms
 */
struct PauseRecord
{
    std::int64_t gcId = -1;
    PauseKind kind = PauseKind::Young;
    std::string phase;                ///< "Normal", "Concurrent Start", "Mixed"... (may be empty)
    std::string cause;                ///< "G1 Evacuation Pause", "Metadata GC Threshold"... (may be empty)
    bool evacuationFailure = false;   ///< "(Evacuation Failure)" tag present
    double heapBeforeMb = 0.0;
    double heapAfterMb = 0.0;
    double heapTotalMb = 0.0;
    double pauseMs = 0.0;
};

struct TlabTotals
{
    std::uint64_t threads = 0;
    std::uint64_t refills = 0;
    std::uint64_t slowAllocs = 0;
    std::optional<double> wastePct;
};

struct CollectorIdentity
{
    CollectorFamily family = CollectorFamily::G1;
    std::string name;                 ///< Text as logged, e.g. "G1", "The Z Garbage Collector".
};

struct SafepointStats
{
    std::string operation;            ///< VM operation name (empty for the JDK 11 form).
    double reachingMs = 0.0;          ///< Time to reach the safepoint.
    double totalMs = 0.0;             ///< Total time application threads were stopped.
};

struct HeapGeometry
{
    std::optional<double> regionSizeMb;
    std::optional<double> maxCapacityMb;
};

// ---------------------------------------------------------------------------
// Event payloads
// ---------------------------------------------------------------------------

/**
 * @brief A completed pause plus the region snapshots logged for the same GC id.
 */
struct GcPause
{
    PauseRecord pause;
    std::optional<std::int64_t> oldRegionsBefore;
    std::optional<std::int64_t> oldRegionsAfter;
    std::optional<std::int64_t> humongousRegionsBefore;
    std::optional<std::int64_t> humongousRegionsAfter;
};

struct HumongousAllocation
{
    std::int64_t gcId = -1;
    std::int64_t newRegions = 0;      ///< Regions allocated since the previous GC (0 if unknown).
    std::int64_t liveRegions = 0;     ///< Humongous regions live at the start of this GC.
    bool triggeredPause = false;      ///< Pause cause was "G1 Humongous Allocation".
};

struct EvacuationFailure
{
    std::int64_t gcId = -1;
};

struct MetaspaceSample
{
    std::optional<std::int64_t> gcId;
    double usedBeforeMb = 0.0;
    double usedAfterMb = 0.0;
    std::optional<double> committedMb;
    bool metadataThresholdTriggered = false;
};

using EventPayload = std::variant<GcPause,
                                  HumongousAllocation,
                                  EvacuationFailure,
                                  MetaspaceSample,
                                  TlabTotals,
                                  CollectorIdentity,
                                  SafepointStats,
                                  HeapGeometry>;

/**
 * @brief One event of the analysis stream.
 *
 * Design notes:
 *  - Tagged union: the category names the payload alternative, so consumers
 *    switch on category and read the payload with get().
 *  - uptimeSeconds is canonical (segment offsets applied), so it is
 *    non-decreasing over the whole stream.
 */
struct Event
{
    double uptimeSeconds = 0.0;
    std::size_t lineNumber = 0;
    std::size_t segment = 0;          ///< 0-based JVM run index within the file.
    EventCategory category = EventCategory::YoungGC;
    EventPayload payload;

    template <typename T>
    const T &get() const
    {
        return std::get<T>(payload);
    }

    template <typename T>
    const T *tryGet() const noexcept
    {
        return std::get_if<T>(&payload);
    }
};

using EventList = std::vector<Event>;

} // namespace Core
} // namespace GcTriage

#endif // GCTRIAGE_CORE_GCEVENT_HPP

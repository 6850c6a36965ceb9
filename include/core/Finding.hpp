// Core data model for one triage verdict ("finding") on a known GC
// failure pattern ("suspect"). Produced by the suspect detectors and
// consumed by the report generator and the exit-code mapper.

#ifndef GCTRIAGE_CORE_FINDING_HPP
#define GCTRIAGE_CORE_FINDING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace GcTriage
{
namespace Core
{

/**
 * @brief Catalog of suspects. The enum order is the report order.
 */
enum class SuspectId : std::uint8_t
{
    AllocationPressure = 0,
    HumongousPressure,
    LongStwPauses,
    GcStarvation,
    MetaspaceLeak,
    TlabExhaustion,
    WrongCollector,
    RetentionLeak,
};

inline constexpr const char *toString(SuspectId id) noexcept
{
    switch (id)
    {
    case SuspectId::AllocationPressure: return "Allocation Pressure";
    case SuspectId::HumongousPressure:  return "Humongous Allocation Pressure";
    case SuspectId::LongStwPauses:      return "Long STW Pauses";
    case SuspectId::GcStarvation:       return "GC Starvation / Finalizer Backlog";
    case SuspectId::MetaspaceLeak:      return "Metaspace Leak";
    case SuspectId::TlabExhaustion:     return "TLAB Exhaustion";
    case SuspectId::WrongCollector:     return "Wrong Collector Choice";
    case SuspectId::RetentionLeak:      return "Retention / Leak Pattern";
    }
    return "Unknown";
}

/// Stable machine-readable identifier, used in JSON output.
inline constexpr const char *toSlug(SuspectId id) noexcept
{
    switch (id)
    {
    case SuspectId::AllocationPressure: return "allocation_pressure";
    case SuspectId::HumongousPressure:  return "humongous_pressure";
    case SuspectId::LongStwPauses:      return "long_stw_pauses";
    case SuspectId::GcStarvation:       return "gc_starvation";
    case SuspectId::MetaspaceLeak:      return "metaspace_leak";
    case SuspectId::TlabExhaustion:     return "tlab_exhaustion";
    case SuspectId::WrongCollector:     return "wrong_collector";
    case SuspectId::RetentionLeak:      return "retention_leak";
    }
    return "unknown";
}

/**
 * @brief Verdict of a finding.
 *
 * SUSPECTED is only ever produced by the retention detector. NONE only
 * appears for the explicit "TLAB data unavailable" finding.
 */
enum class FindingStatus : std::uint8_t
{
    None = 0,
    Suspected,
    Detected,
};

inline constexpr const char *toString(FindingStatus status) noexcept
{
    switch (status)
    {
    case FindingStatus::None:      return "NONE";
    case FindingStatus::Suspected: return "SUSPECTED";
    case FindingStatus::Detected:  return "DETECTED";
    }
    return "UNKNOWN";
}

enum class Confidence : std::uint8_t
{
    Low = 0,
    Medium,
    High,
};

inline constexpr const char *toString(Confidence confidence) noexcept
{
    switch (confidence)
    {
    case Confidence::Low:    return "low";
    case Confidence::Medium: return "medium";
    case Confidence::High:   return "high";
    }
    return "unknown";
}

/// One step down, saturating at Low. Used when a metric rests on sparse data.
inline constexpr Confidence lowered(Confidence confidence) noexcept
{
    return confidence == Confidence::High ? Confidence::Medium : Confidence::Low;
}

/**
 * @brief Core finding representation.
 *
 * Responsibilities:
 *  - Carry the verdict, confidence and literal evidence of one detector.
 *  - Provide the recommended next low-effort diagnostic steps.
 *
 * Design notes:
 *  - Immutable value type: all fields are fixed at construction.
 *  - heapOccupancyPct is attached by heap-related detectors so the
 *    severity mapper can apply the critical occupancy rule per finding.
 */
class Finding
{
public:
    Finding(SuspectId suspect,
            FindingStatus status,
            Confidence confidence,
            std::string summary,
            std::vector<std::string> evidence,
            std::vector<std::string> nextSteps,
            std::string note = {},
            std::optional<double> heapOccupancyPct = std::nullopt)
        : m_suspect(suspect),
          m_status(status),
          m_confidence(confidence),
          m_summary(std::move(summary)),
          m_evidence(std::move(evidence)),
          m_nextSteps(std::move(nextSteps)),
          m_note(std::move(note)),
          m_heapOccupancyPct(heapOccupancyPct)
    {
    }

    SuspectId suspect() const noexcept { return m_suspect; }
    FindingStatus status() const noexcept { return m_status; }
    Confidence confidence() const noexcept { return m_confidence; }

    /// One-line human readable verdict with the headline figure.
    const std::string &summary() const noexcept { return m_summary; }

    /// Literal figures supporting the verdict, in a stable order.
    const std::vector<std::string> &evidence() const noexcept { return m_evidence; }

    const std::vector<std::string> &nextSteps() const noexcept { return m_nextSteps; }

    /// Optional interpretation caveat (empty when none).
    const std::string &note() const noexcept { return m_note; }

    const std::optional<double> &heapOccupancyPct() const noexcept { return m_heapOccupancyPct; }

    /// True for DETECTED and SUSPECTED.
    bool isActive() const noexcept { return m_status != FindingStatus::None; }

    bool operator==(const Finding &other) const
    {
        return m_suspect == other.m_suspect &&
               m_status == other.m_status &&
               m_confidence == other.m_confidence &&
               m_summary == other.m_summary &&
               m_evidence == other.m_evidence &&
               m_nextSteps == other.m_nextSteps &&
               m_note == other.m_note &&
               m_heapOccupancyPct == other.m_heapOccupancyPct;
    }

    bool operator!=(const Finding &other) const { return !(*this == other); }

private:
    SuspectId m_suspect;
    FindingStatus m_status;
    Confidence m_confidence;
    std::string m_summary;
    std::vector<std::string> m_evidence;
    std::vector<std::string> m_nextSteps;
    std::string m_note;
    std::optional<double> m_heapOccupancyPct;
};

using FindingSet = std::vector<Finding>;

} // namespace Core
} // namespace GcTriage

#endif // GCTRIAGE_CORE_FINDING_HPP

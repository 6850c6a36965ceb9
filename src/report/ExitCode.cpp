#include "report/ExitCode.hpp"

namespace GcTriage
{
namespace Report
{
    const char *toString(SuspectSeverity severity) noexcept
    {
        switch (severity)
        {
            case SuspectSeverity::OK:       return "OK";
            case SuspectSeverity::WARNING:  return "WARNING";
            case SuspectSeverity::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    SuspectSeverity computeSuspectSeverity(const Core::Finding &finding, double criticalHeapPct) noexcept
    {
        if (!finding.isActive())
            return SuspectSeverity::OK;

        switch (finding.suspect())
        {
            case Core::SuspectId::WrongCollector:
                return SuspectSeverity::CRITICAL;
            case Core::SuspectId::RetentionLeak:
            case Core::SuspectId::AllocationPressure:
                if (finding.confidence() == Core::Confidence::High)
                    return SuspectSeverity::CRITICAL;
                break;
            default:
                break;
        }

        const auto &occupancy = finding.heapOccupancyPct();
        if (occupancy && *occupancy > criticalHeapPct)
            return SuspectSeverity::CRITICAL;

        return SuspectSeverity::WARNING;
    }

    ExitCode computeExitCode(const Core::TriageReport &report,
                             const Anomaly::ThresholdConfig &thresholds) noexcept
    {
        if (report.activeFindingCount() == 0)
            return ExitCode::OK;

        for (const auto &finding : report.findings())
        {
            if (computeSuspectSeverity(finding, thresholds.criticalHeapPct) == SuspectSeverity::CRITICAL)
                return ExitCode::CRITICAL;
        }

        const auto &occupancy = report.heapOccupancyPct();
        if (occupancy && *occupancy > thresholds.criticalHeapPct)
            return ExitCode::CRITICAL;

        return ExitCode::WARNING;
    }

} // namespace Report
} // namespace GcTriage

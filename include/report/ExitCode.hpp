#pragma once

#include "anomaly/ThresholdConfig.hpp"
#include "core/Finding.hpp"
#include "core/Report.hpp"

namespace GcTriage
{
    namespace Report
    {
        /// Process exit codes of the gctriage CLI.
        enum class ExitCode : int
        {
            OK = 0,          // no DETECTED or SUSPECTED finding
            WARNING = 1,     // findings, none critical
            CRITICAL = 2,    // at least one critical condition
            ERROR = 3        // usage, I/O or unsupported log
        };

        enum class SuspectSeverity
        {
            OK,
            WARNING,
            CRITICAL
        };

        const char *toString(SuspectSeverity severity) noexcept;

        /**
         * Severity of one finding.
         *
         * CRITICAL when the finding is a legacy collector, a high-confidence
         * retention or allocation-pressure finding, or carries a heap
         * occupancy above critical_heap_pct. NONE findings are OK.
         */
        SuspectSeverity computeSuspectSeverity(const Core::Finding &finding, double criticalHeapPct) noexcept;

        /**
         * Map a finished report to the process exit code (0, 1 or 2).
         * Pure function of the finding set and the report's heap occupancy.
         */
        ExitCode computeExitCode(const Core::TriageReport &report,
                                 const Anomaly::ThresholdConfig &thresholds) noexcept;

    } // namespace Report
} // namespace GcTriage

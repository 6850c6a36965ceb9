#pragma once

#include <optional>

#include "analysis/Metrics.hpp"
#include "anomaly/ThresholdConfig.hpp"
#include "core/Finding.hpp"

namespace GcTriage
{
    namespace Anomaly
    {
        /**
         * Suspect detectors
         *
         * Responsibilities:
         *  - One pure function per catalog suspect, mapping the window's
         *    Metrics and the thresholds to a Finding.
         *  - Attach literal-figure evidence and next low-effort steps.
         *
         * Design notes:
         *  - A detector that does not fire returns std::nullopt. The TLAB
         *    detector is the exception: without any TLAB data in the file it
         *    returns the explicit NONE "unavailable" finding.
         *  - Only detectRetention() produces SUSPECTED.
         *  - Fewer than min_samples supporting samples lowers confidence by
         *    one level; it never suppresses a finding.
         */

        std::optional<Core::Finding> detectAllocationPressure(const Analysis::Metrics &metrics,
                                                              const ThresholdConfig &thresholds);

        std::optional<Core::Finding> detectHumongousPressure(const Analysis::Metrics &metrics,
                                                             const ThresholdConfig &thresholds);

        /// Qualifying pauses are counted with ">=" against long_pause_ms.
        std::optional<Core::Finding> detectLongStwPauses(const Analysis::Metrics &metrics,
                                                         const ThresholdConfig &thresholds);

        std::optional<Core::Finding> detectGcStarvation(const Analysis::Metrics &metrics,
                                                        const ThresholdConfig &thresholds);

        std::optional<Core::Finding> detectMetaspaceLeak(const Analysis::Metrics &metrics,
                                                         const ThresholdConfig &thresholds);

        std::optional<Core::Finding> detectTlabExhaustion(const Analysis::Metrics &metrics,
                                                          const ThresholdConfig &thresholds);

        /// Serial and Parallel are legacy choices; always DETECTED/high.
        std::optional<Core::Finding> detectWrongCollector(const Analysis::Metrics &metrics,
                                                          const ThresholdConfig &thresholds);

        std::optional<Core::Finding> detectRetention(const Analysis::Metrics &metrics,
                                                     const ThresholdConfig &thresholds);

        /**
         * Run every detector and return the findings in catalog order.
         */
        Core::FindingSet runAllDetectors(const Analysis::Metrics &metrics,
                                         const ThresholdConfig &thresholds);

    } // namespace Anomaly
} // namespace GcTriage

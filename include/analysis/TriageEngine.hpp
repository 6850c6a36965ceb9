#pragma once

#include <optional>

#include "anomaly/ThresholdConfig.hpp"
#include "core/Report.hpp"
#include "input/LineSource.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        /**
         * Configuration of one triage run.
         */
        struct EngineConfig
        {
            std::optional<double> tailWindowMinutes;   ///< unset: analyze the entire file
            Anomaly::ThresholdConfig thresholds;

            /// Throws std::invalid_argument on a non-positive window or threshold.
            void validate() const;
        };

        /**
         * TriageEngine
         *
         * Responsibilities:
         *  - Run classify -> aggregate -> detect over one line source.
         *  - Package the ordered findings and the analyzed window into a
         *    TriageReport.
         *
         * Design notes:
         *  - Holds only its configuration; every run() starts from scratch,
         *    so two runs over identical input produce identical reports.
         *  - Throws Core::UnsupportedLogError when the whole input yields
         *    no classifiable event, names a collector other than G1, Parallel
         *    or Serial, or (for G1) holds no pause at all.
         */
        class TriageEngine
        {
        public:
            /// Validates the configuration (std::invalid_argument).
            explicit TriageEngine(EngineConfig config);

            Core::TriageReport run(Input::ILineSource &source) const;

            const EngineConfig &config() const noexcept { return m_config; }

        private:
            EngineConfig m_config;
        };

    } // namespace Analysis
} // namespace GcTriage

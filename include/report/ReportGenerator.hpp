#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <ostream>
#include <mutex>
#include "core/Report.hpp"
#include "anomaly/ThresholdConfig.hpp"
#include "report/ExitCode.hpp"

namespace GcTriage
{
    namespace Report
    {
        /**
         * ReportGenerator
         *
         * Responsibilities:
         *  - Render a TriageReport for humans (Markdown, plain text) and
         *    for tooling (JSON).
         *  - Summarize the verdict in one line and show each finding with
         *    its evidence, business note and next low-effort data.
         *
         * Design notes:
         *  - Output is a pure function of the report and the format: no
         *    generation timestamp, findings kept in catalog order.
         *  - Never re-derives a figure; everything printed comes from the
         *    report.
         */
        class ReportGenerator
        {
        public:
            enum class OutputFormat
            {
                MARKDOWN,  // Markdown for tickets and chat
                TEXT,      // Plain text for terminals
                JSON       // Structured JSON for tooling
            };

            explicit ReportGenerator(OutputFormat format = OutputFormat::MARKDOWN,
                                     Anomaly::ThresholdConfig thresholds = {});

            // Non-copyable due to owned mutex
            ReportGenerator(const ReportGenerator&) = delete;
            ReportGenerator& operator=(const ReportGenerator&) = delete;

            /**
             * Store the report to render.
             */
            void generateReport(const Core::TriageReport& report);

            /**
             * Write report to specified output stream.
             * Returns true on success.
             */
            bool writeReport(std::ostream& output) const;

            /**
             * Write report to file.
             */
            bool writeReportToFile(const std::string& filePath);

            /**
             * Get report as string.
             */
            std::string getReportString() const;

            void setFormat(OutputFormat format) noexcept;

            /// "NO STRONG SIGNAL", "DETECTED - <suspect> (<conf> confidence)" or "<n> issues DETECTED -> ...".
            std::string summaryLine() const;

            /// Accepts "md", "markdown", "txt", "text", "json".
            static std::optional<OutputFormat> parseFormat(std::string_view name);

        private:
            void renderMarkdown(std::ostream& output) const;
            void renderText(std::ostream& output) const;
            void renderJson(std::ostream& output) const;

            std::string buildSummaryLine() const;

        private:
            mutable std::mutex m_mutex;
            Core::TriageReport m_report;
            OutputFormat m_format;
            Anomaly::ThresholdConfig m_thresholds;
        };

    } // namespace Report
} // namespace GcTriage

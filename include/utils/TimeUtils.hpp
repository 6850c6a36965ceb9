#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>

namespace GcTriage
{
    namespace Utils
    {
        /**
         * Time utilities.
         *
         * Two clocks are involved in a triage run:
         *  - Wall-clock time, used only to stamp diagnostic log lines.
         *  - JVM uptime, the only time base used for analysis. It is embedded
         *    in every unified-logging line as a decoration such as [22.113s]
         *    or [22113ms] and is monotone within one JVM run.
         *
         * Notes:
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         */

        using Clock     = std::chrono::system_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        /// Get current system time as TimePoint (logger timestamps only).
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /**
         * Parse a JVM uptime decoration (without brackets) into seconds.
         *
         * Accepted forms:
         *   "22.113s"   uptime decoration
         *   "22113ms"   uptimemillis decoration
         *   "22113ns"   uptimenanos decoration
         *
         * Returns std::nullopt for anything else (dates, levels, tags).
         */
        std::optional<double> parseUptimeDecoration(std::string_view sv);

        /// Convert seconds of uptime to minutes.
        constexpr double toMinutes(double seconds) noexcept
        {
            return seconds / 60.0;
        }

        /// Render uptime seconds as "12.345s".
        std::string formatUptime(double seconds);

        /// Render a duration in seconds as minutes with one decimal, e.g. "28.1 min".
        std::string formatMinutes(double seconds);

    } // namespace Utils
} // namespace GcTriage

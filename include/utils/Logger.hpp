#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

#include "utils/TimeUtils.hpp"  // for TimePoint and formatting

namespace GcTriage
{
    namespace Utils
    {
        /**
         * Log severity levels used across the system.
         *
         * Typical usage:
         *  - TRACE: per-line classifier decisions
         *  - DEBUG: malformed lines, dropped snapshots, detector verdicts
         *  - INFO: pipeline stage summaries
         *  - WARN: degraded analysis (segments, window fallback)
         *  - ERROR: I/O failures, unsupported input
         *  - CRITICAL: unrecoverable failures, likely to terminate
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "debug", "INFO", "warn"... (case-insensitive).
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility used to instrument the
         * triage pipeline (classification, windowing, aggregation, detection,
         * reporting).
         *
         * Features:
         *  - Global log level filtering.
         *  - Optional log file in addition to stderr.
         *  - Timestamps on every message.
         *
         * Diagnostic output never goes to stdout, which is reserved for the
         * report itself.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger attempts to open the file
             * in append mode. If opening fails, logging falls back to stderr only.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Attach (or replace) the file sink.
             * Returns false if the file cannot be opened; console logging continues.
             */
            bool setLogFile(std::string_view filePath);

            /// Redirect console output (nullptr disables the console sink).
            void setConsole(std::ostream *console) noexcept;

            /**
             * Log a message with a given severity.
             *
             * The log entry includes:
             *   - Timestamp (using TimeUtils)
             *   - Log level
             *   - Message text
             */
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            static const char *toString(LogLevel level) noexcept;

            /// Write a fully formatted line to the active sinks.
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Global logger accessor.
         *
         * Example usage:
         *   Logger &log = getLogger();
         *   log.info("Classified 4321 lines");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace GcTriage

#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace GcTriage
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *
         * Example:
         *   log_level           = INFO
         *   tail_window_minutes = 30
         *   long_pause_ms       = 1000
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened.
             * Malformed lines are skipped; valid lines are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Same as loadFromFile() but reads from an already open stream.
            void loadFromStream(std::istream &in);

            /// Manually set a configuration key-value pair.
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            /// Get raw string value for a key; returns std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Get integer value; returns std::nullopt if missing or invalid.
            std::optional<int> getInt(std::string_view key) const;

            int getIntOr(std::string_view key, int defaultValue) const;

            /// Get double value; returns std::nullopt if missing or invalid.
            std::optional<double> getDouble(std::string_view key) const;

            double getDoubleOr(std::string_view key, double defaultValue) const;

            /**
             * Get boolean value; returns std::nullopt if missing or invalid.
             *
             * Accepted true values (case-insensitive): "1", "true", "yes", "on"
             * Accepted false values (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;

            bool getBoolOr(std::string_view key, bool defaultValue) const;

            /// Number of loaded keys.
            std::size_t size() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace GcTriage

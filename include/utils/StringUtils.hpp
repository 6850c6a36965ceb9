#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace GcTriage::Utils {
    std::string escapeJson(const std::string& s);

    /// Fixed-point rendering with the given number of decimals ("7.48").
    std::string formatFixed(double value, int precision);

    /// Join strings with a separator.
    std::string join(const std::vector<std::string>& parts, std::string_view separator);
}

namespace GcTriage
{
    namespace Utils
    {
        /**
         * String utility helpers for parsing GC log text and rendering reports.
         *
         * All functions are:
         *  - Header-only, inline where appropriate for performance.
         *  - Stateless and thread-safe.
         *  - Using std::string_view where possible to avoid unnecessary copies.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            std::size_t i = 0;
            while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i])))
            {
                ++i;
            }
            return sv.substr(i);
        }

        /// Trim whitespace from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            if (sv.empty())
            {
                return sv;
            }

            std::size_t end = sv.size();
            while (end > 0 && std::isspace(static_cast<unsigned char>(sv[end - 1])))
            {
                --end;
            }
            return sv.substr(0, end);
        }

        /// Trim whitespace from both sides of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert to lowercase (ASCII only).
        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            for (char c : sv)
            {
                result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            return result;
        }

        /// Check if sv starts with the given prefix.
        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size() &&
                   sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Check if sv ends with the given suffix.
        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size() &&
                   sv.compare(sv.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        /// Check if a string_view contains a given substring (case-sensitive).
        inline bool contains(std::string_view sv, std::string_view needle) noexcept
        {
            if (needle.empty())
            {
                return true;
            }
            return sv.find(needle) != std::string_view::npos;
        }

        /**
         * Safely parse an integer from a string_view.
         *
         * Returns std::nullopt if parsing fails or if there are
         * non-numeric trailing characters after trimming.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::string s(sv); // local copy for stream parsing
            std::istringstream iss(s);
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /**
         * Safely parse a floating-point number from a string_view.
         *
         * Returns std::nullopt if parsing fails or trailing characters exist.
         */
        template <typename FloatType>
        std::optional<FloatType> parseFloat(std::string_view sv)
        {
            static_assert(std::is_floating_point<FloatType>::value,
                          "parseFloat requires a floating-point type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::string s(sv);
            std::istringstream iss(s);
            FloatType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace Utils
} // namespace GcTriage

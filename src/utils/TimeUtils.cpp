#include "utils/TimeUtils.hpp"
#include "utils/StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace GcTriage
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        std::optional<double> parseUptimeDecoration(std::string_view sv)
        {
            sv = trim(sv);
            if (sv.size() < 2)
            {
                return std::nullopt;
            }

            // Order matters: "ms" and "ns" both end with 's'.
            double scale = 1.0;
            std::string_view number;
            if (endsWith(sv, "ms"))
            {
                scale  = 1e-3;
                number = sv.substr(0, sv.size() - 2);
            }
            else if (endsWith(sv, "ns"))
            {
                scale  = 1e-9;
                number = sv.substr(0, sv.size() - 2);
            }
            else if (sv.back() == 's')
            {
                number = sv.substr(0, sv.size() - 1);
            }
            else
            {
                return std::nullopt;
            }

            if (number.empty())
            {
                return std::nullopt;
            }

            // Only digits and a single decimal point, so "2026-02-05T..." never qualifies.
            bool seenDot = false;
            for (char c : number)
            {
                if (c == '.')
                {
                    if (seenDot)
                        return std::nullopt;
                    seenDot = true;
                }
                else if (c < '0' || c > '9')
                {
                    return std::nullopt;
                }
            }

            auto value = parseFloat<double>(number);
            if (!value)
            {
                return std::nullopt;
            }
            return *value * scale;
        }

        std::string formatUptime(double seconds)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << seconds << "s";
            return oss.str();
        }

        std::string formatMinutes(double seconds)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << toMinutes(seconds) << " min";
            return oss.str();
        }

    } // namespace Utils
} // namespace GcTriage

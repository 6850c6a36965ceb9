// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace GcTriage::Utils {

std::string escapeJson(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += oss.str();
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string formatFixed(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string out = oss.str();

    // Avoid "-0.0" in reports.
    if (out.size() > 1 && out[0] == '-' &&
        out.find_first_not_of("-0.") == std::string::npos)
    {
        out.erase(0, 1);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace GcTriage::Utils

#include "input/LineSource.hpp"

namespace GcTriage
{
    namespace Input
    {
        std::optional<LogLine> StreamLineSource::nextLine()
        {
            std::string line;
            if (!std::getline(m_in, line))
            {
                return std::nullopt;
            }

            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            return LogLine{ .text = std::move(line), .number = ++m_lineNumber };
        }

        std::optional<LogLine> MemoryLineSource::nextLine()
        {
            if (m_next >= m_lines.size())
            {
                return std::nullopt;
            }

            const std::size_t index = m_next++;
            return LogLine{ .text = m_lines[index], .number = index + 1 };
        }

    } // namespace Input
} // namespace GcTriage

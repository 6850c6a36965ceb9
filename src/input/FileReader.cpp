#include "input/FileReader.hpp"

#include <utility>   // std::move

namespace GcTriage
{
    namespace Input
    {
        FileReader::FileReader(const std::string &filePath)
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_filePath(std::move(other.m_filePath)),
              m_lineNumber(other.m_lineNumber),
              m_failed(other.m_failed)
        {
            other.m_lineNumber = 0;
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                close();

                m_stream     = std::move(other.m_stream);
                m_filePath   = std::move(other.m_filePath);
                m_lineNumber = other.m_lineNumber;
                m_failed     = other.m_failed;
                other.m_lineNumber = 0;
            }
            return *this;
        }

        FileReader::~FileReader()
        {
            close();
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            // Binary mode keeps '\r' visible so it can be stripped uniformly.
            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            return true;
        }

        void FileReader::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_filePath.clear();
            m_lineNumber = 0;
            m_failed = false;
        }

        bool FileReader::isOpen() const noexcept
        {
            return m_stream.is_open();
        }

        std::optional<LogLine> FileReader::nextLine()
        {
            if (!m_stream.is_open())
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(m_stream, line))
            {
                m_failed = m_stream.bad();
                return std::nullopt;
            }

            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            return LogLine{ .text = std::move(line), .number = ++m_lineNumber };
        }

    } // namespace Input
} // namespace GcTriage

#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace GcTriage
{
    namespace Input
    {
        /**
         * One raw input line with its 1-based line number.
         * Transient: discarded once classified.
         */
        struct LogLine
        {
            std::string text;
            std::size_t number = 0;
        };

        /**
         * ILineSource
         *
         * Pull interface over an ordered sequence of text lines. The engine
         * consumes a source exactly once, front to back.
         */
        class ILineSource
        {
        public:
            virtual ~ILineSource() = default;

            /// Next line, or std::nullopt at end of input.
            virtual std::optional<LogLine> nextLine() = 0;

            /// Human readable origin (file path, "<stdin>", "<memory>").
            virtual std::string name() const = 0;
        };

        /**
         * StreamLineSource
         *
         * Reads lines from a borrowed std::istream (e.g. std::cin).
         * Strips a trailing '\r'.
         */
        class StreamLineSource : public ILineSource
        {
        public:
            StreamLineSource(std::istream &in, std::string name)
                : m_in(in), m_name(std::move(name))
            {
            }

            std::optional<LogLine> nextLine() override;
            std::string name() const override { return m_name; }

        private:
            std::istream &m_in;
            std::string   m_name;
            std::size_t   m_lineNumber = 0;
        };

        /**
         * MemoryLineSource
         *
         * Serves lines from an owned vector. Used by tests and by callers that
         * already hold the log in memory.
         */
        class MemoryLineSource : public ILineSource
        {
        public:
            explicit MemoryLineSource(std::vector<std::string> lines)
                : m_lines(std::move(lines))
            {
            }

            std::optional<LogLine> nextLine() override;
            std::string name() const override { return "<memory>"; }

        private:
            std::vector<std::string> m_lines;
            std::size_t              m_next = 0;
        };

    } // namespace Input
} // namespace GcTriage

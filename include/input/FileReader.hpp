#pragma once

#include <string>
#include <fstream>
#include <optional>

#include "input/LineSource.hpp"

namespace GcTriage
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Stream a GC log file line by line (logs can be hundreds of MB).
         *  - Number lines from 1 so evidence can point back into the file.
         *  - Manage the file handle via RAII.
         *
         * Design notes:
         *  - Uses std::ifstream; never reads the whole file into memory.
         *  - Not copyable (owning a file handle), but movable.
         */
        class FileReader : public ILineSource
        {
        public:
            FileReader() = default;

            /**
             * Construct and open a file immediately.
             * If open fails, isOpen() will return false.
             */
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader() override;

            /**
             * Open a file for reading.
             * Returns true on success, false if opening fails.
             * Any previously open file is closed first.
             */
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            const std::string &filePath() const noexcept { return m_filePath; }

            /**
             * Read the next line from the file.
             *
             * Returns the line without '\n' (and without a trailing '\r'),
             * or std::nullopt at EOF or on a read error.
             */
            std::optional<LogLine> nextLine() override;

            std::string name() const override { return m_filePath; }

            /// True if the last read stopped on an I/O error rather than EOF.
            bool failed() const noexcept { return m_failed; }

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::size_t   m_lineNumber = 0;
            bool          m_failed = false;
        };

    } // namespace Input
} // namespace GcTriage

// Fatal error conditions of a triage run.

#ifndef GCTRIAGE_CORE_ERRORS_HPP
#define GCTRIAGE_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace GcTriage
{
namespace Core
{

/**
 * @brief Thrown when the input is not a supported unified G1 GC log: a full
 *        pass produced zero classifiable events, the log names a collector
 *        other than G1, Parallel or Serial, or it holds no GC pause at all.
 *
 * Per-line problems never raise; they are counted and skipped.
 */
class UnsupportedLogError : public std::runtime_error
{
public:
    explicit UnsupportedLogError(std::uint64_t linesRead)
        : std::runtime_error("not a supported G1 log (" + std::to_string(linesRead) +
                             " lines read, no classifiable GC events)"),
          m_linesRead(linesRead)
    {
    }

    /// Classifiable lines exist but do not describe a G1 (or legacy) collector run.
    UnsupportedLogError(std::uint64_t linesRead, const std::string &reason)
        : std::runtime_error("not a supported G1 log: " + reason + " (" + std::to_string(linesRead) +
                             " lines read)"),
          m_linesRead(linesRead)
    {
    }

    std::uint64_t linesRead() const noexcept { return m_linesRead; }

private:
    std::uint64_t m_linesRead;
};

} // namespace Core
} // namespace GcTriage

#endif // GCTRIAGE_CORE_ERRORS_HPP

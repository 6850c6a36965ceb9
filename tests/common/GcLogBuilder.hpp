#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "input/LineSource.hpp"
#include "utils/StringUtils.hpp"

namespace GcTriage
{
    namespace Testing
    {
        /// One collection as it should appear in the log.
        struct PauseShape
        {
            std::string kind = "Young";               // Young, Full, Remark, Cleanup
            std::string phase = "Normal";             // young phase tag; ignored for other kinds
            std::string cause = "G1 Evacuation Pause";
            double heapBeforeMb = 400.0;
            double heapAfterMb = 350.0;
            double heapTotalMb = 1024.0;
            double pauseMs = 5.0;
            std::optional<int> oldBefore;
            std::optional<int> oldAfter;
            std::optional<int> humongousBefore;
            std::optional<int> humongousAfter;
            std::optional<std::pair<double, double>> metaspaceMb;   // used before, used after
            bool evacuationFailure = false;
        };

        /**
         * Builds synthetic JDK 17 style unified G1 log lines:
         *   [12.345s][info][gc] GC(7) Pause Young (Normal) (G1 Evacuation Pause) 400M->350M(1024M) 5.000ms
         * GC ids are assigned in call order.
         */
        class GcLogBuilder
        {
        public:
            GcLogBuilder &collector(const std::string &name, double uptime = 0.005)
            {
                return add(uptime, "info", "gc,init", "Using " + name);
            }

            GcLogBuilder &heapGeometry(int regionSizeMb, int maxCapacityMb, double uptime = 0.006)
            {
                add(uptime, "info", "gc,init", "Heap Region Size: " + std::to_string(regionSizeMb) + "M");
                return add(uptime, "info", "gc,init", "Heap Max Capacity: " + std::to_string(maxCapacityMb) + "M");
            }

            GcLogBuilder &pause(double uptime, const PauseShape &shape = {})
            {
                const std::string id = "GC(" + std::to_string(m_nextGcId++) + ") ";

                if (shape.humongousBefore && shape.humongousAfter)
                {
                    add(uptime, "info", "gc,heap", id + "Humongous regions: " + std::to_string(*shape.humongousBefore) +
                                                       "->" + std::to_string(*shape.humongousAfter));
                }
                if (shape.oldBefore || shape.oldAfter)
                {
                    const int after = shape.oldAfter.value_or(0);
                    add(uptime, "info", "gc,heap", id + "Old regions: " + std::to_string(shape.oldBefore.value_or(after)) +
                                                       "->" + std::to_string(after));
                }
                if (shape.metaspaceMb)
                {
                    const std::string before = Utils::formatFixed(shape.metaspaceMb->first, 1) + "M";
                    const std::string after  = Utils::formatFixed(shape.metaspaceMb->second, 1) + "M";
                    add(uptime, "info", "gc,metaspace", id + "Metaspace: " + before + "(" + before + ")->" + after +
                                                            "(" + after + ") NonClass: 1M(1M)->1M(1M) Class: 1M(1M)->1M(1M)");
                }

                std::string message = id + "Pause " + shape.kind + " ";
                if (shape.kind == "Young" && !shape.phase.empty())
                    message += "(" + shape.phase + ") ";
                if (!shape.cause.empty())
                    message += "(" + shape.cause + ") ";
                if (shape.evacuationFailure)
                    message += "(Evacuation Failure) ";
                message += megabytes(shape.heapBeforeMb) + "->" + megabytes(shape.heapAfterMb) + "(" +
                           megabytes(shape.heapTotalMb) + ") " + Utils::formatFixed(shape.pauseMs, 3) + "ms";
                return add(uptime, "info", "gc", message);
            }

            GcLogBuilder &youngPause(double uptime, double pauseMs = 5.0, std::optional<int> oldAfter = std::nullopt)
            {
                PauseShape shape;
                shape.pauseMs = pauseMs;
                shape.oldAfter = oldAfter;
                return pause(uptime, shape);
            }

            GcLogBuilder &tlab(double uptime, std::uint64_t slowAllocs, double wastePct = 1.5)
            {
                return add(uptime, "debug", "gc,tlab",
                           "GC(" + std::to_string(m_nextGcId) + ") TLAB totals: thrds: 12  refills: 340 max: 60 "
                           "slow allocs: " + std::to_string(slowAllocs) + " max 20 waste:  " +
                           Utils::formatFixed(wastePct, 1) + "% gc: 1024B max: 512B slow: 0B max: 0B");
            }

            GcLogBuilder &raw(std::string line)
            {
                m_lines.push_back(std::move(line));
                return *this;
            }

            const std::vector<std::string> &lines() const noexcept { return m_lines; }

            Input::MemoryLineSource source() const { return Input::MemoryLineSource(m_lines); }

            static std::string uptime(double seconds)
            {
                return "[" + Utils::formatFixed(seconds, 3) + "s]";
            }

        private:
            static std::string megabytes(double mb)
            {
                return Utils::formatFixed(mb, 0) + "M";
            }

            GcLogBuilder &add(double uptimeSeconds, const char *level, const char *tags, const std::string &message)
            {
                m_lines.push_back(uptime(uptimeSeconds) + "[" + level + "][" + tags + "] " + message);
                return *this;
            }

        private:
            std::vector<std::string> m_lines;
            std::int64_t m_nextGcId = 0;
        };

    } // namespace Testing
} // namespace GcTriage

#include "analysis/TriageEngine.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "analysis/EventStreamBuilder.hpp"
#include "analysis/MetricAggregator.hpp"
#include "anomaly/SuspectDetectors.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace GcTriage
{
    namespace Analysis
    {
        using Utils::getLogger;

        namespace
        {
            std::uint64_t pauseTotal(const Core::StreamSummary &summary)
            {
                using Core::EventCategory;
                return Core::countOf(summary.totals, EventCategory::YoungGC) +
                       Core::countOf(summary.totals, EventCategory::MixedGC) +
                       Core::countOf(summary.totals, EventCategory::FullGC) +
                       Core::countOf(summary.totals, EventCategory::ConcurrentPause);
            }
        } // anonymous namespace

        void EngineConfig::validate() const
        {
            if (tailWindowMinutes && !(*tailWindowMinutes > 0.0))
            {
                throw std::invalid_argument("tail window must be a positive number of minutes");
            }
            thresholds.validate();
        }

        TriageEngine::TriageEngine(EngineConfig config)
            : m_config(std::move(config))
        {
            m_config.validate();
        }

        Core::TriageReport TriageEngine::run(Input::ILineSource &source) const
        {
            getLogger().info("Analyzing " + source.name());

            EventStreamBuilder builder(m_config.tailWindowMinutes);
            const EventStream stream = builder.build(source);

            if (stream.summary.linesClassified == 0 || (stream.events.empty() && stream.runScoped.empty()))
            {
                throw Core::UnsupportedLogError(stream.summary.linesRead);
            }

            const MetricAggregator aggregator(m_config.thresholds);
            const Metrics metrics = aggregator.aggregate(stream);

            // Serial and Parallel stay in: the wrong-collector suspect reports them.
            const auto &collector = metrics.collector;
            const bool legacy = !collector.assumed && Core::isLegacyCollector(collector.family);
            if (!collector.assumed && !legacy && collector.family != Core::CollectorFamily::G1)
            {
                throw Core::UnsupportedLogError(stream.summary.linesRead,
                                                std::string("collector is ") + Core::toString(collector.family));
            }
            if (!legacy && pauseTotal(stream.summary) == 0)
            {
                throw Core::UnsupportedLogError(stream.summary.linesRead, "no GC pause events");
            }

            Core::FindingSet findings = Anomaly::runAllDetectors(metrics, m_config.thresholds);

            Core::TriageReport report;
            report.setSourceName(source.name());
            report.setWindow(stream.window);
            report.setWindowCounts(stream.windowCounts);
            report.setStream(stream.summary);
            report.setHeapOccupancyPct(metrics.heapOccupancyPct);
            report.setCollector(metrics.collector.family, metrics.collector.assumed);
            for (const auto &note : stream.notes)
            {
                report.addNote(note);
            }
            if (metrics.collector.assumed)
            {
                report.addNote("No collector identity line found; assuming G1.");
            }
            report.setFindings(std::move(findings));

            getLogger().info("Triage finished: " + std::to_string(report.activeFindingCount()) +
                             " active finding(s)");
            return report;
        }

    } // namespace Analysis
} // namespace GcTriage

#include <iostream>
#include <string>
#include <optional>
#include <stdexcept>

// Core models
#include "core/Errors.hpp"
#include "core/Report.hpp"

// Input
#include "input/FileReader.hpp"
#include "input/LineSource.hpp"

// Utils
#include "utils/Logger.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/StringUtils.hpp"

// Analysis
#include "analysis/TriageEngine.hpp"

// Reporting
#include "report/ExitCode.hpp"
#include "report/ReportGenerator.hpp"

using GcTriage::Report::ExitCode;
using GcTriage::Report::ReportGenerator;

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string inputFile;                     // "-" reads stdin
    std::optional<std::string> configFile;
    std::optional<std::string> outputFile;     // stdout when unset
    std::optional<std::string> logFile;
    std::optional<std::string> format;
    std::optional<double> tailWindowMinutes;
    std::optional<double> oldTrendThreshold;
    bool verbose = false;
    bool help = false;
    std::string error;                         // first usage error, empty when valid
};

static std::optional<double> parseNumberArg(const std::string &flag, const char *value, std::string &error)
{
    auto v = GcTriage::Utils::parseFloat<double>(value);
    if (!v)
    {
        error = flag + " expects a number, got '" + value + "'";
    }
    return v;
}

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    for (int i = 1; i < argc && opts.error.empty(); ++i)
    {
        std::string arg = argv[i];

        auto nextValue = [&]() -> const char *
        {
            if (i + 1 < argc)
                return argv[++i];
            opts.error = arg + " requires a value";
            return nullptr;
        };

        if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (arg == "--tail-window" || arg == "-w")
        {
            if (const char *v = nextValue())
                opts.tailWindowMinutes = parseNumberArg(arg, v, opts.error);
        }
        else if (arg == "--old-trend-threshold")
        {
            if (const char *v = nextValue())
                opts.oldTrendThreshold = parseNumberArg(arg, v, opts.error);
        }
        else if (arg == "--format" || arg == "-f")
        {
            if (const char *v = nextValue())
                opts.format = v;
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (const char *v = nextValue())
                opts.outputFile = v;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (const char *v = nextValue())
                opts.configFile = v;
        }
        else if (arg == "--log-file")
        {
            if (const char *v = nextValue())
                opts.logFile = v;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "-" || (!arg.empty() && arg[0] != '-'))
        {
            if (!opts.inputFile.empty())
                opts.error = "only one input log may be given";
            else
                opts.inputFile = arg;
        }
        else
        {
            opts.error = "unknown option " + arg;
        }
    }

    if (opts.error.empty() && !opts.help && opts.inputFile.empty())
        opts.error = "input log required";

    return opts;
}

static void printUsage(std::ostream &out, const char *progName)
{
    out << "Usage: " << progName << " [OPTIONS] <gc.log | ->\n\n"
        << "Triage a Java G1 unified GC log against known failure patterns.\n\n"
        << "OPTIONS:\n"
        << "  -w, --tail-window MIN        Analyze only the last MIN minutes of JVM uptime\n"
        << "      --old-trend-threshold N  Old gen growth (regions/min) that raises a retention suspect (default 5.0)\n"
        << "  -f, --format md|txt|json     Report format (default: md)\n"
        << "  -o, --output FILE            Write the report to FILE instead of stdout\n"
        << "  -c, --config FILE            key = value file with thresholds and defaults\n"
        << "      --log-file FILE          Also append diagnostic log lines to FILE\n"
        << "  -v, --verbose                Debug logging\n"
        << "  -h, --help                   Show this help\n\n"
        << "EXIT CODES:\n"
        << "  0  no suspect detected\n"
        << "  1  suspects detected, none critical\n"
        << "  2  critical condition (legacy collector, high-confidence leak or allocation pressure, heap > 90%)\n"
        << "  3  usage error, unreadable input or not a supported G1 log\n";
}

static int fail(const std::string &message)
{
    std::cerr << "Error: " << message << "\n";
    return static_cast<int>(ExitCode::ERROR);
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(std::cout, argv[0]);
        return static_cast<int>(ExitCode::OK);
    }
    if (!opts.error.empty())
    {
        std::cerr << "Error: " << opts.error << "\n\n";
        printUsage(std::cerr, argv[0]);
        return static_cast<int>(ExitCode::ERROR);
    }

    // Config
    GcTriage::Utils::ConfigLoader config;
    if (opts.configFile && !config.loadFromFile(*opts.configFile))
        return fail("cannot read config file " + *opts.configFile);

    // Logger
    auto &logger = GcTriage::Utils::getLogger();
    if (auto levelName = config.getString("log_level"))
    {
        if (auto level = GcTriage::Utils::parseLogLevel(*levelName))
            logger.setLevel(*level);
        else
            logger.warn("Unknown log_level '" + *levelName + "' in config, ignored");
    }
    if (opts.verbose)
        logger.setLevel(GcTriage::Utils::LogLevel::DEBUG);

    const auto logFile = opts.logFile ? opts.logFile : config.getString("log_file");
    if (logFile && !logger.setLogFile(*logFile))
        logger.warn("Cannot open log file " + *logFile + ", logging to stderr only");

    logger.info("Starting GC triage");
    logger.info("Input: " + opts.inputFile);

    // Report format
    const std::string formatName = opts.format.value_or(config.getStringOr("format", "md"));
    const auto format = ReportGenerator::parseFormat(formatName);
    if (!format)
        return fail("unknown report format '" + formatName + "' (expected md, txt or json)");

    // Engine configuration: defaults, then config file, then flags
    GcTriage::Analysis::EngineConfig engineConfig;
    engineConfig.thresholds = GcTriage::Anomaly::ThresholdConfig::fromConfig(config);
    engineConfig.tailWindowMinutes = config.getDouble("tail_window_minutes");
    if (opts.tailWindowMinutes)
        engineConfig.tailWindowMinutes = opts.tailWindowMinutes;
    if (opts.oldTrendThreshold)
        engineConfig.thresholds.oldTrendThreshold = *opts.oldTrendThreshold;

    std::optional<GcTriage::Analysis::TriageEngine> engine;
    try
    {
        engine.emplace(engineConfig);
    }
    catch (const std::invalid_argument &e)
    {
        return fail(std::string("invalid configuration: ") + e.what());
    }

    // Run
    GcTriage::Core::TriageReport report;
    try
    {
        if (opts.inputFile == "-")
        {
            GcTriage::Input::StreamLineSource source(std::cin, "<stdin>");
            report = engine->run(source);
        }
        else
        {
            GcTriage::Input::FileReader reader;
            if (!reader.open(opts.inputFile))
                return fail("cannot open input file " + opts.inputFile);

            report = engine->run(reader);
            if (reader.failed())
                return fail("read error on " + opts.inputFile);
        }
    }
    catch (const GcTriage::Core::UnsupportedLogError &e)
    {
        logger.error(e.what());
        return fail(e.what());
    }

    // Report
    ReportGenerator generator(*format, engineConfig.thresholds);
    generator.generateReport(report);

    if (opts.outputFile)
    {
        if (!generator.writeReportToFile(*opts.outputFile))
            return fail("cannot write report to " + *opts.outputFile);
        logger.info("Report saved: " + *opts.outputFile);
    }
    else if (!generator.writeReport(std::cout))
    {
        return fail("cannot write report to stdout");
    }

    const ExitCode code = GcTriage::Report::computeExitCode(report, engineConfig.thresholds);
    logger.info("Verdict: " + generator.summaryLine() + " (exit " + std::to_string(static_cast<int>(code)) + ")");
    return static_cast<int>(code);
}

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager(int argc, char* argv[])
{
    applyEnvironment();
    applyArguments(argc, argv);
    resolveInputs();
}

void ConfigurationManager::applyEnvironment()
{
    if (const char* dir = std::getenv("FLEETTRACE_INPUT_DIR"))
        inputDir = dir;

    if (const char* threshold = std::getenv("FLEETTRACE_MALFORMED_THRESHOLD"))
        pipeline.malformedThreshold = parseCount("FLEETTRACE_MALFORMED_THRESHOLD", threshold);

    if (const char* report = std::getenv("FLEETTRACE_REPORT"))
        reportPath = report;
}

void ConfigurationManager::applyArguments(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            helpRequested = true;
            continue;
        }
        if (arg == "--prefetch")
        {
            pipeline.prefetch = true;
            continue;
        }
        if (i + 1 >= argc || arg.rfind("--", 0) != 0)
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
            continue;
        }

        std::string value = argv[i + 1];
        if (arg == "--input-dir")                inputDir = value;
        else if (arg == "--positions")           pipeline.positions = value;
        else if (arg == "--battery")             pipeline.battery = value;
        else if (arg == "--trips")               pipeline.trips = value;
        else if (arg == "--charging")            pipeline.charging = value;
        else if (arg == "--stations")            pipeline.stations = value;
        else if (arg == "--malformed-threshold") pipeline.malformedThreshold = parseCount(arg, value);
        else if (arg == "--report")              reportPath = value;
        else if (arg == "--db")                  databasePath = value;
        else if (arg == "--export")              exportPath = value;
        else if (arg == "--bucket")              pipeline.aggregator.timelineBucket = parseDouble(arg, value);
        else if (arg == "--stop-speed")          pipeline.aggregator.stopSpeedThreshold = parseDouble(arg, value);
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
            continue;
        }
        ++i;
    }

    if (pipeline.aggregator.timelineBucket <= 0.0)
        throw std::runtime_error("--bucket must be positive.");
    if (pipeline.aggregator.stopSpeedThreshold < 0.0)
        throw std::runtime_error("--stop-speed must not be negative.");
}

void ConfigurationManager::resolveInputs()
{
    if (inputDir.empty())
        return;

    std::pair<std::string*, std::string const*> const defaults[] = {
        {&pipeline.positions, &POSITIONS_FILE},
        {&pipeline.battery,   &BATTERY_FILE},
        {&pipeline.trips,     &TRIPS_FILE},
        {&pipeline.charging,  &CHARGING_FILE},
        {&pipeline.stations,  &STATIONS_FILE},
    };

    for (const auto& [field, file] : defaults)
    {
        if (!field->empty())
            continue;

        std::string candidate = joinPath(inputDir, *file);
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec))
            *field = candidate;
    }
}

std::string ConfigurationManager::joinPath(std::string const& dir, std::string const& file)
{
    return (std::filesystem::path(dir) / file).string();
}

double ConfigurationManager::parseDouble(std::string const& option, std::string const& value)
{
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0' || errno == ERANGE || !std::isfinite(v))
        throw std::runtime_error("Invalid number for " + option + ": '" + value + "'");
    return v;
}

std::uint64_t ConfigurationManager::parseCount(std::string const& option, std::string const& value)
{
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(value.c_str(), &end, 10);
    if (value.empty() || value.front() == '-' || *end != '\0' || errno == ERANGE)
        throw std::runtime_error("Invalid count for " + option + ": '" + value + "'");
    return static_cast<std::uint64_t>(v);
}

PipelineConfig const& ConfigurationManager::getPipelineConfig() const noexcept { return pipeline; }
std::string ConfigurationManager::getReportPath() const noexcept { return reportPath; }
std::string ConfigurationManager::getDatabasePath() const noexcept { return databasePath; }
std::string ConfigurationManager::getExportPath() const noexcept { return exportPath; }
bool ConfigurationManager::wantsHelp() const noexcept { return helpRequested; }

std::string ConfigurationManager::usage()
{
    std::ostringstream ss;
    ss << "Usage: fleettrace [options]\n"
       << "  --input-dir DIR              directory holding " << POSITIONS_FILE << ", " << BATTERY_FILE << ",\n"
       << "                               " << TRIPS_FILE << ", " << CHARGING_FILE << ", " << STATIONS_FILE << "\n"
       << "  --positions FILE             vehicle position samples (required)\n"
       << "  --battery FILE               battery state samples\n"
       << "  --trips FILE                 trip summaries\n"
       << "  --charging FILE              charging sessions\n"
       << "  --stations FILE              station registry (station_id,name,capacity)\n"
       << "  --malformed-threshold N      malformed rows tolerated per stream (default 100)\n"
       << "  --report FILE                write the text report to FILE instead of stdout\n"
       << "  --db FILE                    write the report tables to a SQLite database\n"
       << "  --export FILE                write the report as a protobuf message\n"
       << "  --prefetch                   read streams ahead on worker threads\n"
       << "  --bucket SECONDS             timeline bucket width (default 60)\n"
       << "  --stop-speed M/S             speed counted as stopped (default 0.1)\n"
       << "  --help                       show this text\n"
       << "Environment: FLEETTRACE_INPUT_DIR, FLEETTRACE_MALFORMED_THRESHOLD, FLEETTRACE_REPORT\n";
    return ss.str();
}

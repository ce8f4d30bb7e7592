#pragma once
#include <string>
#include "TelemetryPipeline.hpp"

// Run settings: defaults, then FLEETTRACE_* environment variables, then the command line.
class ConfigurationManager
{
private:
    PipelineConfig pipeline;
    std::string inputDir;
    std::string reportPath;
    std::string databasePath;
    std::string exportPath;
    bool helpRequested = false;

    void applyEnvironment();
    void applyArguments(int argc, char* argv[]);
    void resolveInputs();

    static std::string joinPath(std::string const& dir, std::string const& file);
    static double parseDouble(std::string const& option, std::string const& value);
    static std::uint64_t parseCount(std::string const& option, std::string const& value);

public:
    ConfigurationManager(int argc, char* argv[]);

    static inline const std::string POSITIONS_FILE = "realtime_data.csv";
    static inline const std::string BATTERY_FILE   = "battery_data.csv";
    static inline const std::string TRIPS_FILE     = "trip_summary.csv";
    static inline const std::string CHARGING_FILE  = "charging_events.csv";
    static inline const std::string STATIONS_FILE  = "stations.csv";

    [[nodiscard]] PipelineConfig const& getPipelineConfig() const noexcept;
    [[nodiscard]] std::string getReportPath() const noexcept;
    [[nodiscard]] std::string getDatabasePath() const noexcept;
    [[nodiscard]] std::string getExportPath() const noexcept;
    [[nodiscard]] bool wantsHelp() const noexcept;

    static std::string usage();
};

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Aggregates.hpp"

struct PipelineConfig;
struct PipelineResult;
class RunDiagnostics;

// Plain-text run report. Every report ends with the data-quality section, so
// metrics never appear without the caveats that apply to them.
class ReportAssembler
{
public:
    static std::string render(PipelineResult const& result, PipelineConfig const& config);

    // Used when the run was aborted and there are no metrics to show.
    static std::string renderDiagnostics(RunDiagnostics const& diagnostics);

    static std::string formatDuration(double seconds);

private:
    static std::string buildHeader(PipelineResult const& result, PipelineConfig const& config);
    static std::string buildFleetSection(FleetAggregate const& fleet);
    static std::string buildTypeTable(std::vector<VehicleTypeSummary> const& types);
    static std::string buildVehicleTable(std::vector<VehicleAggregate> const& vehicles);
    static std::string buildStationTable(std::vector<StationAggregate> const& stations);
    static std::string buildTimelineTable(std::vector<TimelineBucket> const& timeline);
    static std::string buildQualitySection(RunDiagnostics const& diagnostics);

    static std::string formatNumber(std::optional<double> value, int precision = 2);
    static std::string rule(char c = '-');
};

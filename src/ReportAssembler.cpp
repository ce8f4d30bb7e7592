#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <date/date.h>
#include "Diagnostics.hpp"
#include "ReportAssembler.hpp"
#include "TelemetryPipeline.hpp"

namespace
{
    constexpr int WIDTH = 100;
    const std::string NO_DATA = "no data";
}

std::string ReportAssembler::rule(char c)
{
    return std::string(WIDTH, c) + "\n";
}

std::string ReportAssembler::formatDuration(double seconds)
{
    if (!std::isfinite(seconds))
        return NO_DATA;

    auto rounded = std::chrono::seconds(std::llround(seconds));
    std::ostringstream ss;
    ss << date::hh_mm_ss<std::chrono::seconds>{rounded};
    return ss.str();
}

std::string ReportAssembler::formatNumber(std::optional<double> value, int precision)
{
    if (!value)
        return NO_DATA;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << *value;
    return ss.str();
}

std::string ReportAssembler::buildHeader(PipelineResult const& result, PipelineConfig const& config)
{
    std::ostringstream ss;
    ss << rule('=')
       << "FLEET TELEMETRY REPORT\n"
       << rule('=');

    auto input = [&ss](char const* label, std::string const& path)
    {
        ss << "  " << std::left << std::setw(12) << label << (path.empty() ? "(not supplied)" : path) << "\n";
    };
    input("Positions", config.positions);
    input("Battery", config.battery);
    input("Trips", config.trips);
    input("Charging", config.charging);
    input("Stations", config.stations);

    FleetAggregate const& fleet = result.fleet;
    if (fleet.firstTime && fleet.lastTime)
    {
        ss << "  Span        " << formatDuration(*fleet.firstTime) << " - " << formatDuration(*fleet.lastTime)
           << " (" << formatDuration(*fleet.lastTime - *fleet.firstTime) << ")\n";
    }
    else
    {
        ss << "  Span        " << NO_DATA << "\n";
    }
    ss << "  Merged      " << result.index.recordsMerged << " records, peak "
       << result.index.peakActiveVehicles << " active vehicles\n";
    return ss.str();
}

std::string ReportAssembler::buildFleetSection(FleetAggregate const& fleet)
{
    std::ostringstream ss;
    ss << "\nFLEET SUMMARY\n" << rule();

    auto line = [&ss](char const* label, std::string const& value)
    {
        ss << "  " << std::left << std::setw(34) << label << value << "\n";
    };

    line("Vehicle episodes", std::to_string(fleet.vehicles));
    line("Trips completed", std::to_string(fleet.tripsCompleted));
    line("Position samples", std::to_string(fleet.samples));
    line("Battery samples", std::to_string(fleet.batterySamples));
    line("Mean speed (m/s)", formatNumber(fleet.speed ? std::optional<double>(fleet.speed->mean) : std::nullopt));
    line("Max speed (m/s)", formatNumber(fleet.speed ? std::optional<double>(fleet.speed->max) : std::nullopt));
    line("Speed variance (m2/s2)", formatNumber(fleet.speed ? std::optional<double>(fleet.speed->variance) : std::nullopt, 3));
    line("Path distance (m)", formatNumber(fleet.pathDistance, 1));
    line("Odometer distance (m)", formatNumber(fleet.odometerDistance, 1));
    line("Trip distance (m)", formatNumber(fleet.tripDistance, 1));
    line("Mean trip duration", fleet.meanTripDuration ? formatDuration(*fleet.meanTripDuration) : NO_DATA);
    line("Total waiting time", formatDuration(fleet.totalWaitingTime));
    line("Energy consumed (Wh)", formatNumber(fleet.energyConsumed));
    line("Energy regenerated (Wh)", formatNumber(fleet.energyRegenerated));
    line("Energy charged (Wh)", formatNumber(fleet.energyCharged));
    line("Energy per km (Wh/km)", formatNumber(fleet.energyPerKm));
    line("Regeneration ratio", formatNumber(fleet.regenerationRatio, 3));
    line("Charging sessions", std::to_string(fleet.chargingSessions));
    line("Charging energy delivered (Wh)", formatNumber(fleet.chargingEnergyDelivered));
    return ss.str();
}

std::string ReportAssembler::buildTypeTable(std::vector<VehicleTypeSummary> const& types)
{
    std::ostringstream ss;
    ss << "\nVEHICLE TYPES\n" << rule();
    ss << std::left << std::setw(20) << "Type"
       << std::right << std::setw(10) << "Vehicles"
       << std::setw(12) << "Samples"
       << std::setw(14) << "Mean m/s"
       << std::setw(14) << "Max m/s"
       << std::setw(14) << "Waiting"
       << std::setw(16) << "Step waiting"
       << std::setw(12) << "Max dist m" << "\n";

    for (const auto& t : types)
    {
        ss << std::left << std::setw(20) << t.vehicleType
           << std::right << std::setw(10) << t.vehicles
           << std::setw(12) << t.samples
           << std::setw(14) << formatNumber(t.meanSpeed)
           << std::setw(14) << formatNumber(t.maxSpeed)
           << std::setw(14) << formatDuration(t.totalWaitingTime)
           << std::setw(16) << (t.sampledWaitingTime ? formatDuration(*t.sampledWaitingTime) : NO_DATA)
           << std::setw(12) << formatNumber(t.maxDistance, 1) << "\n";
    }
    if (types.empty())
        ss << "  (none)\n";
    return ss.str();
}

std::string ReportAssembler::buildVehicleTable(std::vector<VehicleAggregate> const& vehicles)
{
    std::ostringstream ss;
    ss << "\nVEHICLES\n" << rule();
    ss << std::left << std::setw(14) << "Vehicle"
       << std::setw(4) << "Ep"
       << std::setw(12) << "Type"
       << std::right << std::setw(8) << "Samples"
       << std::setw(9) << "Mean"
       << std::setw(9) << "Max"
       << std::setw(10) << "Dist m"
       << std::setw(10) << "Duration"
       << std::setw(10) << "Net Wh"
       << std::setw(8) << "SoC"
       << "  Closed by\n";

    for (const auto& v : vehicles)
    {
        double distance = v.trip ? v.trip->distance : v.odometerDistance.value_or(v.pathDistance);
        std::string duration = v.trip ? formatDuration(v.trip->duration) : NO_DATA;

        ss << std::left << std::setw(14) << v.vehicleId
           << std::setw(4) << v.episode
           << std::setw(12) << v.vehicleType
           << std::right << std::setw(8) << v.sampleCount
           << std::setw(9) << formatNumber(v.speed ? std::optional<double>(v.speed->mean) : std::nullopt)
           << std::setw(9) << formatNumber(v.speed ? std::optional<double>(v.speed->max) : std::nullopt)
           << std::setw(10) << formatNumber(distance, 1)
           << std::setw(10) << duration
           << std::setw(10) << (v.batterySampleCount ? formatNumber(v.netEnergy(), 1) : NO_DATA)
           << std::setw(8) << formatNumber(v.finalSoc)
           << "  " << finalizeReasonName(v.reason) << "\n";
    }
    if (vehicles.empty())
        ss << "  (none)\n";
    return ss.str();
}

std::string ReportAssembler::buildStationTable(std::vector<StationAggregate> const& stations)
{
    std::ostringstream ss;
    ss << "\nCHARGING STATIONS\n" << rule();
    ss << std::left << std::setw(16) << "Station"
       << std::right << std::setw(5) << "Cap"
       << std::setw(10) << "Sessions"
       << std::setw(12) << "Energy Wh"
       << std::setw(11) << "Occupied"
       << std::setw(11) << "Mean dwell"
       << std::setw(10) << "Max dwell"
       << std::setw(10) << "Vehicles"
       << std::setw(6) << "Peak"
       << std::setw(9) << "Overlap" << "\n";

    for (const auto& s : stations)
    {
        ss << std::left << std::setw(16) << s.stationId
           << std::right << std::setw(5) << s.capacity
           << std::setw(10) << s.sessions
           << std::setw(12) << formatNumber(s.energyDelivered, 1)
           << std::setw(11) << formatDuration(s.occupiedDuration)
           << std::setw(11) << (s.sessions ? formatDuration(s.meanSessionTime()) : NO_DATA)
           << std::setw(10) << formatDuration(s.maxSessionTime)
           << std::setw(10) << s.distinctVehicles
           << std::setw(6) << s.peakConcurrency
           << std::setw(9) << s.overlapAnomalies << "\n";
    }
    if (stations.empty())
        ss << "  (none)\n";
    return ss.str();
}

std::string ReportAssembler::buildTimelineTable(std::vector<TimelineBucket> const& timeline)
{
    std::ostringstream ss;
    ss << "\nTIMELINE\n" << rule();
    ss << std::left << std::setw(12) << "From"
       << std::right << std::setw(10) << "Samples"
       << std::setw(12) << "Mean m/s"
       << std::setw(10) << "Battery"
       << std::setw(10) << "Mean SoC"
       << std::setw(10) << "Charged"
       << std::setw(12) << "Energy Wh" << "\n";

    for (const auto& b : timeline)
    {
        ss << std::left << std::setw(12) << formatDuration(b.start)
           << std::right << std::setw(10) << b.samples
           << std::setw(12) << formatNumber(b.meanSpeed)
           << std::setw(10) << b.batterySamples
           << std::setw(10) << formatNumber(b.meanSoc, 3)
           << std::setw(10) << b.chargingSessionsEnded
           << std::setw(12) << formatNumber(b.energyDelivered, 1) << "\n";
    }
    if (timeline.empty())
        ss << "  (none)\n";
    return ss.str();
}

std::string ReportAssembler::buildQualitySection(RunDiagnostics const& diagnostics)
{
    std::ostringstream ss;
    ss << "\nDATA QUALITY\n" << rule();

    if (diagnostics.aborted())
        ss << "  RUN ABORTED: " << diagnostics.abortReason() << "\n";

    for (int k = 0; k < STREAM_KIND_COUNT; ++k)
    {
        auto kind = static_cast<StreamKind>(k);
        StreamCounters const& s = diagnostics.stream(kind);
        ss << "  " << std::left << std::setw(10) << streamKindName(kind);
        if (!s.present)
        {
            ss << "not supplied\n";
            continue;
        }
        ss << s.recordsRead << " rows read, " << s.malformed << " malformed\n";
        for (const auto& sample : s.malformedSamples)
            ss << "      " << sample << "\n";
    }

    auto const& missing = diagnostics.missingCorrelations();
    ss << "  Missing correlations: " << missing.size() << "\n";
    for (const auto& m : missing)
        ss << "      " << m.vehicleId << ": " << streamKindName(m.kind) << " record at "
           << formatDuration(m.at) << " without a preceding position sample\n";

    auto const& overlaps = diagnostics.overlapAnomalies();
    ss << "  Station overlap anomalies: " << overlaps.size() << "\n";
    for (const auto& o : overlaps)
        ss << "      " << o.stationId << ": " << o.concurrency << " vehicles at " << formatDuration(o.at)
           << " (capacity " << o.capacity << ", session of " << o.vehicleId << ")\n";

    auto list = [&ss](char const* label, std::vector<std::string> const& ids)
    {
        ss << "  " << label << ": " << ids.size() << "\n";
        if (ids.empty())
            return;
        ss << "      ";
        for (std::size_t i = 0; i < ids.size(); ++i)
            ss << (i ? ", " : "") << ids[i];
        ss << "\n";
    };
    list("Charging sessions after trip completion", diagnostics.lateChargingVehicles());
    list("Vehicles finalized without trip summary", diagnostics.unfinishedTrips());
    list("Recycled vehicle ids", diagnostics.recycledIds());

    ss << "  Total caveats: " << diagnostics.caveatCount() << "\n";
    return ss.str();
}

std::string ReportAssembler::render(PipelineResult const& result, PipelineConfig const& config)
{
    std::ostringstream ss;
    ss << buildHeader(result, config);
    ss << buildFleetSection(result.fleet);
    ss << buildTypeTable(result.fleet.types);
    ss << buildVehicleTable(result.vehicles);
    ss << buildStationTable(result.stations);
    ss << buildTimelineTable(result.timeline);
    ss << buildQualitySection(result.diagnostics);
    ss << rule('=');
    return ss.str();
}

std::string ReportAssembler::renderDiagnostics(RunDiagnostics const& diagnostics)
{
    std::ostringstream ss;
    ss << rule('=')
       << "FLEET TELEMETRY REPORT (diagnostics only, no metrics)\n"
       << rule('=');
    ss << buildQualitySection(diagnostics);
    ss << rule('=');
    return ss.str();
}

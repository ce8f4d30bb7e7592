#include "ReportExporter.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "TelemetryPipeline.hpp"

namespace
{
    void fillSpeed(fleettrace::SpeedStatistics* out, SpeedStatistics const& in)
    {
        out->set_min(in.min);
        out->set_max(in.max);
        out->set_mean(in.mean);
        out->set_variance(in.variance);
    }

    void fillVehicle(fleettrace::VehicleAggregate* out, VehicleAggregate const& v)
    {
        out->set_vehicle_id(v.vehicleId);
        out->set_vehicle_type(v.vehicleType);
        out->set_episode(v.episode);
        out->set_reason(v.reason == FinalizeReason::TripCompleted
                            ? fleettrace::VehicleAggregate::TRIP_COMPLETED
                            : fleettrace::VehicleAggregate::INPUT_EXHAUSTED);

        out->set_sample_count(v.sampleCount);
        if (v.speed) fillSpeed(out->mutable_speed(), *v.speed);
        if (v.minAcceleration) out->set_min_acceleration(*v.minAcceleration);
        if (v.maxAcceleration) out->set_max_acceleration(*v.maxAcceleration);
        out->set_path_distance(v.pathDistance);
        if (v.odometerDistance) out->set_odometer_distance(*v.odometerDistance);
        out->set_stopped_time(v.stoppedTime);
        if (v.firstSeen) out->set_first_seen(*v.firstSeen);
        if (v.lastSeen) out->set_last_seen(*v.lastSeen);

        out->set_battery_sample_count(v.batterySampleCount);
        out->set_energy_consumed(v.energyConsumed);
        out->set_energy_regenerated(v.energyRegenerated);
        out->set_energy_charged(v.energyCharged);
        if (v.initialSoc) out->set_initial_soc(*v.initialSoc);
        if (v.finalSoc) out->set_final_soc(*v.finalSoc);
        if (v.minSoc) out->set_min_soc(*v.minSoc);

        out->set_charging_sessions(v.chargingSessions);
        out->set_charging_energy_delivered(v.chargingEnergyDelivered);
        out->set_charging_time(v.chargingTime);

        if (v.trip)
        {
            auto* trip = out->mutable_trip();
            trip->set_departure(v.trip->departure);
            trip->set_arrival(v.trip->arrival);
            trip->set_distance(v.trip->distance);
            trip->set_duration(v.trip->duration);
            trip->set_waiting_time(v.trip->waitingTime);
        }
        if (v.energyPerKm) out->set_energy_per_km(*v.energyPerKm);
        if (v.chargingEfficiency) out->set_charging_efficiency(*v.chargingEfficiency);
    }

    void fillStation(fleettrace::StationAggregate* out, StationAggregate const& s)
    {
        out->set_station_id(s.stationId);
        out->set_name(s.name);
        out->set_capacity(s.capacity);
        out->set_sessions(s.sessions);
        out->set_energy_delivered(s.energyDelivered);
        out->set_occupied_duration(s.occupiedDuration);
        out->set_total_session_time(s.totalSessionTime);
        out->set_max_session_time(s.maxSessionTime);
        out->set_distinct_vehicles(s.distinctVehicles);
        out->set_overlap_anomalies(s.overlapAnomalies);
        out->set_peak_concurrency(s.peakConcurrency);
        if (s.firstStart) out->set_first_start(*s.firstStart);
        if (s.lastEnd) out->set_last_end(*s.lastEnd);
    }

    void fillFleet(fleettrace::FleetAggregate* out, FleetAggregate const& f)
    {
        out->set_vehicles(f.vehicles);
        out->set_trips_completed(f.tripsCompleted);
        out->set_samples(f.samples);
        out->set_battery_samples(f.batterySamples);
        if (f.speed) fillSpeed(out->mutable_speed(), *f.speed);
        out->set_path_distance(f.pathDistance);
        out->set_odometer_distance(f.odometerDistance);
        out->set_trip_distance(f.tripDistance);
        out->set_energy_consumed(f.energyConsumed);
        out->set_energy_regenerated(f.energyRegenerated);
        out->set_energy_charged(f.energyCharged);
        out->set_charging_energy_delivered(f.chargingEnergyDelivered);
        out->set_charging_sessions(f.chargingSessions);
        if (f.meanTripDuration) out->set_mean_trip_duration(*f.meanTripDuration);
        out->set_total_waiting_time(f.totalWaitingTime);
        if (f.energyPerKm) out->set_energy_per_km(*f.energyPerKm);
        if (f.regenerationRatio) out->set_regeneration_ratio(*f.regenerationRatio);
        if (f.firstTime) out->set_first_time(*f.firstTime);
        if (f.lastTime) out->set_last_time(*f.lastTime);

        for (const auto& t : f.types)
        {
            auto* row = out->add_types();
            row->set_vehicle_type(t.vehicleType);
            row->set_vehicles(t.vehicles);
            row->set_samples(t.samples);
            if (t.meanSpeed) row->set_mean_speed(*t.meanSpeed);
            if (t.maxSpeed) row->set_max_speed(*t.maxSpeed);
            row->set_total_waiting_time(t.totalWaitingTime);
            if (t.sampledWaitingTime) row->set_sampled_waiting_time(*t.sampledWaitingTime);
            if (t.maxDistance) row->set_max_distance(*t.maxDistance);
        }
    }

    void fillDiagnostics(fleettrace::Diagnostics* out, RunDiagnostics const& diag)
    {
        for (int k = 0; k < STREAM_KIND_COUNT; ++k)
        {
            auto kind = static_cast<StreamKind>(k);
            StreamCounters const& s = diag.stream(kind);
            auto* row = out->add_streams();
            row->set_stream(streamKindName(kind));
            row->set_source(s.source);
            row->set_present(s.present);
            row->set_records_read(s.recordsRead);
            row->set_malformed(s.malformed);
            for (const auto& sample : s.malformedSamples)
                row->add_malformed_samples(sample);
        }

        for (const auto& m : diag.missingCorrelations())
        {
            auto* row = out->add_missing_correlations();
            row->set_vehicle_id(m.vehicleId);
            row->set_stream(streamKindName(m.kind));
            row->set_at(m.at);
        }

        for (const auto& o : diag.overlapAnomalies())
        {
            auto* row = out->add_overlap_anomalies();
            row->set_station_id(o.stationId);
            row->set_vehicle_id(o.vehicleId);
            row->set_at(o.at);
            row->set_concurrency(o.concurrency);
            row->set_capacity(o.capacity);
        }

        for (const auto& id : diag.lateChargingVehicles())
            out->add_late_charging_vehicles(id);
        for (const auto& id : diag.unfinishedTrips())
            out->add_unfinished_trips(id);
        for (const auto& id : diag.recycledIds())
            out->add_recycled_ids(id);
        if (diag.aborted())
            out->set_abort_reason(diag.abortReason());
    }
}

fleettrace::FleetReport ReportExporter::toMessage(PipelineResult const& result)
{
    fleettrace::FleetReport report;
    report.set_records_merged(result.index.recordsMerged);
    report.set_peak_active_vehicles(result.index.peakActiveVehicles);
    report.set_peak_pending_records(result.index.peakPendingRecords);

    fillFleet(report.mutable_fleet(), result.fleet);
    for (const auto& v : result.vehicles)
        fillVehicle(report.add_vehicles(), v);
    for (const auto& s : result.stations)
        fillStation(report.add_stations(), s);

    for (const auto& b : result.timeline)
    {
        auto* row = report.add_timeline();
        row->set_start(b.start);
        row->set_width(b.width);
        row->set_samples(b.samples);
        if (b.meanSpeed) row->set_mean_speed(*b.meanSpeed);
        row->set_battery_samples(b.batterySamples);
        if (b.meanSoc) row->set_mean_soc(*b.meanSoc);
        row->set_charging_sessions_ended(b.chargingSessionsEnded);
        row->set_energy_delivered(b.energyDelivered);
    }

    fillDiagnostics(report.mutable_diagnostics(), result.diagnostics);
    return report;
}

void ReportExporter::save(PipelineResult const& result, std::string const& path)
{
    fleettrace::FleetReport report = toMessage(result);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("Could not open export file " + path);

    if (!report.SerializeToOstream(&file))
        throw std::runtime_error("Failed to serialize report to " + path);

    std::cout << "[System] Report exported to " << path << " (" << report.ByteSizeLong() << " bytes)" << std::endl;
}

fleettrace::FleetReport ReportExporter::load(std::string const& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Could not open export file " + path);

    fleettrace::FleetReport report;
    if (!report.ParseFromIstream(&file))
        throw std::runtime_error("Export file " + path + " is not a valid fleet report");
    return report;
}

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include "Aggregates.hpp"
#include "Types.hpp"

class RunDiagnostics;
class StationUtilizationTracker;

struct AggregatorSettings
{
    double stopSpeedThreshold = 0.1;   // m/s; SUMO counts a vehicle as waiting below this
    double timelineBucket = 60.0;      // s
};

// Single-pass reduction of the correlated stream into per-vehicle, per-type and
// fleet metrics. Speed statistics are updated online; raw samples are never kept.
class MetricsAggregator
{
public:
    MetricsAggregator(StationUtilizationTracker& stations, RunDiagnostics& diagnostics,
                      AggregatorSettings settings = {});

    void consume(CorrelatedRecord const& record);

    // Finalizes every vehicle still open; call once the correlated stream is exhausted.
    void finish();

    std::vector<VehicleAggregate> const& finalized() const noexcept { return done; }
    std::size_t openCount() const noexcept { return open.size(); }

    FleetAggregate fleet() const;
    std::vector<TimelineBucket> timeline() const;

private:
    using SpeedAccumulator = boost::accumulators::accumulator_set<double,
        boost::accumulators::stats<
            boost::accumulators::tag::count,
            boost::accumulators::tag::mean,
            boost::accumulators::tag::variance,
            boost::accumulators::tag::min,
            boost::accumulators::tag::max
        >
    >;

    struct LastSample
    {
        SimTime timestamp;
        double x;
        double y;
        double speed;
    };

    struct VehicleAccumulator
    {
        std::string vehicleType;
        unsigned episode = 1;
        SpeedAccumulator speed;
        std::optional<double> minAcceleration;
        std::optional<double> maxAcceleration;
        std::optional<LastSample> last;
        double pathDistance = 0.0;
        double stoppedTime = 0.0;
        std::optional<SimTime> firstSeen;
        std::optional<SimTime> lastSeen;

        std::optional<double> odometer;

        std::uint64_t batterySamples = 0;
        std::optional<double> lastRemaining;
        std::optional<double> lastConsumedTotal;
        std::optional<double> lastRegeneratedTotal;
        double consumed = 0.0;
        double regenerated = 0.0;
        double charged = 0.0;
        std::optional<double> initialSoc;
        std::optional<double> finalSoc;
        std::optional<double> minSoc;

        std::uint32_t chargingSessions = 0;
        double chargingDelivered = 0.0;
        double chargingTime = 0.0;

        // Battery gain per station not yet credited to a session without a reported energy.
        std::map<std::string, double> chargedAt;
        bool sessionEnergyDerived = false;
    };

    struct CompletedEpisode
    {
        unsigned episode;
        SimTime arrival;
    };

    struct TypeAccumulator
    {
        std::uint64_t vehicles = 0;
        SpeedAccumulator speed;
        double waiting = 0.0;
        std::optional<double> sampledWaiting;
        std::optional<double> maxOdometer;
    };

    struct BucketAccumulator
    {
        std::uint64_t samples = 0;
        double speedSum = 0.0;
        std::uint64_t batterySamples = 0;
        double socSum = 0.0;
        std::uint64_t sessionsEnded = 0;
        double energy = 0.0;
    };

    StationUtilizationTracker& stations;
    RunDiagnostics& diagnostics;
    AggregatorSettings settings;

    std::unordered_map<std::string, VehicleAccumulator> open;
    std::unordered_map<std::string, CompletedEpisode> completedEpisodes;
    std::vector<VehicleAggregate> done;

    SpeedAccumulator fleetSpeed;
    std::map<std::string, TypeAccumulator> types;
    std::map<std::int64_t, BucketAccumulator> buckets;
    FleetAggregate totals;
    double tripDurationSum = 0.0;

    void onSample(VehicleSample const& sample);
    void onBattery(BatteryState const& battery, std::string const& chargingStation);
    void onTrip(TripSummary const& trip);
    void onCharging(ChargingEvent const& event, SimTime horizon);

    VehicleAccumulator& openFor(std::string const& vehicleId);
    void finalize(std::string const& vehicleId, VehicleAccumulator& acc, FinalizeReason reason,
                  TripSummary const* trip);
    BucketAccumulator& bucketAt(SimTime t);
    void observeTime(SimTime t);

    static std::optional<SpeedStatistics> statisticsOf(SpeedAccumulator const& acc);
};

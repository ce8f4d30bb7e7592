#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

struct SpeedStatistics
{
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double variance = 0.0;    // population variance, (m/s)^2
};

struct TripFigures
{
    SimTime departure = 0.0;
    SimTime arrival = 0.0;
    double distance = 0.0;
    double duration = 0.0;
    double waitingTime = 0.0;
};

enum class FinalizeReason
{
    TripCompleted,
    InputExhausted
};

char const* finalizeReasonName(FinalizeReason reason) noexcept;

// Metrics of one vehicle episode. Absent optionals mean "no data", not zero.
struct VehicleAggregate
{
    std::string vehicleId;
    std::string vehicleType;
    unsigned episode = 1;
    FinalizeReason reason = FinalizeReason::InputExhausted;

    std::uint64_t sampleCount = 0;
    std::optional<SpeedStatistics> speed;
    std::optional<double> minAcceleration;
    std::optional<double> maxAcceleration;
    double pathDistance = 0.0;
    std::optional<double> odometerDistance;   // furthest odometer reading of the episode
    double stoppedTime = 0.0;
    std::optional<SimTime> firstSeen;
    std::optional<SimTime> lastSeen;

    std::uint64_t batterySampleCount = 0;
    double energyConsumed = 0.0;
    double energyRegenerated = 0.0;
    double energyCharged = 0.0;
    std::optional<double> initialSoc;
    std::optional<double> finalSoc;
    std::optional<double> minSoc;

    std::uint32_t chargingSessions = 0;
    double chargingEnergyDelivered = 0.0;
    double chargingTime = 0.0;

    std::optional<TripFigures> trip;

    std::optional<double> energyPerKm;         // Wh per km of net consumption
    std::optional<double> chargingEfficiency;  // battery gain while charging / energy delivered; absent when
                                               // session energy was itself derived from the battery

    double netEnergy() const noexcept { return energyConsumed - energyRegenerated; }
};

struct StationAggregate
{
    std::string stationId;
    std::string name;
    int capacity = 1;

    std::uint64_t sessions = 0;
    double energyDelivered = 0.0;
    double occupiedDuration = 0.0;   // time with at least one vehicle present
    double totalSessionTime = 0.0;
    double maxSessionTime = 0.0;
    std::uint64_t distinctVehicles = 0;
    std::uint64_t overlapAnomalies = 0;
    int peakConcurrency = 0;
    std::optional<SimTime> firstStart;
    std::optional<SimTime> lastEnd;

    double meanSessionTime() const noexcept { return sessions ? totalSessionTime / sessions : 0.0; }
};

struct VehicleTypeSummary
{
    std::string vehicleType;
    std::uint64_t vehicles = 0;
    std::uint64_t samples = 0;
    std::optional<double> meanSpeed;
    std::optional<double> maxSpeed;
    double totalWaitingTime = 0.0;              // from trip summaries
    std::optional<double> sampledWaitingTime;   // sum of per-sample waiting times
    std::optional<double> maxDistance;          // furthest odometer reading
};

struct FleetAggregate
{
    std::uint64_t vehicles = 0;
    std::uint64_t tripsCompleted = 0;
    std::uint64_t samples = 0;
    std::uint64_t batterySamples = 0;
    std::optional<SpeedStatistics> speed;

    double pathDistance = 0.0;
    double odometerDistance = 0.0;
    double tripDistance = 0.0;
    double energyConsumed = 0.0;
    double energyRegenerated = 0.0;
    double energyCharged = 0.0;
    double chargingEnergyDelivered = 0.0;
    std::uint64_t chargingSessions = 0;

    std::optional<double> meanTripDuration;
    double totalWaitingTime = 0.0;
    std::optional<double> energyPerKm;
    std::optional<double> regenerationRatio;   // regenerated / consumed

    std::optional<SimTime> firstTime;
    std::optional<SimTime> lastTime;

    std::vector<VehicleTypeSummary> types;
};

struct TimelineBucket
{
    SimTime start = 0.0;
    double width = 0.0;
    std::uint64_t samples = 0;
    std::optional<double> meanSpeed;
    std::uint64_t batterySamples = 0;
    std::optional<double> meanSoc;
    std::uint64_t chargingSessionsEnded = 0;
    double energyDelivered = 0.0;
};

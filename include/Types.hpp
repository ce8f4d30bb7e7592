#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <variant>

// Simulation time in seconds since the start of the run.
using SimTime = double;

// Stream order doubles as the tie-break priority for identical timestamps.
enum class StreamKind : int
{
    Position = 0,
    Battery  = 1,
    Trip     = 2,
    Charging = 3
};

inline constexpr int STREAM_KIND_COUNT = 4;

char const* streamKindName(StreamKind kind) noexcept;

// One vehicle at one simulation step.
struct VehicleSample
{
    std::string vehicleId;
    std::string vehicleType;
    SimTime timestamp = 0.0;
    double x = 0.0;
    double y = 0.0;
    double speed = 0.0;                  // m/s
    std::optional<double> acceleration;  // m/s^2
    std::optional<double> odometer;      // distance driven so far (m)
    std::optional<double> waitingTime;   // s
};

struct BatteryState
{
    std::string vehicleId;
    SimTime timestamp = 0.0;
    double remainingEnergy = 0.0;       // Wh
    double stateOfCharge = 0.0;         // fraction in [0, 1]
    std::optional<double> maximumCapacity;
    std::string reportedStation;        // empty when the device reports none

    // Cumulative device counters since departure (Wh), when the stream carries them.
    std::optional<double> totalConsumed;
    std::optional<double> totalRegenerated;
};

// Emitted once per vehicle, at trip completion.
struct TripSummary
{
    std::string vehicleId;
    std::string vehicleType;
    SimTime departure = 0.0;
    SimTime arrival = 0.0;
    double distance = 0.0;              // m
    double duration = 0.0;              // s
    double waitingTime = 0.0;           // s

    // False when the stream gave neither arrival nor duration. The index then
    // holds the trip to the end of input and closes it at the last position sample.
    bool arrivalReported = true;
};

// One charging session, an interval rather than a point sample.
struct ChargingEvent
{
    std::string stationId;
    std::string vehicleId;
    SimTime start = 0.0;
    SimTime end = 0.0;
    double energyDelivered = 0.0;       // Wh
    bool energyReported = true;         // false for sessions assembled from per-step rows
};

using NormalizedRecord = std::variant<VehicleSample, BatteryState, TripSummary, ChargingEvent>;

StreamKind kindOf(NormalizedRecord const& record) noexcept;
std::string const& vehicleIdOf(NormalizedRecord const& record) noexcept;

// Position in the merged sequence: samples at their timestamp, events at their end.
SimTime emissionTimeOf(NormalizedRecord const& record) noexcept;

// Position within the record's own input stream: samples at their timestamp, events at their start.
SimTime orderingKeyOf(NormalizedRecord const& record) noexcept;

// A record leaving the CorrelationIndex, with what the index learned about it.
struct CorrelatedRecord
{
    NormalizedRecord record;
    SimTime emittedAt = 0.0;
    std::uint64_t sequence = 0;

    // Battery states only: station of a charging session of the same vehicle covering this sample.
    std::string chargingStation;

    // Charging events only: no charging event still to come starts before this time.
    SimTime chargingHorizon = 0.0;
};

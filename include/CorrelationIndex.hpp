#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "RecordSource.hpp"
#include "Types.hpp"

class RunDiagnostics;

// Streaming k-way merge of the telemetry streams into one time-ordered sequence.
//
// Records are pulled lazily from whichever stream holds the lowest pending key
// (sample time, or start time for events) and held until nothing still unread
// can precede them. Events are held open until their end time. Memory is bounded
// by the set of active vehicles: a vehicle leaves the set once its trip summary
// has been emitted and nothing else is pending for it. A trip summary without an
// arrival is held to the end of input and closed at the vehicle's last position sample.
class CorrelationIndex
{
public:
    CorrelationIndex(std::vector<std::unique_ptr<RecordSource>> sources, RunDiagnostics& diagnostics);

    // Next record in (emission time, stream priority, arrival) order; nullopt when all streams are drained.
    std::optional<CorrelatedRecord> next();

    // Lowest key any live stream can still produce; +inf once every stream is exhausted.
    SimTime watermark() const noexcept;

    std::size_t activeVehicleCount() const noexcept { return active.size(); }
    std::size_t peakActiveVehicles() const noexcept { return peakActive; }
    std::size_t pendingCount() const noexcept { return pending.size(); }
    std::size_t peakPendingCount() const noexcept { return peakPending; }
    std::uint64_t emittedCount() const noexcept { return emitted; }

private:
    struct Lane
    {
        std::unique_ptr<RecordSource> source;
        StreamKind kind;
        std::optional<NormalizedRecord> head;
        SimTime headKey = 0.0;
        bool started = false;
    };

    struct Pending
    {
        SimTime emitAt;
        int priority;
        std::uint64_t sequence;
        NormalizedRecord record;
    };

    struct ChargingWindow
    {
        SimTime start;
        SimTime end;
        std::string stationId;
    };

    struct VehicleState
    {
        std::size_t pending = 0;
        bool sampleSeen = false;
        bool missingReported = false;
        bool tripEmitted = false;
        std::optional<SimTime> lastSample;
        std::vector<ChargingWindow> charging;
    };

    std::vector<Lane> lanes;
    std::vector<Pending> pending;                  // min-heap on (emitAt, priority, sequence)
    std::multiset<SimTime> pendingChargingStarts;
    std::unordered_map<std::string, VehicleState> active;
    RunDiagnostics& diagnostics;

    std::uint64_t pulled = 0;
    std::uint64_t emitted = 0;
    std::optional<SimTime> lastEmitted;
    std::size_t peakActive = 0;
    std::size_t peakPending = 0;

    static bool later(Pending const& a, Pending const& b) noexcept;

    void advance(Lane& lane);
    Lane* lowestLane();
    bool canEmit(Pending const& candidate) const noexcept;
    void pull(Lane& lane);
    CorrelatedRecord emit();
    SimTime chargingHorizon() const noexcept;
    VehicleState& track(std::string const& vehicleId);
};

#pragma once
#include <map>
#include <string>
#include <unordered_set>
#include <vector>
#include "Aggregates.hpp"
#include "Types.hpp"

class RunDiagnostics;
class StationRegistry;

// Occupancy and throughput per charging station, fed with charging sessions in
// end-time order. Only sessions that a later session could still overlap are kept.
class StationUtilizationTracker
{
public:
    StationUtilizationTracker(StationRegistry const& registry, RunDiagnostics& diagnostics);

    // `horizon`: no session still to come starts before this time.
    void consume(ChargingEvent const& event, SimTime horizon);

    // One aggregate per station seen or registered, sorted by station id.
    std::vector<StationAggregate> finish() const;

    std::size_t retainedSessions() const noexcept;

private:
    struct Session
    {
        SimTime start;
        SimTime end;
        std::string vehicleId;
        int concurrencyAtStart;
        bool flagged;
    };

    struct StationState
    {
        StationAggregate aggregate;
        std::vector<Session> retained;
        std::unordered_set<std::string> vehicles;
    };

    StationRegistry const& registry;
    RunDiagnostics& diagnostics;
    std::map<std::string, StationState> stations;

    StationState& stateFor(std::string const& stationId);
    void raiseConcurrency(StationState& state, Session& session, int concurrency);
    static double coveredWithin(std::vector<Session> const& sessions, SimTime from, SimTime to);
};

#include "StationUtilizationTracker.hpp"
#include <algorithm>
#include <utility>
#include "Diagnostics.hpp"
#include "StationRegistry.hpp"

StationUtilizationTracker::StationUtilizationTracker(StationRegistry const& reg, RunDiagnostics& diag)
    : registry(reg), diagnostics(diag)
{
}

StationUtilizationTracker::StationState& StationUtilizationTracker::stateFor(std::string const& stationId)
{
    auto [it, inserted] = stations.try_emplace(stationId);
    if (inserted)
    {
        it->second.aggregate.stationId = stationId;
        it->second.aggregate.name      = registry.getName(stationId);
        it->second.aggregate.capacity  = registry.getCapacity(stationId);
    }
    return it->second;
}

double StationUtilizationTracker::coveredWithin(std::vector<Session> const& sessions, SimTime from, SimTime to)
{
    std::vector<std::pair<SimTime, SimTime>> pieces;
    for (const auto& s : sessions)
    {
        if (s.end > from && s.start < to)
            pieces.emplace_back(std::max(s.start, from), std::min(s.end, to));
    }
    std::sort(pieces.begin(), pieces.end());

    double covered = 0.0;
    SimTime reach = from;
    for (const auto& [begin, end] : pieces)
    {
        if (end <= reach)
            continue;
        covered += end - std::max(begin, reach);
        reach = end;
    }
    return covered;
}

void StationUtilizationTracker::raiseConcurrency(StationState& state, Session& session, int concurrency)
{
    session.concurrencyAtStart = concurrency;
    state.aggregate.peakConcurrency = std::max(state.aggregate.peakConcurrency, concurrency);

    if (concurrency > state.aggregate.capacity && !session.flagged)
    {
        session.flagged = true;
        state.aggregate.overlapAnomalies++;
        diagnostics.recordOverlap({state.aggregate.stationId, session.vehicleId, session.start,
                                   concurrency, state.aggregate.capacity});
    }
}

void StationUtilizationTracker::consume(ChargingEvent const& event, SimTime horizon)
{
    StationState& state = stateFor(event.stationId);
    StationAggregate& agg = state.aggregate;

    double length = event.end - event.start;
    agg.sessions++;
    agg.energyDelivered += event.energyDelivered;
    agg.totalSessionTime += length;
    agg.maxSessionTime = std::max(agg.maxSessionTime, length);
    agg.firstStart = agg.firstStart ? std::min(*agg.firstStart, event.start) : event.start;
    agg.lastEnd = agg.lastEnd ? std::max(*agg.lastEnd, event.end) : event.end;
    state.vehicles.insert(event.vehicleId);

    agg.occupiedDuration += length - coveredWithin(state.retained, event.start, event.end);

    // Concurrency is evaluated at session starts; an equal start counts toward the later session only.
    int concurrency = 1;
    for (auto& other : state.retained)
    {
        if (other.start <= event.start && event.start < other.end)
            concurrency++;
        else if (event.start < other.start && other.start < event.end)
            raiseConcurrency(state, other, other.concurrencyAtStart + 1);
    }

    Session session{event.start, event.end, event.vehicleId, 1, false};
    raiseConcurrency(state, session, concurrency);
    state.retained.push_back(std::move(session));

    for (auto& [id, s] : stations)
    {
        auto& retained = s.retained;
        retained.erase(std::remove_if(retained.begin(), retained.end(),
                                      [horizon](Session const& r) { return r.end < horizon; }),
                       retained.end());
    }
}

std::vector<StationAggregate> StationUtilizationTracker::finish() const
{
    std::map<std::string, StationAggregate> byId;
    for (const auto& [id, state] : stations)
    {
        StationAggregate agg = state.aggregate;
        agg.distinctVehicles = state.vehicles.size();
        byId.emplace(id, std::move(agg));
    }

    for (const auto& id : registry.stationIds())
    {
        if (byId.count(id))
            continue;
        StationAggregate idle;
        idle.stationId = id;
        idle.name      = registry.getName(id);
        idle.capacity  = registry.getCapacity(id);
        byId.emplace(id, std::move(idle));
    }

    std::vector<StationAggregate> out;
    out.reserve(byId.size());
    for (auto& kv : byId)
        out.push_back(std::move(kv.second));
    return out;
}

std::size_t StationUtilizationTracker::retainedSessions() const noexcept
{
    std::size_t total = 0;
    for (const auto& kv : stations)
        total += kv.second.retained.size();
    return total;
}

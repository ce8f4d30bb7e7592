#include "CorrelationIndex.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include "Diagnostics.hpp"
#include "Errors.hpp"
#include "RecordNormalizer.hpp"

namespace
{
    constexpr SimTime NEVER = std::numeric_limits<SimTime>::infinity();

    int priorityOf(StreamKind kind) noexcept
    {
        return static_cast<int>(kind);
    }
}

CorrelationIndex::CorrelationIndex(std::vector<std::unique_ptr<RecordSource>> sources, RunDiagnostics& diag)
    : diagnostics(diag)
{
    for (auto& source : sources)
    {
        if (!source)
            continue;

        StreamKind kind = source->kind();
        for (const auto& lane : lanes)
        {
            if (lane.kind == kind)
                throw std::invalid_argument(std::string("duplicate source for stream ") + streamKindName(kind));
        }

        Lane lane;
        lane.kind = kind;
        lane.source = std::move(source);
        lanes.push_back(std::move(lane));
    }

    std::sort(lanes.begin(), lanes.end(),
              [](Lane const& a, Lane const& b) { return priorityOf(a.kind) < priorityOf(b.kind); });

    for (auto& lane : lanes)
        advance(lane);
}

bool CorrelationIndex::later(Pending const& a, Pending const& b) noexcept
{
    if (a.emitAt != b.emitAt)
        return a.emitAt > b.emitAt;
    if (a.priority != b.priority)
        return a.priority > b.priority;
    return a.sequence > b.sequence;
}

void CorrelationIndex::advance(Lane& lane)
{
    std::optional<RawRecord> raw = lane.source->next();
    if (!raw)
    {
        lane.head.reset();
        return;
    }

    NormalizedRecord record = RecordNormalizer::normalize(*raw);
    SimTime key = orderingKeyOf(record);

    if (lane.started && key < lane.headKey)
    {
        throw StreamCorrupt(streamKindName(lane.kind),
                            "record at line " + std::to_string(raw->line) + " goes back in time ("
                            + std::to_string(key) + " < " + std::to_string(lane.headKey) + ")");
    }

    lane.started = true;
    lane.headKey = key;
    lane.head = std::move(record);
}

CorrelationIndex::Lane* CorrelationIndex::lowestLane()
{
    Lane* lowest = nullptr;
    for (auto& lane : lanes)
    {
        // Lanes are sorted by priority, so strict comparison keeps the tie-break.
        if (lane.head && (!lowest || lane.headKey < lowest->headKey))
            lowest = &lane;
    }
    return lowest;
}

SimTime CorrelationIndex::watermark() const noexcept
{
    SimTime mark = NEVER;
    for (const auto& lane : lanes)
    {
        if (lane.head)
            mark = std::min(mark, lane.headKey);
    }
    return mark;
}

bool CorrelationIndex::canEmit(Pending const& candidate) const noexcept
{
    // Anything a live lane can still produce sorts at or after (headKey, lane priority).
    for (const auto& lane : lanes)
    {
        if (!lane.head)
            continue;
        if (lane.headKey < candidate.emitAt)
            return false;
        if (lane.headKey == candidate.emitAt && priorityOf(lane.kind) < candidate.priority)
            return false;
    }
    return true;
}

CorrelationIndex::VehicleState& CorrelationIndex::track(std::string const& vehicleId)
{
    auto [it, inserted] = active.try_emplace(vehicleId);
    if (inserted)
        peakActive = std::max(peakActive, active.size());
    return it->second;
}

void CorrelationIndex::pull(Lane& lane)
{
    NormalizedRecord record = std::move(*lane.head);
    lane.head.reset();

    VehicleState& vehicle = track(vehicleIdOf(record));
    vehicle.pending++;

    if (auto const* event = std::get_if<ChargingEvent>(&record))
    {
        vehicle.charging.push_back({event->start, event->end, event->stationId});
        pendingChargingStarts.insert(event->start);
    }

    pending.push_back({emissionTimeOf(record), priorityOf(lane.kind), pulled++, std::move(record)});
    std::push_heap(pending.begin(), pending.end(), later);
    peakPending = std::max(peakPending, pending.size());

    advance(lane);
}

SimTime CorrelationIndex::chargingHorizon() const noexcept
{
    SimTime horizon = pendingChargingStarts.empty() ? NEVER : *pendingChargingStarts.begin();
    for (const auto& lane : lanes)
    {
        if (lane.kind == StreamKind::Charging && lane.head)
            horizon = std::min(horizon, lane.headKey);
    }
    return horizon;
}

CorrelatedRecord CorrelationIndex::emit()
{
    std::pop_heap(pending.begin(), pending.end(), later);
    Pending item = std::move(pending.back());
    pending.pop_back();

    CorrelatedRecord out;
    out.sequence = emitted++;

    std::string const vehicleId = vehicleIdOf(item.record);
    StreamKind kind = kindOf(item.record);
    VehicleState& vehicle = active.at(vehicleId);
    vehicle.pending--;

    // A trip summary closes the episode; anything but a straggling charging
    // session after that belongs to the id's next episode.
    if (vehicle.tripEmitted && kind != StreamKind::Charging)
    {
        vehicle.tripEmitted = false;
        vehicle.sampleSeen = false;
        vehicle.missingReported = false;
        vehicle.lastSample.reset();
    }

    if (auto const* sample = std::get_if<VehicleSample>(&item.record))
    {
        vehicle.sampleSeen = true;
        vehicle.lastSample = sample->timestamp;
    }
    else if (!vehicle.sampleSeen && !vehicle.missingReported && !vehicle.tripEmitted)
    {
        diagnostics.recordMissingCorrelation(vehicleId, kind, item.emitAt);
        vehicle.missingReported = true;
    }

    if (auto const* battery = std::get_if<BatteryState>(&item.record))
    {
        for (const auto& window : vehicle.charging)
        {
            if (window.start < battery->timestamp && battery->timestamp <= window.end)
            {
                out.chargingStation = window.stationId;
                break;
            }
        }
    }
    else if (auto const* event = std::get_if<ChargingEvent>(&item.record))
    {
        auto window = std::find_if(vehicle.charging.begin(), vehicle.charging.end(),
                                   [event](ChargingWindow const& w)
                                   {
                                       return w.start == event->start && w.end == event->end
                                           && w.stationId == event->stationId;
                                   });
        if (window != vehicle.charging.end())
            vehicle.charging.erase(window);

        auto start = pendingChargingStarts.find(event->start);
        if (start != pendingChargingStarts.end())
            pendingChargingStarts.erase(start);

        out.chargingHorizon = chargingHorizon();
    }
    else if (auto* trip = std::get_if<TripSummary>(&item.record))
    {
        if (!trip->arrivalReported)
        {
            trip->arrival  = std::max(trip->departure, vehicle.lastSample.value_or(trip->departure));
            trip->duration = trip->arrival - trip->departure;
            item.emitAt    = lastEmitted ? std::max(trip->arrival, *lastEmitted) : trip->arrival;
        }
        vehicle.tripEmitted = true;
    }

    out.emittedAt = item.emitAt;
    lastEmitted = item.emitAt;

    if (vehicle.tripEmitted && vehicle.pending == 0)
        active.erase(vehicleId);

    out.record = std::move(item.record);
    return out;
}

std::optional<CorrelatedRecord> CorrelationIndex::next()
{
    for (;;)
    {
        if (!pending.empty() && canEmit(pending.front()))
            return emit();

        Lane* lane = lowestLane();
        if (!lane)
            return std::nullopt;

        pull(*lane);
    }
}

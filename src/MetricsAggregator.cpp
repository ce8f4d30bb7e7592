#include "MetricsAggregator.hpp"
#include <algorithm>
#include <cmath>
#include "Diagnostics.hpp"
#include "RecordNormalizer.hpp"
#include "StationUtilizationTracker.hpp"

namespace ba = boost::accumulators;

namespace
{
    constexpr double ENERGY_TOLERANCE = 1e-6;   // Wh
}

char const* finalizeReasonName(FinalizeReason reason) noexcept
{
    return reason == FinalizeReason::TripCompleted ? "trip completed" : "input exhausted";
}

MetricsAggregator::MetricsAggregator(StationUtilizationTracker& tracker, RunDiagnostics& diag,
                                     AggregatorSettings s)
    : stations(tracker), diagnostics(diag), settings(s)
{
    if (settings.timelineBucket <= 0.0)
        settings.timelineBucket = 60.0;
}

std::optional<SpeedStatistics> MetricsAggregator::statisticsOf(SpeedAccumulator const& acc)
{
    if (ba::count(acc) == 0)
        return std::nullopt;

    SpeedStatistics stats;
    stats.min      = ba::min(acc);
    stats.max      = ba::max(acc);
    stats.mean     = ba::mean(acc);
    stats.variance = ba::variance(acc);
    return stats;
}

void MetricsAggregator::consume(CorrelatedRecord const& correlated)
{
    observeTime(correlated.emittedAt);

    std::visit([this, &correlated](auto const& record)
    {
        using T = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<T, VehicleSample>)
            onSample(record);
        else if constexpr (std::is_same_v<T, BatteryState>)
            onBattery(record, correlated.chargingStation);
        else if constexpr (std::is_same_v<T, TripSummary>)
            onTrip(record);
        else
            onCharging(record, correlated.chargingHorizon);
    }, correlated.record);
}

void MetricsAggregator::observeTime(SimTime t)
{
    totals.firstTime = totals.firstTime ? std::min(*totals.firstTime, t) : t;
    totals.lastTime  = totals.lastTime ? std::max(*totals.lastTime, t) : t;
}

MetricsAggregator::BucketAccumulator& MetricsAggregator::bucketAt(SimTime t)
{
    auto index = static_cast<std::int64_t>(std::floor(t / settings.timelineBucket));
    return buckets[index];
}

MetricsAggregator::VehicleAccumulator& MetricsAggregator::openFor(std::string const& vehicleId)
{
    auto it = open.find(vehicleId);
    if (it != open.end())
        return it->second;

    VehicleAccumulator& acc = open[vehicleId];
    acc.vehicleType = RecordNormalizer::UNKNOWN_TYPE;

    auto completed = completedEpisodes.find(vehicleId);
    if (completed != completedEpisodes.end())
    {
        acc.episode = completed->second.episode + 1;
        diagnostics.recordRecycledId(vehicleId);
    }
    return acc;
}

void MetricsAggregator::onSample(VehicleSample const& sample)
{
    VehicleAccumulator& acc = openFor(sample.vehicleId);
    if (acc.vehicleType == RecordNormalizer::UNKNOWN_TYPE)
        acc.vehicleType = sample.vehicleType;

    acc.speed(sample.speed);
    fleetSpeed(sample.speed);
    totals.samples++;

    TypeAccumulator& type = types[sample.vehicleType];
    type.speed(sample.speed);
    if (sample.waitingTime)
        type.sampledWaiting = type.sampledWaiting.value_or(0.0) + *sample.waitingTime;

    if (sample.odometer)
    {
        double odometer = *sample.odometer;
        acc.odometer = acc.odometer ? std::max(*acc.odometer, odometer) : odometer;
        type.maxOdometer = type.maxOdometer ? std::max(*type.maxOdometer, odometer) : odometer;
    }

    if (sample.acceleration)
    {
        double a = *sample.acceleration;
        acc.minAcceleration = acc.minAcceleration ? std::min(*acc.minAcceleration, a) : a;
        acc.maxAcceleration = acc.maxAcceleration ? std::max(*acc.maxAcceleration, a) : a;
    }

    if (acc.last)
    {
        double dt = sample.timestamp - acc.last->timestamp;
        acc.pathDistance += std::hypot(sample.x - acc.last->x, sample.y - acc.last->y);
        if (acc.last->speed <= settings.stopSpeedThreshold)
            acc.stoppedTime += dt;
    }
    acc.last = LastSample{sample.timestamp, sample.x, sample.y, sample.speed};

    acc.firstSeen = acc.firstSeen ? std::min(*acc.firstSeen, sample.timestamp) : sample.timestamp;
    acc.lastSeen  = sample.timestamp;

    BucketAccumulator& bucket = bucketAt(sample.timestamp);
    bucket.samples++;
    bucket.speedSum += sample.speed;
}

void MetricsAggregator::onBattery(BatteryState const& battery, std::string const& chargingStation)
{
    VehicleAccumulator& acc = openFor(battery.vehicleId);
    acc.batterySamples++;
    totals.batterySamples++;

    std::string const& station = chargingStation.empty() ? battery.reportedStation : chargingStation;
    bool counters = battery.totalConsumed && battery.totalRegenerated;
    double gain = 0.0;

    if (counters && (!acc.lastRemaining || acc.lastConsumedTotal))
    {
        // Device counters start from zero at departure.
        double consumedStep    = *battery.totalConsumed - acc.lastConsumedTotal.value_or(0.0);
        double regeneratedStep = *battery.totalRegenerated - acc.lastRegeneratedTotal.value_or(0.0);
        acc.consumed    += std::max(0.0, consumedStep);
        acc.regenerated += std::max(0.0, regeneratedStep);

        // Whatever the counters do not explain came from a charger.
        if (acc.lastRemaining)
            gain = battery.remainingEnergy - *acc.lastRemaining + consumedStep - regeneratedStep;
    }
    else if (acc.lastRemaining)
    {
        double delta = battery.remainingEnergy - *acc.lastRemaining;
        if (delta < 0.0)
            acc.consumed -= delta;
        else if (station.empty())
            acc.regenerated += delta;
        else
            gain = delta;
    }

    if (gain > ENERGY_TOLERANCE)
    {
        acc.charged += gain;
        if (!station.empty())
            acc.chargedAt[station] += gain;
    }

    acc.lastRemaining = battery.remainingEnergy;
    acc.lastConsumedTotal    = counters ? battery.totalConsumed : std::nullopt;
    acc.lastRegeneratedTotal = counters ? battery.totalRegenerated : std::nullopt;

    if (!acc.initialSoc)
        acc.initialSoc = battery.stateOfCharge;
    acc.finalSoc = battery.stateOfCharge;
    acc.minSoc = acc.minSoc ? std::min(*acc.minSoc, battery.stateOfCharge) : battery.stateOfCharge;

    acc.firstSeen = acc.firstSeen ? std::min(*acc.firstSeen, battery.timestamp) : battery.timestamp;
    acc.lastSeen  = acc.lastSeen ? std::max(*acc.lastSeen, battery.timestamp) : battery.timestamp;

    BucketAccumulator& bucket = bucketAt(battery.timestamp);
    bucket.batterySamples++;
    bucket.socSum += battery.stateOfCharge;
}

void MetricsAggregator::onTrip(TripSummary const& trip)
{
    VehicleAccumulator& acc = openFor(trip.vehicleId);
    if (acc.vehicleType == RecordNormalizer::UNKNOWN_TYPE)
        acc.vehicleType = trip.vehicleType;

    finalize(trip.vehicleId, acc, FinalizeReason::TripCompleted, &trip);
}

void MetricsAggregator::onCharging(ChargingEvent const& reported, SimTime horizon)
{
    ChargingEvent event = reported;

    // A session that began before the id's last trip ended belongs to that trip,
    // which is finalized and stays immutable, even when the id is back on the road.
    auto completed = completedEpisodes.find(event.vehicleId);
    bool late = completed != completedEpisodes.end()
             && (open.count(event.vehicleId) == 0 || event.start < completed->second.arrival);

    if (late)
    {
        diagnostics.recordLateCharging(event.vehicleId);
    }
    else
    {
        VehicleAccumulator& acc = openFor(event.vehicleId);
        if (!event.energyReported)
        {
            auto gain = acc.chargedAt.find(event.stationId);
            if (gain != acc.chargedAt.end())
            {
                event.energyDelivered = gain->second;
                acc.chargedAt.erase(gain);
            }
            acc.sessionEnergyDerived = true;
        }

        acc.chargingSessions++;
        acc.chargingDelivered += event.energyDelivered;
        acc.chargingTime += event.end - event.start;
    }

    totals.chargingSessions++;
    totals.chargingEnergyDelivered += event.energyDelivered;

    BucketAccumulator& bucket = bucketAt(event.end);
    bucket.sessionsEnded++;
    bucket.energy += event.energyDelivered;

    stations.consume(event, horizon);
}

void MetricsAggregator::finalize(std::string const& vehicleId, VehicleAccumulator& acc,
                                 FinalizeReason reason, TripSummary const* trip)
{
    VehicleAggregate out;
    out.vehicleId     = vehicleId;
    out.vehicleType   = acc.vehicleType;
    out.episode       = acc.episode;
    out.reason        = reason;
    out.sampleCount   = ba::count(acc.speed);
    out.speed         = statisticsOf(acc.speed);
    out.minAcceleration = acc.minAcceleration;
    out.maxAcceleration = acc.maxAcceleration;
    out.pathDistance  = acc.pathDistance;
    out.odometerDistance = acc.odometer;
    out.stoppedTime   = acc.stoppedTime;
    out.firstSeen     = acc.firstSeen;
    out.lastSeen      = acc.lastSeen;

    out.batterySampleCount = acc.batterySamples;
    out.energyConsumed     = acc.consumed;
    out.energyRegenerated  = acc.regenerated;
    out.energyCharged      = acc.charged;
    out.initialSoc         = acc.initialSoc;
    out.finalSoc           = acc.finalSoc;
    out.minSoc             = acc.minSoc;

    out.chargingSessions        = acc.chargingSessions;
    out.chargingEnergyDelivered = acc.chargingDelivered;
    out.chargingTime            = acc.chargingTime;

    if (trip)
    {
        out.trip = TripFigures{trip->departure, trip->arrival, trip->distance, trip->duration, trip->waitingTime};
        totals.tripsCompleted++;
        totals.tripDistance += trip->distance;
        totals.totalWaitingTime += trip->waitingTime;
        tripDurationSum += trip->duration;
        types[out.vehicleType].waiting += trip->waitingTime;
    }

    double distance = out.trip ? out.trip->distance : out.odometerDistance.value_or(out.pathDistance);
    if (out.batterySampleCount > 0 && distance > 0.0)
        out.energyPerKm = out.netEnergy() / (distance / 1000.0);
    if (out.chargingEnergyDelivered > 0.0 && !acc.sessionEnergyDerived)
        out.chargingEfficiency = out.energyCharged / out.chargingEnergyDelivered;

    totals.vehicles++;
    totals.pathDistance      += out.pathDistance;
    totals.odometerDistance  += out.odometerDistance.value_or(0.0);
    totals.energyConsumed    += out.energyConsumed;
    totals.energyRegenerated += out.energyRegenerated;
    totals.energyCharged     += out.energyCharged;
    types[out.vehicleType].vehicles++;

    if (reason == FinalizeReason::TripCompleted)
        completedEpisodes[vehicleId] = CompletedEpisode{out.episode, trip->arrival};
    else
        diagnostics.recordUnfinishedTrip(vehicleId);

    done.push_back(std::move(out));
    open.erase(vehicleId);
}

void MetricsAggregator::finish()
{
    std::vector<std::string> ids;
    ids.reserve(open.size());
    for (const auto& kv : open)
        ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    for (const auto& id : ids)
        finalize(id, open.at(id), FinalizeReason::InputExhausted, nullptr);
}

FleetAggregate MetricsAggregator::fleet() const
{
    FleetAggregate out = totals;
    out.speed = statisticsOf(fleetSpeed);

    if (out.tripsCompleted > 0)
        out.meanTripDuration = tripDurationSum / out.tripsCompleted;

    double distance = out.tripDistance > 0.0 ? out.tripDistance
                    : out.odometerDistance > 0.0 ? out.odometerDistance : out.pathDistance;
    if (out.batterySamples > 0 && distance > 0.0)
        out.energyPerKm = (out.energyConsumed - out.energyRegenerated) / (distance / 1000.0);
    if (out.energyConsumed > 0.0)
        out.regenerationRatio = out.energyRegenerated / out.energyConsumed;

    for (const auto& [name, acc] : types)
    {
        VehicleTypeSummary row;
        row.vehicleType      = name;
        row.vehicles         = acc.vehicles;
        row.samples          = ba::count(acc.speed);
        row.totalWaitingTime = acc.waiting;
        row.sampledWaitingTime = acc.sampledWaiting;
        row.maxDistance      = acc.maxOdometer;
        if (row.samples > 0)
        {
            row.meanSpeed = ba::mean(acc.speed);
            row.maxSpeed  = ba::max(acc.speed);
        }
        out.types.push_back(std::move(row));
    }
    return out;
}

std::vector<TimelineBucket> MetricsAggregator::timeline() const
{
    std::vector<TimelineBucket> out;
    out.reserve(buckets.size());
    for (const auto& [index, acc] : buckets)
    {
        TimelineBucket b;
        b.start = static_cast<double>(index) * settings.timelineBucket;
        b.width = settings.timelineBucket;
        b.samples = acc.samples;
        if (acc.samples > 0)
            b.meanSpeed = acc.speedSum / acc.samples;
        b.batterySamples = acc.batterySamples;
        if (acc.batterySamples > 0)
            b.meanSoc = acc.socSum / acc.batterySamples;
        b.chargingSessionsEnded = acc.sessionsEnded;
        b.energyDelivered = acc.energy;
        out.push_back(b);
    }
    return out;
}

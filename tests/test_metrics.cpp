#include <cassert>
#include <iostream>
#include <limits>
#include "MetricsAggregator.hpp"
#include "StationRegistry.hpp"
#include "StationUtilizationTracker.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace
{
    constexpr double NEVER = std::numeric_limits<double>::infinity();

    CorrelatedRecord sample(std::string const& id, SimTime t, double x, double speed,
                            std::string const& type = "car")
    {
        VehicleSample s;
        s.vehicleId = id;
        s.vehicleType = type;
        s.timestamp = t;
        s.x = x;
        s.speed = speed;

        CorrelatedRecord r;
        r.record = s;
        r.emittedAt = t;
        return r;
    }

    CorrelatedRecord battery(std::string const& id, SimTime t, double remaining, double soc,
                             std::string const& chargingStation = "")
    {
        BatteryState b;
        b.vehicleId = id;
        b.timestamp = t;
        b.remainingEnergy = remaining;
        b.stateOfCharge = soc;

        CorrelatedRecord r;
        r.record = b;
        r.emittedAt = t;
        r.chargingStation = chargingStation;
        return r;
    }

    CorrelatedRecord trip(std::string const& id, SimTime departure, SimTime arrival, double distance,
                          std::string const& type = "car")
    {
        TripSummary t;
        t.vehicleId = id;
        t.vehicleType = type;
        t.departure = departure;
        t.arrival = arrival;
        t.duration = arrival - departure;
        t.distance = distance;

        CorrelatedRecord r;
        r.record = t;
        r.emittedAt = arrival;
        return r;
    }

    CorrelatedRecord charging(std::string const& station, std::string const& id, SimTime start, SimTime end,
                              double energy)
    {
        ChargingEvent c;
        c.stationId = station;
        c.vehicleId = id;
        c.start = start;
        c.end = end;
        c.energyDelivered = energy;

        CorrelatedRecord r;
        r.record = c;
        r.emittedAt = end;
        r.chargingHorizon = NEVER;
        return r;
    }

    CorrelatedRecord meteredSample(std::string const& id, SimTime t, double x, double speed,
                                   double odometer, double waiting, std::string const& type = "car")
    {
        CorrelatedRecord r = sample(id, t, x, speed, type);
        VehicleSample& s = std::get<VehicleSample>(r.record);
        s.odometer = odometer;
        s.waitingTime = waiting;
        return r;
    }

    CorrelatedRecord meteredBattery(std::string const& id, SimTime t, double remaining,
                                    double consumedTotal, double regeneratedTotal,
                                    std::string const& chargingStation = "")
    {
        CorrelatedRecord r = battery(id, t, remaining, remaining / 2000.0, chargingStation);
        BatteryState& b = std::get<BatteryState>(r.record);
        b.totalConsumed = consumedTotal;
        b.totalRegenerated = regeneratedTotal;
        return r;
    }

    VehicleAggregate const* find(std::vector<VehicleAggregate> const& all, std::string const& id, unsigned episode = 1)
    {
        for (const auto& v : all)
        {
            if (v.vehicleId == id && v.episode == episode)
                return &v;
        }
        return nullptr;
    }
}

bool test_speed_statistics_and_trip()
{
    std::cout << "Testing speed statistics of a completed trip..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(sample("V1", 0, 0, 0));
    metrics.consume(sample("V1", 1, 10, 10));
    metrics.consume(sample("V1", 2, 30, 20));
    assert(metrics.openCount() == 1);
    metrics.consume(trip("V1", 0, 2, 30));
    assert(metrics.openCount() == 0);

    auto const* v1 = find(metrics.finalized(), "V1");
    assert(v1);
    assert(v1->reason == FinalizeReason::TripCompleted);
    assert(v1->sampleCount == 3);
    assert(v1->speed);
    assert(near(v1->speed->mean, 10.0));
    assert(near(v1->speed->max, 20.0));
    assert(near(v1->speed->min, 0.0));
    assert(near(v1->speed->variance, 200.0 / 3.0, 1e-9));
    assert(v1->trip);
    assert(near(v1->trip->distance, 30.0));
    assert(near(v1->trip->duration, 2.0));
    assert(near(v1->pathDistance, 30.0));
    assert(near(v1->stoppedTime, 1.0));
    assert(v1->firstSeen && near(*v1->firstSeen, 0.0));
    assert(v1->lastSeen && near(*v1->lastSeen, 2.0));
    assert(!v1->energyPerKm);

    std::cout << " PASS\n";
    return true;
}

bool test_trip_without_samples()
{
    std::cout << "Testing trip without samples..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(trip("V2", 10, 40, 500, "bus"));

    auto const* v2 = find(metrics.finalized(), "V2");
    assert(v2);
    assert(v2->sampleCount == 0);
    assert(!v2->speed);
    assert(v2->vehicleType == "bus");
    assert(v2->trip);
    assert(near(v2->trip->distance, 500.0));
    assert(near(v2->trip->duration, 30.0));

    std::cout << " PASS\n";
    return true;
}

bool test_energy_accounting()
{
    std::cout << "Testing energy accounting..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(sample("V3", 0, 0, 5));
    metrics.consume(battery("V3", 0, 1000, 1.0));
    metrics.consume(battery("V3", 1, 900, 0.9));
    metrics.consume(battery("V3", 2, 950, 0.95));
    metrics.consume(sample("V3", 2, 1000, 5));
    metrics.consume(battery("V3", 3, 1000, 1.0, "cs_1"));
    metrics.consume(charging("cs_1", "V3", 2, 3, 60));
    metrics.finish();

    auto const* v3 = find(metrics.finalized(), "V3");
    assert(v3);
    assert(v3->reason == FinalizeReason::InputExhausted);
    assert(!v3->trip);
    assert(v3->batterySampleCount == 4);
    assert(near(v3->energyConsumed, 100.0));
    assert(near(v3->energyRegenerated, 50.0));
    assert(near(v3->energyCharged, 50.0));
    assert(v3->initialSoc && near(*v3->initialSoc, 1.0));
    assert(v3->finalSoc && near(*v3->finalSoc, 1.0));
    assert(v3->minSoc && near(*v3->minSoc, 0.9));
    assert(v3->chargingSessions == 1);
    assert(near(v3->chargingEnergyDelivered, 60.0));
    assert(near(v3->chargingTime, 1.0));
    assert(v3->energyPerKm && near(*v3->energyPerKm, 50.0));
    assert(v3->chargingEfficiency && near(*v3->chargingEfficiency, 50.0 / 60.0));

    assert(diag.unfinishedTrips().size() == 1);
    assert(diag.unfinishedTrips()[0] == "V3");

    FleetAggregate fleet = metrics.fleet();
    assert(fleet.vehicles == 1);
    assert(fleet.tripsCompleted == 0);
    assert(!fleet.meanTripDuration);
    assert(fleet.regenerationRatio && near(*fleet.regenerationRatio, 0.5));

    std::cout << " PASS\n";
    return true;
}

bool test_late_charging_and_id_reuse()
{
    std::cout << "Testing late charging and recycled ids..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(sample("V4", 0, 0, 1));
    metrics.consume(trip("V4", 0, 1, 10));
    metrics.consume(charging("cs_9", "V4", 0.5, 3, 20));

    metrics.consume(sample("V4", 5, 0, 2));
    metrics.consume(trip("V4", 5, 6, 10));
    metrics.finish();

    auto const& all = metrics.finalized();
    assert(all.size() == 2);

    auto const* first = find(all, "V4", 1);
    auto const* second = find(all, "V4", 2);
    assert(first && second);
    assert(first->chargingSessions == 0);
    assert(second->sampleCount == 1);
    assert(second->speed && near(second->speed->mean, 2.0));

    assert(diag.lateChargingVehicles().size() == 1);
    assert(diag.recycledIds().size() == 1);
    assert(diag.unfinishedTrips().empty());

    auto stationRows = stations.finish();
    assert(stationRows.size() == 1);
    assert(stationRows[0].sessions == 1);

    // The id is back on the road before a session that began during its first trip ends.
    RunDiagnostics reuseDiag;
    StationUtilizationTracker reuseStations(registry, reuseDiag);
    MetricsAggregator reuse(reuseStations, reuseDiag);

    reuse.consume(sample("v1", 0, 0, 1));
    reuse.consume(sample("v1", 1, 1, 1));
    reuse.consume(trip("v1", 0, 1, 1));
    reuse.consume(sample("v1", 2, 2, 1));
    reuse.consume(charging("cs_1", "v1", 0.5, 3, 20));
    reuse.consume(charging("cs_1", "v1", 3, 4, 5));
    reuse.finish();

    auto const* earlier = find(reuse.finalized(), "v1", 1);
    auto const* later = find(reuse.finalized(), "v1", 2);
    assert(earlier && later);
    assert(earlier->chargingSessions == 0);
    assert(later->chargingSessions == 1);
    assert(near(later->chargingEnergyDelivered, 5.0));
    assert(later->reason == FinalizeReason::InputExhausted);
    assert(reuseDiag.lateChargingVehicles().size() == 1);
    assert(reuseDiag.lateChargingVehicles()[0] == "v1");
    assert(reuseDiag.recycledIds().size() == 1);

    std::cout << " PASS\n";
    return true;
}

bool test_odometer_and_sampled_waiting()
{
    std::cout << "Testing odometer distance and per-sample waiting..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(meteredSample("a", 0, 0, 0, 0, 0));
    metrics.consume(battery("a", 0, 1000, 0.5));
    metrics.consume(meteredSample("a", 1, 10, 10, 12, 1));
    metrics.consume(meteredSample("a", 2, 30, 20, 35, 2));
    metrics.consume(battery("a", 2, 965, 0.48));
    metrics.consume(sample("b", 0, 0, 1, "bus"));
    metrics.finish();

    auto const* a = find(metrics.finalized(), "a");
    assert(a);
    assert(near(a->pathDistance, 30.0));
    assert(a->odometerDistance && near(*a->odometerDistance, 35.0));
    assert(near(a->energyConsumed, 35.0));
    // 35 Wh over the 35 m the odometer shows, not the 30 m of the sampled path.
    assert(a->energyPerKm && near(*a->energyPerKm, 1000.0, 1e-6));

    auto const* b = find(metrics.finalized(), "b");
    assert(b && !b->odometerDistance);

    FleetAggregate fleet = metrics.fleet();
    assert(near(fleet.odometerDistance, 35.0));
    assert(fleet.energyPerKm && near(*fleet.energyPerKm, 1000.0, 1e-6));

    assert(fleet.types.size() == 2);
    VehicleTypeSummary const& bus = fleet.types[0];
    VehicleTypeSummary const& car = fleet.types[1];
    assert(bus.vehicleType == "bus" && car.vehicleType == "car");
    assert(!bus.sampledWaitingTime && !bus.maxDistance);
    assert(car.sampledWaitingTime && near(*car.sampledWaitingTime, 3.0));
    assert(car.maxDistance && near(*car.maxDistance, 35.0));
    assert(near(car.totalWaitingTime, 0.0));

    std::cout << " PASS\n";
    return true;
}

bool test_cumulative_energy_counters()
{
    std::cout << "Testing cumulative energy counters..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    MetricsAggregator metrics(stations, diag);

    metrics.consume(sample("e", 0, 0, 5));
    metrics.consume(meteredBattery("e", 0, 1000, 0, 0));
    metrics.consume(meteredBattery("e", 1, 950, 60, 10));
    // Level unchanged, yet the device consumed and regenerated 50 Wh each.
    metrics.consume(meteredBattery("e", 2, 950, 110, 60));
    metrics.consume(meteredBattery("e", 3, 1030, 120, 60, "cs_2"));

    ChargingEvent session;
    session.stationId = "cs_2";
    session.vehicleId = "e";
    session.start = 2;
    session.end = 3;
    session.energyReported = false;
    CorrelatedRecord derived;
    derived.record = session;
    derived.emittedAt = 3;
    derived.chargingHorizon = NEVER;
    metrics.consume(derived);

    // Counters count from departure, so a first sample books them whole.
    metrics.consume(meteredBattery("w", 5, 500, 40, 5));
    metrics.finish();

    auto const* e = find(metrics.finalized(), "e");
    assert(e);
    assert(near(e->energyConsumed, 120.0));
    assert(near(e->energyRegenerated, 60.0));
    assert(near(e->energyCharged, 90.0));
    assert(e->chargingSessions == 1);
    assert(near(e->chargingEnergyDelivered, 90.0));
    assert(!e->chargingEfficiency);

    auto const* w = find(metrics.finalized(), "w");
    assert(w);
    assert(near(w->energyConsumed, 40.0));
    assert(near(w->energyRegenerated, 5.0));
    assert(near(w->energyCharged, 0.0));

    auto stationRows = stations.finish();
    assert(stationRows.size() == 1);
    assert(stationRows[0].stationId == "cs_2");
    assert(near(stationRows[0].energyDelivered, 90.0));

    std::cout << " PASS\n";
    return true;
}

bool test_fleet_types_and_timeline()
{
    std::cout << "Testing fleet summary, types and timeline..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker stations(registry, diag);
    AggregatorSettings settings;
    settings.timelineBucket = 10.0;
    MetricsAggregator metrics(stations, diag, settings);

    metrics.consume(sample("a", 0, 0, 4, "car"));
    metrics.consume(sample("b", 5, 0, 8, "bus"));
    metrics.consume(battery("a", 6, 500, 0.5));
    metrics.consume(sample("a", 12, 3, 6, "car"));
    metrics.consume(trip("a", 0, 12, 40, "car"));
    metrics.consume(trip("b", 5, 15, 60, "bus"));

    FleetAggregate fleet = metrics.fleet();
    assert(fleet.vehicles == 2);
    assert(fleet.tripsCompleted == 2);
    assert(fleet.samples == 3);
    assert(fleet.speed && near(fleet.speed->mean, 6.0));
    assert(near(fleet.tripDistance, 100.0));
    assert(fleet.meanTripDuration && near(*fleet.meanTripDuration, 11.0));
    assert(fleet.firstTime && near(*fleet.firstTime, 0.0));
    assert(fleet.lastTime && near(*fleet.lastTime, 15.0));

    assert(fleet.types.size() == 2);
    assert(fleet.types[0].vehicleType == "bus");
    assert(fleet.types[0].vehicles == 1);
    assert(fleet.types[1].vehicleType == "car");
    assert(fleet.types[1].samples == 2);
    assert(fleet.types[1].meanSpeed && near(*fleet.types[1].meanSpeed, 5.0));

    auto timeline = metrics.timeline();
    assert(timeline.size() == 2);
    assert(near(timeline[0].start, 0.0));
    assert(timeline[0].samples == 2);
    assert(timeline[0].meanSpeed && near(*timeline[0].meanSpeed, 6.0));
    assert(timeline[0].batterySamples == 1);
    assert(timeline[0].meanSoc && near(*timeline[0].meanSoc, 0.5));
    assert(near(timeline[1].start, 10.0));
    assert(timeline[1].samples == 1);
    assert(!timeline[1].meanSoc);

    std::cout << " PASS\n";
    return true;
}

int main()
{
    std::cout << "============================================================================\n";
    std::cout << "METRICS AGGREGATOR TESTS\n";
    std::cout << "============================================================================\n\n";

    try
    {
        bool all_passed = true;

        all_passed &= test_speed_statistics_and_trip();
        all_passed &= test_trip_without_samples();
        all_passed &= test_energy_accounting();
        all_passed &= test_late_charging_and_id_reuse();
        all_passed &= test_odometer_and_sampled_waiting();
        all_passed &= test_cumulative_energy_counters();
        all_passed &= test_fleet_types_and_timeline();

        std::cout << "\n============================================================================\n";
        if (!all_passed)
        {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All metrics tests PASSED\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

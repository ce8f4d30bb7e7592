#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include "StationRegistry.hpp"
#include "StationUtilizationTracker.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace
{
    constexpr double NEVER = std::numeric_limits<double>::infinity();

    ChargingEvent session(std::string const& station, std::string const& vehicle, SimTime start, SimTime end,
                          double energy = 1.0)
    {
        ChargingEvent e;
        e.stationId = station;
        e.vehicleId = vehicle;
        e.start = start;
        e.end = end;
        e.energyDelivered = energy;
        return e;
    }
}

bool test_single_session()
{
    std::cout << "Testing single charging session..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker tracker(registry, diag);

    tracker.consume(session("S1", "V2", 5, 8, 12), NEVER);
    auto rows = tracker.finish();

    assert(rows.size() == 1);
    StationAggregate const& s1 = rows[0];
    assert(s1.stationId == "S1");
    assert(s1.name == "S1");
    assert(s1.capacity == 1);
    assert(s1.sessions == 1);
    assert(near(s1.energyDelivered, 12.0));
    assert(near(s1.occupiedDuration, 3.0));
    assert(s1.overlapAnomalies == 0);
    assert(s1.peakConcurrency == 1);
    assert(s1.distinctVehicles == 1);
    assert(near(s1.meanSessionTime(), 3.0));
    assert(diag.overlapAnomalies().empty());
    assert(tracker.retainedSessions() == 0);

    std::cout << " PASS\n";
    return true;
}

bool test_overlap_beyond_capacity()
{
    std::cout << "Testing overlap beyond capacity..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker tracker(registry, diag);

    // End order: the inner session finishes first while the outer one is still pending.
    tracker.consume(session("A", "v2", 5, 8), 0.0);
    tracker.consume(session("A", "v1", 0, 10), NEVER);
    auto rows = tracker.finish();

    assert(rows.size() == 1);
    assert(rows[0].sessions == 2);
    assert(near(rows[0].occupiedDuration, 10.0));
    assert(rows[0].peakConcurrency == 2);
    assert(rows[0].overlapAnomalies == 1);
    assert(near(rows[0].maxSessionTime, 10.0));

    auto const& anomalies = diag.overlapAnomalies();
    assert(anomalies.size() == 1);
    assert(anomalies[0].stationId == "A");
    assert(anomalies[0].vehicleId == "v2");
    assert(near(anomalies[0].at, 5.0));
    assert(anomalies[0].concurrency == 2);
    assert(anomalies[0].capacity == 1);

    std::cout << " PASS\n";
    return true;
}

bool test_capacity_from_registry()
{
    std::cout << "Testing multi-slot station capacity..." << std::flush;

    StationRegistry registry;
    registry.add("B", "Bay", 2);
    registry.add("D", "Idle depot", 4);
    RunDiagnostics diag;
    StationUtilizationTracker tracker(registry, diag);

    tracker.consume(session("B", "v2", 5, 8), 0.0);
    tracker.consume(session("B", "v1", 0, 10), NEVER);
    auto rows = tracker.finish();

    assert(rows.size() == 2);
    assert(rows[0].stationId == "B");
    assert(rows[0].name == "Bay");
    assert(rows[0].capacity == 2);
    assert(rows[0].peakConcurrency == 2);
    assert(rows[0].overlapAnomalies == 0);
    assert(rows[1].stationId == "D");
    assert(rows[1].sessions == 0);
    assert(rows[1].capacity == 4);
    assert(diag.overlapAnomalies().empty());

    std::cout << " PASS\n";
    return true;
}

bool test_equal_starts_count_once()
{
    std::cout << "Testing sessions starting together..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker tracker(registry, diag);

    tracker.consume(session("C", "v1", 0, 4), 0.0);
    tracker.consume(session("C", "v2", 0, 6), NEVER);
    auto rows = tracker.finish();

    assert(rows[0].overlapAnomalies == 1);
    assert(rows[0].peakConcurrency == 2);
    assert(near(rows[0].occupiedDuration, 6.0));
    assert(diag.overlapAnomalies().size() == 1);
    assert(diag.overlapAnomalies()[0].vehicleId == "v2");

    std::cout << " PASS\n";
    return true;
}

bool test_sessions_are_pruned()
{
    std::cout << "Testing retained sessions are pruned..." << std::flush;

    StationRegistry registry;
    RunDiagnostics diag;
    StationUtilizationTracker tracker(registry, diag);

    const int sessions = 1000;
    for (int i = 0; i < sessions; ++i)
    {
        SimTime start = 2.0 * i;
        SimTime horizon = i + 1 < sessions ? 2.0 * (i + 1) : NEVER;
        tracker.consume(session("E", "v" + std::to_string(i % 7), start, start + 1, 2.0), horizon);
        assert(tracker.retainedSessions() <= 1);
    }

    auto rows = tracker.finish();
    assert(rows[0].sessions == static_cast<std::uint64_t>(sessions));
    assert(near(rows[0].occupiedDuration, 1.0 * sessions));
    assert(near(rows[0].energyDelivered, 2.0 * sessions));
    assert(rows[0].distinctVehicles == 7);
    assert(rows[0].overlapAnomalies == 0);
    assert(rows[0].firstStart && near(*rows[0].firstStart, 0.0));
    assert(rows[0].lastEnd && near(*rows[0].lastEnd, 2.0 * (sessions - 1) + 1));

    std::cout << " PASS\n";
    return true;
}

bool test_registry_file()
{
    std::cout << "Testing station registry file..." << std::flush;

    ScratchDir dir("registry");
    std::string path = dir.write("stations.csv",
                                 "station_id,name,capacity\r\n"
                                 "cs_1,Depot North,3\r\n"
                                 "\r\n"
                                 "cs_2,,many\r\n"
                                 "cs_3,\"Depot, South\",2\r\n");

    StationRegistry registry(path);
    assert(registry.size() == 3);
    assert(registry.getName("cs_3") == "Depot, South");
    assert(registry.getCapacity("cs_3") == 2);
    assert(registry.exists("cs_1"));
    assert(registry.getName("cs_1") == "Depot North");
    assert(registry.getCapacity("cs_1") == 3);
    assert(registry.getName("cs_2") == "cs_2");
    assert(registry.getCapacity("cs_2") == StationRegistry::DEFAULT_CAPACITY);
    assert(registry.getCapacity("unknown") == StationRegistry::DEFAULT_CAPACITY);
    assert(registry.stationIds().front() == "cs_1");

    bool threw = false;
    try
    {
        StationRegistry missing(dir.path("missing.csv"));
    }
    catch (std::runtime_error const&)
    {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
    return true;
}

int main()
{
    std::cout << "============================================================================\n";
    std::cout << "STATION UTILIZATION TESTS\n";
    std::cout << "============================================================================\n\n";

    try
    {
        bool all_passed = true;

        all_passed &= test_single_session();
        all_passed &= test_overlap_beyond_capacity();
        all_passed &= test_capacity_from_registry();
        all_passed &= test_equal_starts_count_once();
        all_passed &= test_sessions_are_pruned();
        all_passed &= test_registry_file();

        std::cout << "\n============================================================================\n";
        if (!all_passed)
        {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All station tests PASSED\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include "ReportAssembler.hpp"
#include "ReportExporter.hpp"
#include "SQLiteStore.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

bool test_text_report()
{
    std::cout << "Testing text report..." << std::flush;

    ScratchDir dir("outputs_report");
    PipelineConfig config = writeScenario(dir);
    PipelineResult result = TelemetryPipeline(config).run();

    std::string report = ReportAssembler::render(result, config);
    assert(report.find("FLEET TELEMETRY REPORT") != std::string::npos);
    assert(report.find("no data") != std::string::npos);
    assert(report.find("Missing correlations: 1") != std::string::npos);
    assert(report.find("Station overlap anomalies: 0") != std::string::npos);
    assert(report.find("V4") != std::string::npos);
    assert(report.find("S1") != std::string::npos);
    assert(report.find("RUN ABORTED") == std::string::npos);

    std::cout << " PASS\n";
    return true;
}

bool test_format_duration()
{
    std::cout << "Testing duration formatting..." << std::flush;

    assert(ReportAssembler::formatDuration(0.0) == "00:00:00");
    assert(ReportAssembler::formatDuration(3725.0) == "01:02:05");
    assert(ReportAssembler::formatDuration(std::numeric_limits<double>::quiet_NaN()) == "no data");

    std::cout << " PASS\n";
    return true;
}

bool test_sqlite_store()
{
    std::cout << "Testing report database..." << std::flush;

    ScratchDir dir("outputs_sqlite");
    PipelineResult result = TelemetryPipeline(writeScenario(dir)).run();

    SQLiteStore store(dir.path("report.db"));
    for (int pass = 0; pass < 2; ++pass)
    {
        store.writeReport(result);

        assert(store.countRows("VehicleAggregates") == 4);
        assert(store.countRows("StationAggregates") == 1);
        assert(store.countRows("StreamDiagnostics") == 4);
        // V4 missing correlation plus three vehicles closed without a trip summary.
        assert(store.countRows("Anomalies") == 4);
    }

    auto meanSpeed = store.queryDouble("SELECT meanSpeed FROM VehicleAggregates WHERE vehicleId = 'V1';");
    assert(meanSpeed && near(*meanSpeed, 10.0));

    auto missingSpeed = store.queryDouble("SELECT meanSpeed FROM VehicleAggregates WHERE vehicleId = 'V4';");
    assert(!missingSpeed);

    auto occupied = store.queryDouble("SELECT occupiedDuration FROM StationAggregates WHERE stationId = 'S1';");
    assert(occupied && near(*occupied, 3.0));

    auto malformed = store.queryDouble("SELECT malformed FROM StreamDiagnostics WHERE stream = 'positions';");
    assert(malformed && near(*malformed, 1.0));

    std::cout << " PASS\n";
    return true;
}

bool test_protobuf_export()
{
    std::cout << "Testing protobuf export..." << std::flush;

    ScratchDir dir("outputs_export");
    PipelineResult result = TelemetryPipeline(writeScenario(dir)).run();

    std::string path = dir.path("report.pb");
    ReportExporter::save(result, path);
    fleettrace::FleetReport report = ReportExporter::load(path);

    assert(report.records_merged() == 12);
    assert(report.vehicles_size() == 4);
    assert(report.stations_size() == 1);
    assert(report.stations(0).station_id() == "S1");
    assert(near(report.stations(0).occupied_duration(), 3.0));
    assert(report.diagnostics().missing_correlations_size() == 1);
    assert(report.diagnostics().missing_correlations(0).vehicle_id() == "V4");
    assert(!report.diagnostics().has_abort_reason());
    assert(report.fleet().trips_completed() == 1);

    for (const auto& v : report.vehicles())
    {
        if (v.vehicle_id() == "V4")
            assert(!v.has_speed());
        if (v.vehicle_id() == "V1")
        {
            assert(v.has_speed() && near(v.speed().mean(), 10.0));
            assert(v.reason() == fleettrace::VehicleAggregate::TRIP_COMPLETED);
            assert(v.has_trip());
        }
    }

    bool threw = false;
    try
    {
        ReportExporter::load(dir.path("missing.pb"));
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
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    std::cout << "============================================================================\n";
    std::cout << "REPORT OUTPUT TESTS\n";
    std::cout << "============================================================================\n\n";

    try
    {
        bool all_passed = true;

        all_passed &= test_text_report();
        all_passed &= test_format_duration();
        all_passed &= test_sqlite_store();
        all_passed &= test_protobuf_export();

        std::cout << "\n============================================================================\n";
        if (!all_passed)
        {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All output tests PASSED\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}

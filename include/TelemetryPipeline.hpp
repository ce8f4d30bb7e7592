#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Aggregates.hpp"
#include "Diagnostics.hpp"
#include "MetricsAggregator.hpp"

namespace boost::asio { class thread_pool; }
class RecordSource;

struct PipelineConfig
{
    std::string positions;          // required
    std::string battery;            // empty: stream absent
    std::string trips;
    std::string charging;
    std::string stations;           // optional station registry CSV

    std::uint64_t malformedThreshold = 100;
    bool prefetch = false;
    std::size_t prefetchCapacity = 1024;
    AggregatorSettings aggregator;
};

struct IndexFigures
{
    std::uint64_t recordsMerged = 0;
    std::size_t peakActiveVehicles = 0;
    std::size_t peakPendingRecords = 0;
};

struct PipelineResult
{
    std::vector<VehicleAggregate> vehicles;
    std::vector<StationAggregate> stations;
    FleetAggregate fleet;
    std::vector<TimelineBucket> timeline;
    IndexFigures index;
    RunDiagnostics diagnostics;
};

// One batch run: streams -> index -> aggregator/tracker -> result.
class TelemetryPipeline
{
public:
    explicit TelemetryPipeline(PipelineConfig config);

    // Throws StreamCorrupt when a stream turns out to be unusable; the cause is
    // kept in diagnostics() and no partial aggregates are returned.
    PipelineResult run();

    RunDiagnostics const& diagnostics() const noexcept { return diag; }
    PipelineConfig const& config() const noexcept { return settings; }

private:
    PipelineConfig settings;
    RunDiagnostics diag;

    std::vector<std::unique_ptr<RecordSource>> openSources(boost::asio::thread_pool* pool);
};

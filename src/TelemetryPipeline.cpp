#include "TelemetryPipeline.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <boost/asio/thread_pool.hpp>
#include "CorrelationIndex.hpp"
#include "Errors.hpp"
#include "PrefetchSource.hpp"
#include "StationRegistry.hpp"
#include "StationUtilizationTracker.hpp"
#include "StreamReader.hpp"

TelemetryPipeline::TelemetryPipeline(PipelineConfig config)
    : settings(std::move(config))
{
    if (settings.positions.empty())
        throw std::runtime_error("A position stream is required.");
}

std::vector<std::unique_ptr<RecordSource>> TelemetryPipeline::openSources(boost::asio::thread_pool* pool)
{
    std::pair<StreamKind, std::string const*> const inputs[] = {
        {StreamKind::Position, &settings.positions},
        {StreamKind::Battery,  &settings.battery},
        {StreamKind::Trip,     &settings.trips},
        {StreamKind::Charging, &settings.charging},
    };

    std::vector<std::unique_ptr<RecordSource>> sources;
    for (const auto& [kind, path] : inputs)
    {
        if (path->empty())
        {
            std::cout << "[Pipeline] No " << streamKindName(kind) << " stream supplied" << std::endl;
            continue;
        }

        std::unique_ptr<RecordSource> reader = StreamReader::open(*path, kind, diag, settings.malformedThreshold);
        if (pool)
            reader = std::make_unique<PrefetchSource>(std::move(reader), *pool, settings.prefetchCapacity);
        sources.push_back(std::move(reader));
    }
    return sources;
}

PipelineResult TelemetryPipeline::run()
{
    diag = RunDiagnostics{};

    StationRegistry registry;
    if (!settings.stations.empty())
        registry = StationRegistry(settings.stations);

    // Declared before the sources so every producer has been joined before the pool goes.
    std::optional<boost::asio::thread_pool> pool;
    if (settings.prefetch)
        pool.emplace(STREAM_KIND_COUNT);

    try
    {
        CorrelationIndex index(openSources(pool ? &*pool : nullptr), diag);
        StationUtilizationTracker tracker(registry, diag);
        MetricsAggregator aggregator(tracker, diag, settings.aggregator);

        std::cout << "[Pipeline] Correlating streams"
                  << (settings.prefetch ? " (prefetch enabled)" : "") << "..." << std::endl;

        while (auto record = index.next())
            aggregator.consume(*record);

        aggregator.finish();

        PipelineResult result;
        result.vehicles = aggregator.finalized();
        result.stations = tracker.finish();
        result.fleet    = aggregator.fleet();
        result.timeline = aggregator.timeline();
        result.index.recordsMerged      = index.emittedCount();
        result.index.peakActiveVehicles = index.peakActiveVehicles();
        result.index.peakPendingRecords = index.peakPendingCount();
        result.diagnostics = diag;

        std::cout << "[Pipeline] Merged " << result.index.recordsMerged << " records, "
                  << result.vehicles.size() << " vehicle episodes, "
                  << result.stations.size() << " stations (peak active vehicles "
                  << result.index.peakActiveVehicles << ")" << std::endl;
        return result;
    }
    catch (StreamCorrupt const& e)
    {
        diag.recordAbort(e.what());
        std::cerr << "[Pipeline] Run aborted: " << e.what() << std::endl;
        throw;
    }
}

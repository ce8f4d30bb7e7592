#include "Diagnostics.hpp"
#include <utility>
#include "Errors.hpp"

StreamCounters& RunDiagnostics::stream(StreamKind kind)
{
    return streams[static_cast<std::size_t>(kind)];
}

StreamCounters const& RunDiagnostics::stream(StreamKind kind) const
{
    return streams[static_cast<std::size_t>(kind)];
}

void RunDiagnostics::recordMalformed(StreamKind kind, MalformedRecord const& error)
{
    StreamCounters& counters = stream(kind);
    counters.malformed++;
    if (counters.malformedSamples.size() < MAX_MALFORMED_SAMPLES)
        counters.malformedSamples.emplace_back(error.what());
}

void RunDiagnostics::recordMissingCorrelation(std::string const& vehicleId, StreamKind kind, SimTime at)
{
    missing.push_back({vehicleId, kind, at});
}

void RunDiagnostics::recordOverlap(OverlapAnomaly anomaly)
{
    overlaps.push_back(std::move(anomaly));
}

void RunDiagnostics::recordLateCharging(std::string const& vehicleId)
{
    lateCharging.push_back(vehicleId);
}

void RunDiagnostics::recordUnfinishedTrip(std::string const& vehicleId)
{
    unfinished.push_back(vehicleId);
}

void RunDiagnostics::recordRecycledId(std::string const& vehicleId)
{
    recycled.push_back(vehicleId);
}

void RunDiagnostics::recordAbort(std::string const& cause)
{
    abortCause = cause;
}

std::uint64_t RunDiagnostics::totalMalformed() const noexcept
{
    std::uint64_t total = 0;
    for (const auto& s : streams)
        total += s.malformed;
    return total;
}

std::uint64_t RunDiagnostics::caveatCount() const noexcept
{
    return totalMalformed()
         + missing.size()
         + overlaps.size()
         + lateCharging.size()
         + unfinished.size();
}

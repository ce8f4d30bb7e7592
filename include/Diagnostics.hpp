#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "Types.hpp"

class MalformedRecord;

struct StreamCounters
{
    std::string source;                  // path, or empty when the stream was not supplied
    bool present = false;
    std::uint64_t recordsRead = 0;       // data rows seen, malformed included
    std::uint64_t malformed = 0;
    std::vector<std::string> malformedSamples;
};

struct MissingCorrelation
{
    std::string vehicleId;
    StreamKind kind;                     // stream that referenced the vehicle first
    SimTime at = 0.0;
};

struct OverlapAnomaly
{
    std::string stationId;
    std::string vehicleId;               // session whose start exceeded capacity
    SimTime at = 0.0;
    int concurrency = 0;
    int capacity = 1;
};

// Data-quality state of one pipeline run. Owned by the run and passed by reference
// to every component; each stream's reader only touches its own counters.
class RunDiagnostics
{
public:
    static constexpr std::size_t MAX_MALFORMED_SAMPLES = 5;

    StreamCounters& stream(StreamKind kind);
    StreamCounters const& stream(StreamKind kind) const;

    void recordMalformed(StreamKind kind, MalformedRecord const& error);
    void recordMissingCorrelation(std::string const& vehicleId, StreamKind kind, SimTime at);
    void recordOverlap(OverlapAnomaly anomaly);
    void recordLateCharging(std::string const& vehicleId);
    void recordUnfinishedTrip(std::string const& vehicleId);
    void recordRecycledId(std::string const& vehicleId);
    void recordAbort(std::string const& cause);

    std::uint64_t totalMalformed() const noexcept;
    std::vector<MissingCorrelation> const& missingCorrelations() const noexcept { return missing; }
    std::vector<OverlapAnomaly> const& overlapAnomalies() const noexcept { return overlaps; }
    std::vector<std::string> const& lateChargingVehicles() const noexcept { return lateCharging; }
    std::vector<std::string> const& unfinishedTrips() const noexcept { return unfinished; }
    std::vector<std::string> const& recycledIds() const noexcept { return recycled; }

    bool aborted() const noexcept { return !abortCause.empty(); }
    std::string const& abortReason() const noexcept { return abortCause; }

    // Number of caveats the report has to state alongside the metrics.
    std::uint64_t caveatCount() const noexcept;

private:
    std::array<StreamCounters, STREAM_KIND_COUNT> streams;
    std::vector<MissingCorrelation> missing;
    std::vector<OverlapAnomaly> overlaps;
    std::vector<std::string> lateCharging;
    std::vector<std::string> unfinished;
    std::vector<std::string> recycled;
    std::string abortCause;
};

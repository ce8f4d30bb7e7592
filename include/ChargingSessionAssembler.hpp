#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "RecordSource.hpp"

// Turns per-step charging rows (timestep, vehicle, station) into charging sessions.
//
// Consecutive rows of a vehicle at the same station form one session covering
// (first step - step length, last step]. A session closes when the vehicle shows up
// at another station, skips more than half a step past the next expected row, or the
// input ends. Sessions come out in start order, without a delivered-energy figure.
class ChargingSessionAssembler : public RecordSource
{
public:
    explicit ChargingSessionAssembler(std::unique_ptr<RecordSource> steps);

    std::optional<RawRecord> next() override;
    StreamKind kind() const noexcept override { return StreamKind::Charging; }

    // Step length assumed until two distinct timesteps have been read.
    static constexpr double DEFAULT_STEP = 1.0;

private:
    struct Session
    {
        std::string stationId;
        std::string vehicleId;
        SimTime first = 0.0;
        SimTime last = 0.0;
        std::size_t line = 0;
        std::uint64_t order = 0;
    };

    std::unique_ptr<RecordSource> steps;
    std::unordered_map<std::string, Session> open;   // by vehicle
    std::vector<Session> closed;                     // sorted by (first, order)
    double stepLength = DEFAULT_STEP;
    bool stepKnown = false;
    bool started = false;
    bool exhausted = false;
    SimTime current = 0.0;
    std::uint64_t opened = 0;

    void read();
    void observeStep(SimTime t, std::size_t line);
    void close(Session session);
    void closeStale();
    bool releasable() const;
    RawRecord toRecord(Session const& session) const;
};

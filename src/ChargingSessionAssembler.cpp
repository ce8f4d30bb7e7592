#include "ChargingSessionAssembler.hpp"
#include <algorithm>
#include "Errors.hpp"

namespace
{
    // A vehicle missing from more than this many steps has left the station.
    constexpr double GAP_TOLERANCE = 1.5;

    void setText(RawRecord& record, std::size_t field, std::string const& text)
    {
        record.values[field].present = true;
        record.values[field].text = text;
    }

    void setNumber(RawRecord& record, std::size_t field, double number)
    {
        record.values[field].present = true;
        record.values[field].number = number;
        record.values[field].text = std::to_string(number);
    }
}

ChargingSessionAssembler::ChargingSessionAssembler(std::unique_ptr<RecordSource> source)
    : steps(std::move(source))
{
}

std::optional<RawRecord> ChargingSessionAssembler::next()
{
    while (!releasable())
    {
        if (exhausted)
            return std::nullopt;
        read();
    }

    RawRecord record = toRecord(closed.front());
    closed.erase(closed.begin());
    return record;
}

void ChargingSessionAssembler::read()
{
    std::optional<RawRecord> row = steps->next();
    if (!row)
    {
        exhausted = true;
        for (auto& kv : open)
            close(std::move(kv.second));
        open.clear();
        return;
    }

    SimTime t = row->scaled(ChargingSampleField::Time);
    observeStep(t, row->line);
    closeStale();

    std::string const& vehicleId = row->text(ChargingSampleField::VehicleId);
    std::string const& stationId = row->text(ChargingSampleField::StationId);

    auto it = open.find(vehicleId);
    if (it != open.end())
    {
        if (it->second.stationId == stationId)
        {
            it->second.last = t;
            return;
        }
        close(std::move(it->second));
        open.erase(it);
    }

    Session session;
    session.stationId = stationId;
    session.vehicleId = vehicleId;
    session.first = t;
    session.last = t;
    session.line = row->line;
    session.order = opened++;
    open.emplace(vehicleId, std::move(session));
}

void ChargingSessionAssembler::observeStep(SimTime t, std::size_t line)
{
    if (started && t < current)
    {
        throw StreamCorrupt(streamKindName(StreamKind::Charging),
                            "charging row at line " + std::to_string(line) + " goes back in time ("
                            + std::to_string(t) + " < " + std::to_string(current) + ")");
    }

    if (started && t > current)
    {
        double gap = t - current;
        stepLength = stepKnown ? std::min(stepLength, gap) : gap;
        stepKnown = true;
    }

    started = true;
    current = t;
}

void ChargingSessionAssembler::closeStale()
{
    for (auto it = open.begin(); it != open.end();)
    {
        if (current > it->second.last + GAP_TOLERANCE * stepLength)
        {
            close(std::move(it->second));
            it = open.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void ChargingSessionAssembler::close(Session session)
{
    auto position = std::upper_bound(closed.begin(), closed.end(), session,
                                     [](Session const& a, Session const& b)
                                     {
                                         return a.first != b.first ? a.first < b.first : a.order < b.order;
                                     });
    closed.insert(position, std::move(session));
}

bool ChargingSessionAssembler::releasable() const
{
    if (closed.empty())
        return false;

    // Rows still to come cannot start before the current step, but an open session may.
    Session const& front = closed.front();
    for (const auto& kv : open)
    {
        Session const& s = kv.second;
        if (s.first < front.first || (s.first == front.first && s.order < front.order))
            return false;
    }
    return true;
}

RawRecord ChargingSessionAssembler::toRecord(Session const& session) const
{
    RawRecord record;
    record.kind = StreamKind::Charging;
    record.line = session.line;
    record.values.resize(ChargingField::Energy + 1);

    setText(record, ChargingField::StationId, session.stationId);
    setText(record, ChargingField::VehicleId, session.vehicleId);
    // Each row reports the step ending at its timestep.
    setNumber(record, ChargingField::Start, session.first - stepLength);
    setNumber(record, ChargingField::End, session.last);
    return record;
}

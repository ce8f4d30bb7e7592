#include "Types.hpp"
#include <limits>

char const* streamKindName(StreamKind kind) noexcept
{
    switch (kind)
    {
        case StreamKind::Position: return "positions";
        case StreamKind::Battery:  return "battery";
        case StreamKind::Trip:     return "trips";
        case StreamKind::Charging: return "charging";
    }
    return "unknown";
}

namespace
{
    struct KindVisitor
    {
        StreamKind operator()(VehicleSample const&) const { return StreamKind::Position; }
        StreamKind operator()(BatteryState const&) const  { return StreamKind::Battery; }
        StreamKind operator()(TripSummary const&) const   { return StreamKind::Trip; }
        StreamKind operator()(ChargingEvent const&) const { return StreamKind::Charging; }
    };

    struct EmissionVisitor
    {
        SimTime operator()(VehicleSample const& r) const { return r.timestamp; }
        SimTime operator()(BatteryState const& r) const  { return r.timestamp; }
        SimTime operator()(TripSummary const& r) const
        {
            return r.arrivalReported ? r.arrival : std::numeric_limits<SimTime>::infinity();
        }
        SimTime operator()(ChargingEvent const& r) const { return r.end; }
    };

    struct OrderingVisitor
    {
        SimTime operator()(VehicleSample const& r) const { return r.timestamp; }
        SimTime operator()(BatteryState const& r) const  { return r.timestamp; }
        SimTime operator()(TripSummary const& r) const   { return r.departure; }
        SimTime operator()(ChargingEvent const& r) const { return r.start; }
    };
}

StreamKind kindOf(NormalizedRecord const& record) noexcept
{
    return std::visit(KindVisitor{}, record);
}

std::string const& vehicleIdOf(NormalizedRecord const& record) noexcept
{
    return std::visit([](auto const& r) -> std::string const& { return r.vehicleId; }, record);
}

SimTime emissionTimeOf(NormalizedRecord const& record) noexcept
{
    return std::visit(EmissionVisitor{}, record);
}

SimTime orderingKeyOf(NormalizedRecord const& record) noexcept
{
    return std::visit(OrderingVisitor{}, record);
}

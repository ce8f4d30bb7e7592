#include "RecordNormalizer.hpp"
#include <algorithm>

namespace
{
    std::optional<double> optionalField(RawRecord const& raw, std::size_t field)
    {
        if (!raw.has(field))
            return std::nullopt;
        return raw.scaled(field);
    }

    std::string typeOrUnknown(RawRecord const& raw, std::size_t field)
    {
        return raw.has(field) ? raw.text(field) : RecordNormalizer::UNKNOWN_TYPE;
    }
}

NormalizedRecord RecordNormalizer::normalize(RawRecord const& raw)
{
    switch (raw.kind)
    {
        case StreamKind::Position: return toVehicleSample(raw);
        case StreamKind::Battery:  return toBatteryState(raw);
        case StreamKind::Trip:     return toTripSummary(raw);
        case StreamKind::Charging: return toChargingEvent(raw);
    }
    return toVehicleSample(raw);
}

VehicleSample RecordNormalizer::toVehicleSample(RawRecord const& raw)
{
    VehicleSample s;
    s.vehicleId    = raw.text(PositionField::VehicleId);
    s.vehicleType  = typeOrUnknown(raw, PositionField::VehicleType);
    s.timestamp    = raw.scaled(PositionField::Time);
    s.x            = raw.scaled(PositionField::X);
    s.y            = raw.scaled(PositionField::Y);
    s.speed        = raw.scaled(PositionField::Speed);
    s.acceleration = optionalField(raw, PositionField::Acceleration);
    s.odometer     = optionalField(raw, PositionField::Odometer);
    s.waitingTime  = optionalField(raw, PositionField::Waiting);
    return s;
}

BatteryState RecordNormalizer::toBatteryState(RawRecord const& raw)
{
    BatteryState b;
    b.vehicleId       = raw.text(BatteryField::VehicleId);
    b.timestamp       = raw.scaled(BatteryField::Time);
    b.remainingEnergy = raw.scaled(BatteryField::Remaining);
    b.maximumCapacity = optionalField(raw, BatteryField::MaxCapacity);
    b.totalConsumed   = optionalField(raw, BatteryField::TotalConsumed);
    b.totalRegenerated = optionalField(raw, BatteryField::TotalRegenerated);

    if (raw.has(BatteryField::StateOfCharge))
        b.stateOfCharge = raw.scaled(BatteryField::StateOfCharge);
    else if (b.maximumCapacity && *b.maximumCapacity > 0.0)
        b.stateOfCharge = b.remainingEnergy / *b.maximumCapacity;
    b.stateOfCharge = std::clamp(b.stateOfCharge, 0.0, 1.0);

    // The battery device writes "NULL" when the vehicle is not at a station.
    if (raw.has(BatteryField::ReportedStation) && raw.text(BatteryField::ReportedStation) != "NULL")
        b.reportedStation = raw.text(BatteryField::ReportedStation);
    return b;
}

TripSummary RecordNormalizer::toTripSummary(RawRecord const& raw)
{
    TripSummary t;
    t.vehicleId   = raw.text(TripField::VehicleId);
    t.vehicleType = typeOrUnknown(raw, TripField::VehicleType);
    t.departure   = raw.scaled(TripField::Departure);
    t.distance    = raw.scaled(TripField::Distance);
    t.waitingTime = raw.has(TripField::Waiting) ? raw.scaled(TripField::Waiting) : 0.0;

    if (raw.has(TripField::Arrival))
    {
        t.arrival  = raw.scaled(TripField::Arrival);
        t.duration = raw.has(TripField::Duration) ? raw.scaled(TripField::Duration) : t.arrival - t.departure;
    }
    else if (raw.has(TripField::Duration))
    {
        t.duration = raw.scaled(TripField::Duration);
        t.arrival  = t.departure + t.duration;
    }
    else
    {
        t.arrival = t.departure;
        t.arrivalReported = false;
    }
    return t;
}

ChargingEvent RecordNormalizer::toChargingEvent(RawRecord const& raw)
{
    ChargingEvent c;
    c.stationId       = raw.text(ChargingField::StationId);
    c.vehicleId       = raw.text(ChargingField::VehicleId);
    c.start           = raw.scaled(ChargingField::Start);
    c.end             = raw.scaled(ChargingField::End);
    c.energyReported  = raw.has(ChargingField::Energy);
    c.energyDelivered = c.energyReported ? raw.scaled(ChargingField::Energy) : 0.0;
    return c;
}

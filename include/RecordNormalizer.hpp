#pragma once
#include "RecordSchema.hpp"
#include "Types.hpp"

class RecordNormalizer
{
public:
    static NormalizedRecord normalize(RawRecord const& raw);

    static VehicleSample toVehicleSample(RawRecord const& raw);
    static BatteryState toBatteryState(RawRecord const& raw);
    static TripSummary toTripSummary(RawRecord const& raw);
    static ChargingEvent toChargingEvent(RawRecord const& raw);

    static inline const std::string UNKNOWN_TYPE = "unknown";
};

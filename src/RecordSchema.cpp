#include "RecordSchema.hpp"
#include <stdexcept>

namespace
{
    // Column names follow the CSV exports of the simulation runner; SUMO's own
    // attribute names are accepted as aliases.
    RecordSchema makePositionSchema()
    {
        RecordSchema s;
        s.kind = StreamKind::Position;
        s.fields = {
            {"time",         FieldType::Number, true,  {{"timestep_sec"}, {"time"}, {"timestamp"}}},
            {"vehicle_id",   FieldType::Text,   true,  {{"vehicle_id"}, {"id"}, {"vehicle"}}},
            {"vehicle_type", FieldType::Text,   false, {{"vehicle_type"}, {"type"}, {"vType"}}},
            {"x",            FieldType::Number, true,  {{"x_position_m"}, {"x"}}},
            {"y",            FieldType::Number, true,  {{"y_position_m"}, {"y"}}},
            {"speed",        FieldType::Number, true,  {{"speed_ms"}, {"speed"}, {"speed_kmh", 1.0 / 3.6}}},
            {"acceleration", FieldType::Number, false, {{"acceleration"}, {"accel"}}},
            {"odometer",     FieldType::Number, false, {{"distance_traveled_m"}, {"distance"}, {"odometer"}}},
            {"waiting",      FieldType::Number, false, {{"waiting_time_sec"}, {"waiting"}, {"waitingTime"}}},
        };
        return s;
    }

    RecordSchema makeBatterySchema()
    {
        RecordSchema s;
        s.kind = StreamKind::Battery;
        s.fields = {
            {"time",             FieldType::Number, true,  {{"timestep_sec"}, {"time"}, {"timestamp"}}},
            {"vehicle_id",       FieldType::Text,   true,  {{"vehicle_id"}, {"id"}, {"vehicle"}}},
            {"remaining_energy", FieldType::Number, true,  {{"actualBatteryCapacity_Wh"}, {"remaining_energy_wh"},
                                                            {"actualBatteryCapacity"}, {"remaining_energy_kwh", 1000.0}}},
            {"max_capacity",     FieldType::Number, false, {{"maximumBatteryCapacity_Wh"}, {"max_capacity_wh"},
                                                            {"maximumBatteryCapacity"}}},
            {"soc",              FieldType::Number, false, {{"soc"}, {"state_of_charge"},
                                                            {"battery_soc_percent", 0.01}}},
            {"station",          FieldType::Text,   false, {{"chargingStationId"}, {"charging_station"}}},
            {"total_consumed",   FieldType::Number, false, {{"totalEnergyConsumed_Wh"}, {"totalEnergyConsumed"}}},
            {"total_regenerated", FieldType::Number, false, {{"totalEnergyRegenerated_Wh"}, {"totalEnergyRegenerated"}}},
        };
        s.requireAny = {{BatteryField::StateOfCharge, BatteryField::MaxCapacity}};
        return s;
    }

    RecordSchema makeTripSchema()
    {
        RecordSchema s;
        s.kind = StreamKind::Trip;
        s.fields = {
            {"vehicle_id",   FieldType::Text,   true,  {{"vehicle_id"}, {"id"}, {"vehicle"}}},
            {"vehicle_type", FieldType::Text,   false, {{"vehicle_type"}, {"vType"}, {"type"}}},
            {"departure",    FieldType::Number, true,  {{"depart_time"}, {"depart"}, {"departure"}}},
            {"arrival",      FieldType::Number, false, {{"arrival_time"}, {"arrival"}}},
            {"duration",     FieldType::Number, false, {{"duration"}, {"duration_sec"}}},
            {"distance",     FieldType::Number, true,  {{"total_distance_m"}, {"final_distance"},
                                                        {"routeLength"}, {"route_length"}, {"distance"}}},
            {"waiting",      FieldType::Number, false, {{"total_waiting_time"}, {"waitingTime"}, {"waiting_time"}}},
        };
        // Without an arrival or a duration the trip ends at the vehicle's last position sample.
        return s;
    }

    RecordSchema makeChargingSchema()
    {
        RecordSchema s;
        s.kind = StreamKind::Charging;
        s.fields = {
            {"station_id", FieldType::Text,   true, {{"station_id"}, {"charging_station"}, {"chargingStationId"}}},
            {"vehicle_id", FieldType::Text,   true, {{"vehicle_id"}, {"vehicle"}, {"id"}}},
            {"start",      FieldType::Number, true, {{"start_time"}, {"start"}}},
            {"end",        FieldType::Number, true, {{"end_time"}, {"end"}}},
            {"energy",     FieldType::Number, true, {{"energy_delivered_wh"}, {"energy_wh"}, {"energy"},
                                                     {"totalEnergyCharged"}, {"energy_delivered_kwh", 1000.0}}},
        };
        return s;
    }

    // One row per simulation step while a vehicle sits at a station.
    RecordSchema makeChargingSampleSchema()
    {
        RecordSchema s;
        s.kind = StreamKind::Charging;
        s.chargingSamples = true;
        s.fields = {
            {"time",       FieldType::Number, true, {{"timestep"}, {"timestep_sec"}, {"time"}}},
            {"vehicle_id", FieldType::Text,   true, {{"vehicle_id"}, {"vehicle"}, {"id"}}},
            {"station_id", FieldType::Text,   true, {{"charging_station"}, {"chargingStationId"}, {"station_id"}}},
        };
        return s;
    }
}

RecordSchema const& RecordSchema::forKind(StreamKind kind)
{
    static const RecordSchema positions = makePositionSchema();
    static const RecordSchema battery   = makeBatterySchema();
    static const RecordSchema trips     = makeTripSchema();
    static const RecordSchema charging  = makeChargingSchema();

    switch (kind)
    {
        case StreamKind::Position: return positions;
        case StreamKind::Battery:  return battery;
        case StreamKind::Trip:     return trips;
        case StreamKind::Charging: return charging;
    }
    throw std::invalid_argument("unknown stream kind");
}

std::vector<RecordSchema const*> RecordSchema::layoutsFor(StreamKind kind)
{
    static const RecordSchema chargingSteps = makeChargingSampleSchema();

    if (kind == StreamKind::Charging)
        return {&forKind(kind), &chargingSteps};
    return {&forKind(kind)};
}

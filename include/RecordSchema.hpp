#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "Types.hpp"

enum class FieldType
{
    Text,
    Number
};

// A header name accepted for a field, with the factor converting its unit to the canonical one.
struct FieldAlias
{
    std::string column;
    double scale = 1.0;
};

struct FieldSpec
{
    std::string name;
    FieldType type;
    bool required;
    std::vector<FieldAlias> aliases;   // first alias found in the header wins
};

// Column layout of one telemetry stream.
struct RecordSchema
{
    StreamKind kind;
    std::vector<FieldSpec> fields;

    // Each group needs at least one of its fields present in every row.
    std::vector<std::vector<std::size_t>> requireAny;

    // Rows are per-step observations of a vehicle at a charging station, not whole sessions.
    bool chargingSamples = false;

    static RecordSchema const& forKind(StreamKind kind);

    // Layouts a stream of this kind may arrive in, preferred first.
    static std::vector<RecordSchema const*> layoutsFor(StreamKind kind);
};

namespace PositionField
{
    enum : std::size_t { Time, VehicleId, VehicleType, X, Y, Speed, Acceleration, Odometer, Waiting };
}

namespace BatteryField
{
    enum : std::size_t { Time, VehicleId, Remaining, MaxCapacity, StateOfCharge, ReportedStation,
                          TotalConsumed, TotalRegenerated };
}

namespace TripField
{
    enum : std::size_t { VehicleId, VehicleType, Departure, Arrival, Duration, Distance, Waiting };
}

namespace ChargingField
{
    enum : std::size_t { StationId, VehicleId, Start, End, Energy };
}

namespace ChargingSampleField
{
    enum : std::size_t { Time, VehicleId, StationId };
}

struct FieldValue
{
    bool present = false;
    double number = 0.0;   // as written in the stream, before unit scaling
    double scale = 1.0;
    std::string text;
};

// A row of a telemetry stream, typed by its schema but still in the stream's own units.
struct RawRecord
{
    StreamKind kind;
    std::size_t line = 0;
    std::vector<FieldValue> values;

    bool has(std::size_t field) const { return field < values.size() && values[field].present; }
    double scaled(std::size_t field) const { return values[field].number * values[field].scale; }
    std::string const& text(std::size_t field) const { return values[field].text; }
};

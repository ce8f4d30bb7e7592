#pragma once
#include <optional>
#include "RecordSchema.hpp"

// Forward-only producer of raw records for one telemetry stream.
class RecordSource
{
public:
    virtual ~RecordSource() = default;

    // Next well-formed record, or nullopt once the stream is exhausted.
    virtual std::optional<RawRecord> next() = 0;
    virtual StreamKind kind() const noexcept = 0;
};

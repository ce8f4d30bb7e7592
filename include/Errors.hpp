#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

class TelemetryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A single row that violates its schema. Absorbed by StreamReader.
class MalformedRecord : public TelemetryError
{
public:
    MalformedRecord(std::size_t line, std::string const& reason)
        : TelemetryError("line " + std::to_string(line) + ": " + reason), lineNumber(line)
    {
    }

    std::size_t line() const noexcept { return lineNumber; }

private:
    std::size_t lineNumber;
};

// A whole stream is unusable; the run is cancelled.
class StreamCorrupt : public TelemetryError
{
public:
    StreamCorrupt(std::string const& stream, std::string const& reason)
        : TelemetryError("stream '" + stream + "' corrupt: " + reason), streamName(stream)
    {
    }

    std::string const& stream() const noexcept { return streamName; }

private:
    std::string streamName;
};

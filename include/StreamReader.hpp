#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "RecordSource.hpp"

class RunDiagnostics;

// Lazy CSV reader bound to a RecordSchema. Malformed rows are skipped and counted;
// once more than `malformedThreshold` rows were skipped the stream is corrupt.
class StreamReader : public RecordSource
{
public:
    StreamReader(std::unique_ptr<std::istream> input, StreamKind kind,
                 RunDiagnostics& diagnostics, std::uint64_t malformedThreshold);

    // Per-step charging files come back wrapped in a ChargingSessionAssembler.
    static std::unique_ptr<RecordSource> open(std::string const& path, StreamKind kind,
                                              RunDiagnostics& diagnostics, std::uint64_t malformedThreshold);

    std::optional<RawRecord> next() override;
    StreamKind kind() const noexcept override;

    // Layout the header was bound to; the kind's primary layout for an empty stream.
    RecordSchema const& layout() const noexcept { return *schema; }

    static std::vector<std::string> splitLine(std::string const& line);

private:
    std::unique_ptr<std::istream> input;
    RecordSchema const* schema;
    RunDiagnostics& diagnostics;
    std::uint64_t malformedThreshold;
    std::size_t lineNumber = 0;
    std::size_t columnCount = 0;

    std::vector<int> columnOf;      // field index -> CSV column, -1 when absent
    std::vector<double> scaleOf;

    void bindHeader();
    std::string bindColumns(RecordSchema const& candidate, std::vector<std::string> const& columns);
    RawRecord parseRow(std::vector<std::string> const& cells) const;
    void validateValues(RawRecord const& record) const;
    char const* name() const noexcept;
};

#include "StreamReader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include "ChargingSessionAssembler.hpp"
#include "Diagnostics.hpp"
#include "Errors.hpp"

namespace
{
    std::string trim(std::string const& s)
    {
        std::size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos)
            return {};
        std::size_t e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    bool parseNumber(std::string const& text, double& out)
    {
        char const* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        double v = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(v))
            return false;
        out = v;
        return true;
    }

    constexpr double SOC_TOLERANCE = 1e-9;
}

StreamReader::StreamReader(std::unique_ptr<std::istream> in, StreamKind kind,
                           RunDiagnostics& diag, std::uint64_t threshold)
    : input(std::move(in)),
      schema(&RecordSchema::forKind(kind)),
      diagnostics(diag),
      malformedThreshold(threshold)
{
    diagnostics.stream(kind).present = true;
    bindHeader();
}

std::unique_ptr<RecordSource> StreamReader::open(std::string const& path, StreamKind kind,
                                                 RunDiagnostics& diag, std::uint64_t threshold)
{
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open())
        throw StreamCorrupt(streamKindName(kind), "cannot open " + path);

    diag.stream(kind).source = path;
    auto reader = std::make_unique<StreamReader>(std::move(file), kind, diag, threshold);
    if (reader->layout().chargingSamples)
    {
        std::cout << "[Reader] " << path << ": per-step charging rows, assembling sessions" << std::endl;
        return std::make_unique<ChargingSessionAssembler>(std::move(reader));
    }
    return reader;
}

StreamKind StreamReader::kind() const noexcept
{
    return schema->kind;
}

char const* StreamReader::name() const noexcept
{
    return streamKindName(schema->kind);
}

std::vector<std::string> StreamReader::splitLine(std::string const& line)
{
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (quoted)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    cell += '"';
                    ++i;
                }
                else
                {
                    quoted = false;
                }
            }
            else
            {
                cell += c;
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            cells.push_back(trim(cell));
            cell.clear();
        }
        else
        {
            cell += c;
        }
    }
    cells.push_back(trim(cell));
    return cells;
}

void StreamReader::bindHeader()
{
    std::string header;
    while (std::getline(*input, header))
    {
        ++lineNumber;
        if (!header.empty() && header.back() == '\r')
            header.pop_back();
        if (!trim(header).empty())
            break;
        header.clear();
    }

    if (header.empty())
    {
        std::cout << "[Reader] " << name() << ": empty stream" << std::endl;
        return;
    }

    std::vector<std::string> columns = splitLine(header);
    std::vector<RecordSchema const*> layouts = RecordSchema::layoutsFor(schema->kind);

    std::string firstProblem;
    for (RecordSchema const* candidate : layouts)
    {
        std::string problem = bindColumns(*candidate, columns);
        if (problem.empty())
        {
            schema = candidate;
            columnCount = columns.size();
            return;
        }
        if (firstProblem.empty())
            firstProblem = problem;
    }
    throw StreamCorrupt(name(), firstProblem);
}

std::string StreamReader::bindColumns(RecordSchema const& candidate, std::vector<std::string> const& columns)
{
    columnOf.assign(candidate.fields.size(), -1);
    scaleOf.assign(candidate.fields.size(), 1.0);

    for (std::size_t f = 0; f < candidate.fields.size(); ++f)
    {
        FieldSpec const& spec = candidate.fields[f];
        for (const auto& alias : spec.aliases)
        {
            for (std::size_t c = 0; c < columns.size(); ++c)
            {
                if (columns[c] == alias.column)
                {
                    columnOf[f] = static_cast<int>(c);
                    scaleOf[f] = alias.scale;
                    break;
                }
            }
            if (columnOf[f] >= 0)
                break;
        }

        if (spec.required && columnOf[f] < 0)
            return "header lacks required column '" + spec.name + "'";
    }

    for (const auto& group : candidate.requireAny)
    {
        bool bound = false;
        std::string names;
        for (std::size_t f : group)
        {
            bound = bound || columnOf[f] >= 0;
            names += (names.empty() ? "" : "/") + candidate.fields[f].name;
        }
        if (!bound)
            return "header lacks any of the columns " + names;
    }
    return {};
}

std::optional<RawRecord> StreamReader::next()
{
    if (columnCount == 0)
        return std::nullopt;

    std::string line;
    while (std::getline(*input, line))
    {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty())
            continue;

        diagnostics.stream(schema->kind).recordsRead++;

        try
        {
            RawRecord record = parseRow(splitLine(line));
            validateValues(record);
            return record;
        }
        catch (MalformedRecord const& e)
        {
            diagnostics.recordMalformed(schema->kind, e);
            std::uint64_t malformed = diagnostics.stream(schema->kind).malformed;
            if (malformed > malformedThreshold)
            {
                throw StreamCorrupt(name(), std::to_string(malformed) + " malformed records exceed threshold of "
                                            + std::to_string(malformedThreshold) + " (last: " + e.what() + ")");
            }
        }
    }

    if (input->bad())
        throw StreamCorrupt(name(), "read error after line " + std::to_string(lineNumber));

    return std::nullopt;
}

RawRecord StreamReader::parseRow(std::vector<std::string> const& cells) const
{
    RawRecord record;
    record.kind = schema->kind;
    record.line = lineNumber;
    record.values.resize(schema->fields.size());

    for (std::size_t f = 0; f < schema->fields.size(); ++f)
    {
        FieldSpec const& spec = schema->fields[f];
        int col = columnOf[f];
        FieldValue& value = record.values[f];

        if (col >= 0 && static_cast<std::size_t>(col) < cells.size() && !cells[col].empty())
        {
            std::string const& cell = cells[col];
            if (spec.type == FieldType::Number)
            {
                if (!parseNumber(cell, value.number))
                    throw MalformedRecord(lineNumber, "non-numeric value '" + cell + "' in field '" + spec.name + "'");
                value.scale = scaleOf[f];
            }
            value.text = cell;
            value.present = true;
        }
        else if (spec.required)
        {
            throw MalformedRecord(lineNumber, "missing field '" + spec.name + "'");
        }
    }

    for (const auto& group : schema->requireAny)
    {
        bool any = false;
        for (std::size_t f : group)
            any = any || record.has(f);
        if (!any)
            throw MalformedRecord(lineNumber, "missing field '" + schema->fields[group.front()].name + "'");
    }

    return record;
}

void StreamReader::validateValues(RawRecord const& r) const
{
    switch (r.kind)
    {
        case StreamKind::Position:
            if (r.scaled(PositionField::Speed) < 0.0)
                throw MalformedRecord(r.line, "negative speed");
            break;

        case StreamKind::Battery:
            if (r.scaled(BatteryField::Remaining) < 0.0)
                throw MalformedRecord(r.line, "negative remaining energy");
            if ((r.has(BatteryField::TotalConsumed) && r.scaled(BatteryField::TotalConsumed) < 0.0)
                || (r.has(BatteryField::TotalRegenerated) && r.scaled(BatteryField::TotalRegenerated) < 0.0))
                throw MalformedRecord(r.line, "negative cumulative energy counter");
            if (r.has(BatteryField::StateOfCharge))
            {
                double soc = r.scaled(BatteryField::StateOfCharge);
                if (soc < -SOC_TOLERANCE || soc > 1.0 + SOC_TOLERANCE)
                    throw MalformedRecord(r.line, "state of charge out of range");
            }
            break;

        case StreamKind::Trip:
            if (r.has(TripField::Duration) && r.scaled(TripField::Duration) < 0.0)
                throw MalformedRecord(r.line, "negative trip duration");
            if (r.has(TripField::Arrival) && r.scaled(TripField::Arrival) < r.scaled(TripField::Departure))
                throw MalformedRecord(r.line, "arrival before departure");
            break;

        case StreamKind::Charging:
            if (schema->chargingSamples)
            {
                if (r.text(ChargingSampleField::StationId) == "NULL")
                    throw MalformedRecord(r.line, "charging row without a station");
                break;
            }
            if (r.scaled(ChargingField::End) < r.scaled(ChargingField::Start))
                throw MalformedRecord(r.line, "charging session ends before it starts");
            if (r.scaled(ChargingField::Energy) < 0.0)
                throw MalformedRecord(r.line, "negative energy delivered");
            break;
    }
}

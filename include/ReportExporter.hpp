#pragma once
#include <string>
#include "fleet_report.pb.h"

struct PipelineResult;

// Binary protobuf export of a finished run (fleettrace.FleetReport).
class ReportExporter
{
public:
    static fleettrace::FleetReport toMessage(PipelineResult const& result);

    static void save(PipelineResult const& result, std::string const& path);
    static fleettrace::FleetReport load(std::string const& path);
};

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <google/protobuf/stubs/common.h>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "ReportAssembler.hpp"
#include "ReportExporter.hpp"
#include "SQLiteStore.hpp"
#include "TelemetryPipeline.hpp"

namespace
{
    constexpr int EXIT_STREAM_CORRUPT = 2;

    void writeReport(std::string const& text, std::string const& path)
    {
        if (path.empty())
        {
            std::cout << text;
            return;
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open())
            throw std::runtime_error("Could not open report file " + path);
        file << text;
        std::cout << "[System] Report written to " << path << std::endl;
    }
}

int main(int argc, char* argv[])
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    int status = 0;
    try
    {
        ConfigurationManager config(argc, argv);
        if (config.wantsHelp())
        {
            std::cout << ConfigurationManager::usage();
        }
        else
        {
            TelemetryPipeline pipeline(config.getPipelineConfig());
            try
            {
                PipelineResult result = pipeline.run();

                writeReport(ReportAssembler::render(result, pipeline.config()), config.getReportPath());

                if (!config.getDatabasePath().empty())
                {
                    SQLiteStore db(config.getDatabasePath());
                    db.writeReport(result);
                }

                if (!config.getExportPath().empty())
                    ReportExporter::save(result, config.getExportPath());

                std::cout << "[System] Done. " << result.diagnostics.caveatCount() << " data-quality caveats." << std::endl;
            }
            catch (StreamCorrupt const& e)
            {
                std::cerr << "Stream Error: " << e.what() << "\n";
                writeReport(ReportAssembler::renderDiagnostics(pipeline.diagnostics()), config.getReportPath());
                status = EXIT_STREAM_CORRUPT;
            }
        }
    }
    catch (std::exception const& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        status = 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return status;
}

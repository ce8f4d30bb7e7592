#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/wait.h>
#include "ConfigurationManager.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace
{
    std::string executablePath;

    ConfigurationManager configure(std::vector<std::string> args)
    {
        args.insert(args.begin(), "fleettrace");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        return ConfigurationManager(static_cast<int>(args.size()), argv.data());
    }

    bool rejects(std::vector<std::string> const& args)
    {
        try
        {
            configure(args);
        }
        catch (std::runtime_error const&)
        {
            return true;
        }
        return false;
    }

    void clearEnvironment()
    {
        unsetenv("FLEETTRACE_INPUT_DIR");
        unsetenv("FLEETTRACE_MALFORMED_THRESHOLD");
        unsetenv("FLEETTRACE_REPORT");
    }
}

bool test_defaults()
{
    std::cout << "Testing defaults..." << std::flush;

    clearEnvironment();
    ConfigurationManager config = configure({});
    PipelineConfig const& p = config.getPipelineConfig();

    assert(p.positions.empty());
    assert(p.malformedThreshold == 100);
    assert(!p.prefetch);
    assert(near(p.aggregator.timelineBucket, 60.0));
    assert(near(p.aggregator.stopSpeedThreshold, 0.1));
    assert(config.getReportPath().empty());
    assert(config.getDatabasePath().empty());
    assert(!config.wantsHelp());

    std::cout << " PASS\n";
    return true;
}

bool test_arguments()
{
    std::cout << "Testing command line options..." << std::flush;

    clearEnvironment();
    ConfigurationManager config = configure({
        "--positions", "p.csv", "--battery", "b.csv", "--trips", "t.csv", "--charging", "c.csv",
        "--stations", "s.csv", "--malformed-threshold", "7", "--report", "out.txt", "--db", "out.db",
        "--export", "out.pb", "--bucket", "15", "--stop-speed", "0.5", "--prefetch", "--bogus", "--help"});
    PipelineConfig const& p = config.getPipelineConfig();

    assert(p.positions == "p.csv");
    assert(p.battery == "b.csv");
    assert(p.trips == "t.csv");
    assert(p.charging == "c.csv");
    assert(p.stations == "s.csv");
    assert(p.malformedThreshold == 7);
    assert(p.prefetch);
    assert(near(p.aggregator.timelineBucket, 15.0));
    assert(near(p.aggregator.stopSpeedThreshold, 0.5));
    assert(config.getReportPath() == "out.txt");
    assert(config.getDatabasePath() == "out.db");
    assert(config.getExportPath() == "out.pb");
    assert(config.wantsHelp());
    assert(ConfigurationManager::usage().find("--positions") != std::string::npos);

    std::cout << " PASS\n";
    return true;
}

bool test_invalid_values()
{
    std::cout << "Testing invalid option values..." << std::flush;

    clearEnvironment();
    assert(rejects({"--malformed-threshold", "many"}));
    assert(rejects({"--malformed-threshold", "-3"}));
    assert(rejects({"--bucket", "0"}));
    assert(rejects({"--bucket", "1x"}));
    assert(rejects({"--stop-speed", "-1"}));

    setenv("FLEETTRACE_MALFORMED_THRESHOLD", "lots", 1);
    assert(rejects({}));
    clearEnvironment();

    std::cout << " PASS\n";
    return true;
}

bool test_environment_and_input_dir()
{
    std::cout << "Testing environment and input directory..." << std::flush;

    ScratchDir dir("config_inputs");
    dir.write(ConfigurationManager::POSITIONS_FILE, POSITION_HEADER);
    dir.write(ConfigurationManager::CHARGING_FILE, CHARGING_HEADER);

    clearEnvironment();
    setenv("FLEETTRACE_INPUT_DIR", dir.path("").c_str(), 1);
    setenv("FLEETTRACE_MALFORMED_THRESHOLD", "3", 1);
    setenv("FLEETTRACE_REPORT", "env_report.txt", 1);

    ConfigurationManager config = configure({"--malformed-threshold", "9", "--battery", "mine.csv"});
    PipelineConfig const& p = config.getPipelineConfig();

    assert(p.positions == dir.path(ConfigurationManager::POSITIONS_FILE));
    assert(p.charging == dir.path(ConfigurationManager::CHARGING_FILE));
    assert(p.battery == "mine.csv");
    assert(p.trips.empty());
    assert(p.stations.empty());
    assert(p.malformedThreshold == 9);
    assert(config.getReportPath() == "env_report.txt");

    clearEnvironment();

    std::cout << " PASS\n";
    return true;
}

bool test_help_exits_cleanly()
{
    std::cout << "Testing --help exits through normal shutdown..." << std::flush;

    if (executablePath.empty())
    {
        std::cout << " SKIP (no executable given)\n";
        return true;
    }

    clearEnvironment();
    ScratchDir dir("config_help");
    std::string output = dir.path("usage.txt");
    int rc = std::system(("\"" + executablePath + "\" --help > \"" + output + "\" 2>&1").c_str());
    assert(rc != -1 && WIFEXITED(rc));
    assert(WEXITSTATUS(rc) == 0);

    std::ifstream in(output);
    std::stringstream text;
    text << in.rdbuf();
    assert(text.str().find("--positions") != std::string::npos);
    assert(text.str().find("Error") == std::string::npos);

    std::cout << " PASS\n";
    return true;
}

int main(int argc, char* argv[])
{
    if (argc > 1)
        executablePath = argv[1];
    std::cout << "============================================================================\n";
    std::cout << "CONFIGURATION TESTS\n";
    std::cout << "============================================================================\n\n";

    try
    {
        bool all_passed = true;

        all_passed &= test_defaults();
        all_passed &= test_arguments();
        all_passed &= test_invalid_values();
        all_passed &= test_environment_and_input_dir();
        all_passed &= test_help_exits_cleanly();

        std::cout << "\n============================================================================\n";
        if (!all_passed)
        {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All configuration tests PASSED\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "EstateChartRun.h"
#include "EstateSeriesException.h"
#include "RunConfigurationFileReader.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace estatetrend;
using namespace estatechart::utils;

void printUsage(const po::options_description& desc) {
    std::cout << "estatechart - chart property sale prices against regional house price indices\n\n";
    std::cout << "Usage: estatechart --runs <runs.csv> --regions <regions.csv> [--log <file>]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nConfiguration files:\n";
    std::cout << "  regions.csv  Region,ReferenceFile\n";
    std::cout << "  runs.csv     Estate,SalesFile,MinSales,MinSpanDays,NumberToReturn,PriceOutput,ChangeOutput\n\n";
    std::cout << "Example runs.csv rows:\n";
    std::cout << "  Barbican,estates/barbican.csv,3,7300,10,output/barbican-prices.csv,output/barbican-changes.csv\n";
    std::cout << "  Golden Lane,estates/golden_lane.csv,3,7300,ALL,output/golden-lane-prices.csv,output/golden-lane-changes.csv\n";
}

static void executeRun(const RunConfiguration& runConfig,
                       const std::vector<RegionSource>& regions,
                       std::ostream& log)
{
    log << "=== " << runConfig.getEstateName() << " ===" << std::endl;
    log << "Minimum sales: " << runConfig.getMinimumSales()
        << ", minimum span: " << runConfig.getMinimumSpanDays() << " days"
        << ", number to return: ";
    if (runConfig.getNumberToReturn())
        log << *runConfig.getNumberToReturn();
    else
        log << "all";
    log << std::endl;

    ensureParentDirectoryExists(runConfig.getPriceOutputFileName());
    ensureParentDirectoryExists(runConfig.getChangeOutputFileName());

    EstateChartRun run(runConfig.getSalesFileName(),
                       regions,
                       runConfig.createQualifier(),
                       runConfig.getNumberToReturn());

    run.run(runConfig.getPriceOutputFileName(), runConfig.getChangeOutputFileName(), log);
}

int main(int argc, char** argv)
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help message")
        ("runs,r", po::value<std::string>(), "Runs configuration file (one estate per row)")
        ("regions,g", po::value<std::string>(), "Regions configuration file (one reference series per row)")
        ("log,l", po::value<std::string>(), "Also write progress messages to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        printUsage(desc);
        return 1;
    }

    if (vm.count("help") || !vm.count("runs") || !vm.count("regions")) {
        printUsage(desc);
        return vm.count("help") ? 0 : 1;
    }

    std::ofstream logFile;
    std::unique_ptr<TeeStream> teeStream;
    std::ostream* log = &std::cout;

    if (vm.count("log")) {
        const std::string logFileName = vm["log"].as<std::string>();
        logFile.open(logFileName, std::ios::out | std::ios::app);
        if (!logFile.is_open()) {
            std::cerr << "Error: cannot open log file " << logFileName << std::endl;
            return 1;
        }
        teeStream = std::make_unique<TeeStream>(std::cout, logFile);
        log = teeStream.get();
    }

    std::vector<RunConfiguration> runs;
    std::vector<RegionSource> regions;

    try {
        RunConfigurationFileReader configReader(vm["runs"].as<std::string>(),
                                                vm["regions"].as<std::string>());
        regions = configReader.readRegions();
        runs = configReader.readRuns();
    } catch (const RunConfigurationFileReaderException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    *log << "Loaded " << runs.size() << " run(s) against " << regions.size() << " region(s)" << std::endl;

    for (const auto& runConfig : runs) {
        try {
            executeRun(runConfig, regions, *log);
        } catch (const SeriesComputationException& e) {
            std::cerr << "Run '" << runConfig.getEstateName() << "' failed for property "
                      << e.getPropertyLabel() << " against " << e.getRegionName()
                      << ": " << e.what() << std::endl;
            return 1;
        } catch (const EstateSeriesException& e) {
            std::cerr << "Run '" << runConfig.getEstateName() << "' failed: " << e.what() << std::endl;
            return 1;
        } catch (const std::exception& e) {
            std::cerr << "Run '" << runConfig.getEstateName() << "' failed with unexpected error: "
                      << e.what() << std::endl;
            return 1;
        }
    }

    *log << "All runs completed" << std::endl;
    return 0;
}

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "number.h"
#include "ChartCatalog.h"
#include "ChartDatasetReader.h"
#include "FilterEngine.h"
#include "TradeSimulator.h"
#include "RunConfiguration.h"
#include "reporting/ChartReporter.h"
#include "reporting/SimulationReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace chartsieve;
using namespace sievecli;
using Num = num::DefaultNumber;

void printUsage(const po::options_description& desc)
{
    std::cout << "chartsieve - filter intraday charts and backtest a target/stop trade\n\n";
    std::cout << "Usage: chartsieve --data <dataset.json> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # List the sources in a dataset\n";
    std::cout << "  chartsieve --data ohlc_data.json --list-sources\n\n";
    std::cout << "  # Gap-up days on ES whose first 15 minute bar closed up\n";
    std::cout << "  chartsieve --data ohlc_data.json --source ES --frequency 15min \\\n";
    std::cout << "             --gap-direction \"GAP UP\" --bar-filter 1:UP\n\n";
    std::cout << "  # Run filters and trade settings from a run file, save results\n";
    std::cout << "  chartsieve --data ohlc_data.json --config run.json --results results/\n";
}

static void applyCommandLine(const po::variables_map& vm, RunConfiguration& configuration)
{
    FilterSpec& spec = configuration.getFilterSpec();

    if (vm.count("source"))
        for (const auto& source : vm["source"].as<std::vector<std::string>>())
            spec.addSource(source);

    if (vm.count("frequency"))
        for (const auto& frequency : vm["frequency"].as<std::vector<std::string>>())
            spec.addFrequency(parseFrequency(frequency));

    if (vm.count("bars"))
        for (const auto& option : vm["bars"].as<std::vector<std::string>>())
            spec.addBarsOption(parseBarsOption(option));

    if (vm.count("gap-direction"))
        for (const auto& gapDirection : vm["gap-direction"].as<std::vector<std::string>>())
            spec.addGapDirection(gapDirection);

    if (vm.count("gap-size"))
        for (const auto& gapSizeClass : vm["gap-size"].as<std::vector<std::string>>())
            spec.addGapSizeClass(gapSizeClass);

    if (vm.count("prior-day"))
        for (const auto& condition : vm["prior-day"].as<std::vector<std::string>>())
            spec.addPriorDayCondition(parsePriorDayCondition(condition));

    if (vm.count("bar-filter"))
        for (const auto& constraint : vm["bar-filter"].as<std::vector<std::string>>())
            spec.addBarConstraint(parseBarConstraint(constraint));

    TradeSettings& trade = configuration.getTradeSettings();

    if (vm.count("trigger-bar"))
        trade.setTriggerBar(vm["trigger-bar"].as<int>());

    if (vm.count("direction"))
        trade.setDirection(parseTradeDirection(vm["direction"].as<std::string>()));

    if (vm.count("target-pct"))
        trade.setTargetPct(parsePercent(vm["target-pct"].as<std::string>()));

    if (vm.count("stop-pct"))
        trade.setStopPct(parsePercent(vm["stop-pct"].as<std::string>()));

    if (vm.count("max-charts"))
        configuration.setMaxCharts(vm["max-charts"].as<size_t>());
}

static int runSieve(const po::variables_map& vm, std::ostream& log)
{
    bool verbose = vm.count("verbose") > 0;

    std::shared_ptr<RunConfiguration> configuration;
    if (vm.count("config"))
    {
        std::string configPath = vm["config"].as<std::string>();
        if (verbose)
            log << "Reading run file " << configPath << std::endl;

        RunConfigurationFileReader configReader(configPath);
        configuration = configReader.readConfigurationFile();
    }
    else
    {
        configuration = std::make_shared<RunConfiguration>();
    }

    applyCommandLine(vm, *configuration);

    std::string dataPath = vm["data"].as<std::string>();
    log << "Loading chart dataset " << dataPath << std::endl;

    ChartDatasetReader<Num> reader(dataPath);
    reader.readFile();
    ChartCatalog<Num> catalog = ChartCatalog<Num>::load(*reader.getDataset());

    log << "Loaded " << catalog.getNumTradingDays() << " trading days from "
        << catalog.getSources().size() << " sources" << std::endl;

    if (vm.count("list-sources"))
    {
        reporting::ChartReporter::writeSourceList(log, catalog);
        return 0;
    }

    auto views = FilterEngine<Num>::generate(catalog, configuration->getFilterSpec());
    reporting::ChartReporter::writeChartList(log, views, configuration->getMaxCharts());

    if (!configuration->getTradeSettings().isSpecified())
    {
        if (verbose)
            log << "No trade parameters given, skipping simulation" << std::endl;
        return 0;
    }

    TradeParams<Num> params = configuration->getTradeSettings().getTradeParams();
    auto summary = TradeSimulator<Num>::simulate(views, params);

    if (!summary)
    {
        log << "Error: invalid trade parameters (trigger bar must be at least 1, "
            << "target and stop percents must be positive)" << std::endl;
        return 1;
    }

    log << std::endl;
    reporting::SimulationReporter::writeSummary(log, params, *summary);

    if (verbose)
        reporting::SimulationReporter::writeTrades(log, *summary, configuration->getMaxCharts());

    if (vm.count("results"))
    {
        std::string resultsFile = utils::createResultsFileName(vm["results"].as<std::string>(),
                                                               "Simulation_Results", ".json");
        if (!reporting::SimulationReporter::saveResults(resultsFile, params, *summary, log))
            return 1;

        log << "Results written to " << resultsFile << std::endl;
    }

    return 0;
}

int main(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("data,d", po::value<std::string>(), "Chart dataset JSON file")
        ("config,c", po::value<std::string>(), "JSON run file with filters and trade settings")
        ("source", po::value<std::vector<std::string>>()->composing(), "Source to include (repeatable)")
        ("frequency", po::value<std::vector<std::string>>()->composing(), "Chart frequency, e.g. 15min (repeatable)")
        ("bars", po::value<std::vector<std::string>>()->composing(), "Bars per chart: a count or \"all\" (repeatable)")
        ("gap-direction", po::value<std::vector<std::string>>()->composing(), "Gap direction label, e.g. \"GAP UP\" (repeatable)")
        ("gap-size", po::value<std::vector<std::string>>()->composing(), "Gap size class, e.g. 0.25%-0.5% (repeatable)")
        ("prior-day", po::value<std::vector<std::string>>()->composing(), "open_above_prev_high or close_below_prev_low (repeatable)")
        ("bar-filter", po::value<std::vector<std::string>>()->composing(), "BAR:DIRECTION[:RATIO], e.g. 3:UP:>75% (repeatable)")
        ("trigger-bar", po::value<int>(), "Bar whose close is the trade entry (1-based)")
        ("direction", po::value<std::string>(), "Long or Short")
        ("target-pct", po::value<std::string>(), "Target distance as percent of trigger bar range")
        ("stop-pct", po::value<std::string>(), "Stop distance as percent of trigger bar range")
        ("max-charts", po::value<size_t>(), "Maximum number of charts listed (default 50)")
        ("list-sources", "List dataset sources and exit")
        ("results,r", po::value<std::string>(), "Directory for the JSON results file")
        ("log", po::value<std::string>()->default_value("chartsieve.log"), "Log file mirroring console output")
        ("verbose,v", "Verbose output");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        printUsage(desc);
        return 0;
    }

    if (!vm.count("data"))
    {
        std::cerr << "Error: --data is required" << std::endl;
        printUsage(desc);
        return 1;
    }

    std::string logPath = vm["log"].as<std::string>();
    std::ofstream logFile(logPath);
    if (!logFile.is_open())
    {
        std::cerr << "Error: Cannot open log file " << logPath << std::endl;
        return 1;
    }

    utils::TeeStream log(std::cout, logFile);

    try
    {
        return runSieve(vm, log);
    }
    catch (const ChartSieveException& e)
    {
        log << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        log << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

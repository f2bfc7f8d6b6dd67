#pragma once

#include <ostream>
#include <string>
#include "number.h"
#include "SimulationSummary.h"
#include "TradeParams.h"

namespace sievecli
{
namespace reporting
{

/**
 * @brief Reports the outcome of a trade simulation run
 *
 * Text reports go to any output stream (usually the console/log tee). The
 * JSON form is used for the results file.
 */
class SimulationReporter
{
public:
    using Num = num::DefaultNumber;

    static void writeSummary(std::ostream& os,
                             const chartsieve::TradeParams<Num>& params,
                             const chartsieve::SimulationSummary<Num>& summary);

    // One line per trade, at most maxTrades lines
    static void writeTrades(std::ostream& os,
                            const chartsieve::SimulationSummary<Num>& summary,
                            size_t maxTrades);

    static std::string toJson(const chartsieve::TradeParams<Num>& params,
                              const chartsieve::SimulationSummary<Num>& summary);

    /**
     * @brief Write the JSON results to filePath
     * @return false if the file could not be written; the reason is written to errorStream
     */
    static bool saveResults(const std::string& filePath,
                            const chartsieve::TradeParams<Num>& params,
                            const chartsieve::SimulationSummary<Num>& summary,
                            std::ostream& errorStream);
};

} // namespace reporting
} // namespace sievecli

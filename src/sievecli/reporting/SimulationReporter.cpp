#include "SimulationReporter.h"
#include "TimeUtils.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;
using namespace chartsieve;

namespace sievecli
{
namespace reporting
{

namespace
{
    using Num = num::DefaultNumber;

    Value optionalPrice(const std::optional<Num>& price)
    {
        if (price)
        {
            return Value(num::to_double(*price));
        }
        return Value(kNullType);
    }

    std::string formatPrice(const std::optional<Num>& price)
    {
        if (!price)
        {
            return "-";
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << num::to_double(*price);
        return oss.str();
    }
}

void SimulationReporter::writeSummary(std::ostream& os,
                                      const TradeParams<Num>& params,
                                      const SimulationSummary<Num>& summary)
{
    os << "Trade: " << tradeDirectionToString(params.getDirection())
       << " at close of bar " << params.getTriggerBar()
       << ", target " << num::to_double(params.getTargetPct()) << "% of range"
       << ", stop " << num::to_double(params.getStopPct()) << "% of range" << std::endl;

    os << "Trades: " << summary.getNumTrades()
       << "  Wins: " << summary.getNumWins()
       << "  Losses: " << summary.getNumLosses()
       << "  Skipped: " << summary.getNumSkipped()
       << "  Decisive: " << summary.getNumDecisive() << std::endl;

    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(2)
       << "Win rate: " << num::to_double(summary.getWinRate()) << "%"
       << "  Avg PnL: " << num::to_double(summary.getAveragePnl())
       << "  Total PnL: " << num::to_double(summary.getTotalPnl()) << std::endl;
    os.flags(flags);
    os.precision(precision);
}

void SimulationReporter::writeTrades(std::ostream& os,
                                     const SimulationSummary<Num>& summary,
                                     size_t maxTrades)
{
    const auto& trades = summary.getTrades();
    size_t numShown = std::min(maxTrades, trades.size());

    for (size_t i = 0; i < numShown; ++i)
    {
        const TradeResult<Num>& trade = trades[i];

        os << "  " << std::left << std::setw(28) << trade.getKey()
           << " " << std::setw(4) << tradeOutcomeToString(trade.getOutcome()) << std::right
           << " pnl=" << formatPrice(trade.getPnl())
           << " entry=" << formatPrice(trade.getEntry())
           << " target=" << formatPrice(trade.getTarget())
           << " stop=" << formatPrice(trade.getStop());

        if (trade.getSkipReason() != SkipReason::None)
        {
            os << " (" << skipReasonToString(trade.getSkipReason()) << ")";
        }

        if (trade.getResolutionBar())
        {
            os << " bar " << *trade.getResolutionBar();
        }

        os << std::endl;
    }

    if (numShown < trades.size())
    {
        os << "  ... " << (trades.size() - numShown) << " more trades not shown" << std::endl;
    }
}

std::string SimulationReporter::toJson(const TradeParams<Num>& params,
                                       const SimulationSummary<Num>& summary)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value metadata(kObjectType);
    metadata.AddMember("created", Value(utils::getCurrentTimestamp().c_str(), allocator), allocator);
    doc.AddMember("metadata", metadata, allocator);

    Value paramsJson(kObjectType);
    paramsJson.AddMember("triggerBar", params.getTriggerBar(), allocator);
    paramsJson.AddMember("direction",
                         Value(tradeDirectionToString(params.getDirection()).c_str(), allocator),
                         allocator);
    paramsJson.AddMember("targetPct", num::to_double(params.getTargetPct()), allocator);
    paramsJson.AddMember("stopPct", num::to_double(params.getStopPct()), allocator);
    doc.AddMember("params", paramsJson, allocator);

    Value summaryJson(kObjectType);
    summaryJson.AddMember("wins", static_cast<uint64_t>(summary.getNumWins()), allocator);
    summaryJson.AddMember("losses", static_cast<uint64_t>(summary.getNumLosses()), allocator);
    summaryJson.AddMember("skipped", static_cast<uint64_t>(summary.getNumSkipped()), allocator);
    summaryJson.AddMember("decisive", static_cast<uint64_t>(summary.getNumDecisive()), allocator);
    summaryJson.AddMember("winRate", num::to_double(summary.getWinRate()), allocator);
    summaryJson.AddMember("avgPnL", num::to_double(summary.getAveragePnl()), allocator);
    summaryJson.AddMember("totalPnL", num::to_double(summary.getTotalPnl()), allocator);
    doc.AddMember("summary", summaryJson, allocator);

    Value tradesJson(kArrayType);
    for (const auto& trade : summary.getTrades())
    {
        Value tradeJson(kObjectType);
        tradeJson.AddMember("key", Value(trade.getKey().c_str(), allocator), allocator);
        tradeJson.AddMember("outcome",
                            Value(tradeOutcomeToString(trade.getOutcome()).c_str(), allocator),
                            allocator);
        tradeJson.AddMember("pnl", num::to_double(trade.getPnl()), allocator);
        tradeJson.AddMember("entry", optionalPrice(trade.getEntry()), allocator);
        tradeJson.AddMember("target", optionalPrice(trade.getTarget()), allocator);
        tradeJson.AddMember("stop", optionalPrice(trade.getStop()), allocator);

        if (trade.getSkipReason() != SkipReason::None)
        {
            tradeJson.AddMember("reason",
                                Value(skipReasonToString(trade.getSkipReason()).c_str(), allocator),
                                allocator);
        }

        tradesJson.PushBack(tradeJson, allocator);
    }
    doc.AddMember("trades", tradesJson, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

bool SimulationReporter::saveResults(const std::string& filePath,
                                     const TradeParams<Num>& params,
                                     const SimulationSummary<Num>& summary,
                                     std::ostream& errorStream)
{
    std::ofstream file(filePath);
    if (!file.is_open())
    {
        errorStream << "Error: Cannot open file for writing: " << filePath << std::endl;
        return false;
    }

    file << toJson(params, summary);
    if (!file)
    {
        errorStream << "Error: Failed writing results to " << filePath << std::endl;
        return false;
    }

    return true;
}

} // namespace reporting
} // namespace sievecli

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "TradeSimulator.h"

using namespace chartsieve;
using namespace Catch;

namespace
{
  using Simulator = TradeSimulator<DecimalType>;
  using Params = TradeParams<DecimalType>;
  using ViewPtr = std::shared_ptr<ChartView<DecimalType>>;

  ViewPtr createView(const std::string& sourceName, const std::string& dateString, const BarVector& bars)
  {
    return std::make_shared<ChartView<DecimalType>>(createTradingDay(sourceName, dateString, bars),
                                                    BarFrequency(5),
                                                    BarsOption::allBars(),
                                                    bars);
  }

  Params longParams(int triggerBar, const std::string& targetPct, const std::string& stopPct)
  {
    return Params(triggerBar, TradeDirection::Long, createDecimal(targetPct), createDecimal(stopPct));
  }

  // Trigger bar closes at 105 with a range of 10
  const OHLCRow kTriggerBar = {"100.0", "106.0", "96.0", "105.0"};
}

TEST_CASE ("TradeSimulator single trade outcomes", "[TradeSimulator]")
{
  SECTION ("No bar after the trigger ends the day unresolved")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {{"100", "105", "98", "100"}}));
      auto result = Simulator::simulateOne(*view, longParams(1, "50", "50"));

      REQUIRE (result.getOutcome() == TradeOutcome::Skip);
      REQUIRE (result.getSkipReason() == SkipReason::EndOfDay);
      REQUIRE (result.getPnl() == createDecimal("0"));
      REQUIRE (result.getEntry().value() == createDecimal("100"));
      REQUIRE (result.getTarget().value() == createDecimal("103.5"));
      REQUIRE (result.getStop().value() == createDecimal("96.5"));
      REQUIRE_FALSE (result.getResolutionBar().has_value());
    }

  SECTION ("Target and stop reached on the same bar is skipped")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            kTriggerBar,
            {"105.0", "111.0", "102.0", "108.0"}
          }));
      auto result = Simulator::simulateOne(*view, longParams(1, "50", "20"));

      REQUIRE (result.getOutcome() == TradeOutcome::Skip);
      REQUIRE (result.getSkipReason() == SkipReason::BothHit);
      REQUIRE (result.getPnl() == createDecimal("0"));
      REQUIRE (result.getTarget().value() == createDecimal("110"));
      REQUIRE (result.getStop().value() == createDecimal("103"));
      REQUIRE (result.getResolutionBar().value() == 2);
    }

  SECTION ("Long target reached first is a win worth the target distance")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            kTriggerBar,
            {"105.0", "111.0", "103.0", "110.5"}
          }));
      auto result = Simulator::simulateOne(*view, longParams(1, "50", "40"));

      REQUIRE (result.getOutcome() == TradeOutcome::Win);
      REQUIRE (result.getPnl() == createDecimal("5"));
      REQUIRE (result.getEntry().value() == createDecimal("105"));
      REQUIRE (result.getStop().value() == createDecimal("101"));
      REQUIRE (result.getSkipReason() == SkipReason::None);
    }

  SECTION ("Long stop reached first is a loss worth the stop distance")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            kTriggerBar,
            {"105.0", "108.0", "100.0", "101.0"}
          }));
      auto result = Simulator::simulateOne(*view, longParams(1, "50", "40"));

      REQUIRE (result.getOutcome() == TradeOutcome::Loss);
      REQUIRE (result.getPnl() == createDecimal("-4"));
    }

  SECTION ("Short trades mirror the comparisons")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            kTriggerBar,
            {"105.0", "106.0", "99.0", "100.0"}
          }));
      Params shortParams(1, TradeDirection::Short, createDecimal("50"), createDecimal("40"));
      auto result = Simulator::simulateOne(*view, shortParams);

      REQUIRE (result.getOutcome() == TradeOutcome::Win);
      REQUIRE (result.getTarget().value() == createDecimal("100"));
      REQUIRE (result.getStop().value() == createDecimal("109"));
      REQUIRE (result.getPnl() == createDecimal("5"));

      auto stopped = createView("ES", "20240104", createBars("20240104", {
            kTriggerBar,
            {"105.0", "109.5", "104.0", "109.0"}
          }));
      auto loss = Simulator::simulateOne(*stopped, shortParams);

      REQUIRE (loss.getOutcome() == TradeOutcome::Loss);
      REQUIRE (loss.getPnl() == createDecimal("-4"));
    }

  SECTION ("The first resolving bar decides the trade")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            {"100.0", "101.0", "99.0", "100.5"},
            kTriggerBar,
            {"105.0", "107.0", "104.0", "106.0"},
            {"106.0", "110.0", "105.0", "109.0"},
            {"109.0", "109.5", "90.0",  "91.0"}
          }));
      auto result = Simulator::simulateOne(*view, longParams(2, "50", "40"));

      REQUIRE (result.getOutcome() == TradeOutcome::Win);
      REQUIRE (result.getResolutionBar().value() == 4);
    }

  SECTION ("A trigger bar past the end of the view is skipped")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {kTriggerBar, kTriggerBar}));
      auto result = Simulator::simulateOne(*view, longParams(3, "50", "40"));

      REQUIRE (result.getOutcome() == TradeOutcome::Skip);
      REQUIRE (result.getSkipReason() == SkipReason::NotEnoughBars);
      REQUIRE (result.getPnl() == createDecimal("0"));
      REQUIRE_FALSE (result.getEntry().has_value());
    }

  SECTION ("A trigger bar without range is skipped but reports the entry")
    {
      auto view = createView("ES", "20240103", createBars("20240103", {
            {"100.0", "100.0", "100.0", "100.0"},
            kTriggerBar
          }));
      auto result = Simulator::simulateOne(*view, longParams(1, "50", "40"));

      REQUIRE (result.getOutcome() == TradeOutcome::Skip);
      REQUIRE (result.getSkipReason() == SkipReason::ZeroRange);
      REQUIRE (result.getEntry().value() == createDecimal("100"));
      REQUIRE_FALSE (result.getTarget().has_value());
      REQUIRE_FALSE (result.getStop().has_value());
    }
}

TEST_CASE ("TradeParams validation", "[TradeParams]")
{
  REQUIRE (longParams(1, "50", "25").isValid());
  REQUIRE_FALSE (longParams(0, "50", "25").isValid());
  REQUIRE_FALSE (longParams(-2, "50", "25").isValid());
  REQUIRE_FALSE (longParams(1, "0", "25").isValid());
  REQUIRE_FALSE (longParams(1, "50", "-1").isValid());
  REQUIRE_FALSE (Params(1, static_cast<TradeDirection>(7), createDecimal("50"), createDecimal("25")).isValid());

  REQUIRE (tradeDirectionFromString("short") == TradeDirection::Short);
  REQUIRE (tradeDirectionToString(TradeDirection::Long) == "Long");
  REQUIRE_FALSE (tradeDirectionFromString("sideways").has_value());
}

TEST_CASE ("TradeSimulator aggregate statistics", "[TradeSimulator]")
{
  // Trigger range 10: a 50% target wins 5, a 30% stop loses 3
  auto winA = createView("ES", "20240103", createBars("20240103", {kTriggerBar, {"105", "111", "103", "110"}}));
  auto winB = createView("ES", "20240104", createBars("20240104", {kTriggerBar, {"105", "110", "104", "109"}}));
  auto loss = createView("NQ", "20240103", createBars("20240103", {kTriggerBar, {"105", "107", "101", "102"}}));
  auto open = createView("NQ", "20240104", createBars("20240104", {kTriggerBar, {"105", "106", "103", "104"}}));

  Params params = longParams(1, "50", "30");

  SECTION ("Wins, losses and averages over decisive trades")
    {
      auto summary = Simulator::simulate({winA, winB, loss}, params);

      REQUIRE (summary.has_value());
      REQUIRE (summary->getNumWins() == 2);
      REQUIRE (summary->getNumLosses() == 1);
      REQUIRE (summary->getNumSkipped() == 0);
      REQUIRE (summary->getNumDecisive() == 3);
      REQUIRE (num::to_double(summary->getWinRate()) == Approx(66.6667).margin(0.001));
      REQUIRE (num::to_double(summary->getAveragePnl()) == Approx(2.3333).margin(0.001));
      REQUIRE (summary->getTotalPnl() == createDecimal("7"));
    }

  SECTION ("Skipped trades are counted but do not move the averages")
    {
      auto summary = Simulator::simulate({winA, open, winB, loss}, params);

      REQUIRE (summary->getNumTrades() == 4);
      REQUIRE (summary->getNumSkipped() == 1);
      REQUIRE (summary->getNumDecisive() == 3);
      REQUIRE (num::to_double(summary->getAveragePnl()) == Approx(2.3333).margin(0.001));
    }

  SECTION ("Trades are tagged with view keys in input order")
    {
      auto summary = Simulator::simulate({loss, winA}, params);
      const auto& trades = summary->getTrades();

      REQUIRE (trades.size() == 2);
      REQUIRE (trades[0].getKey() == "NQ-20240103-5min-all");
      REQUIRE (trades[0].getOutcome() == TradeOutcome::Loss);
      REQUIRE (trades[1].getKey() == "ES-20240103-5min-all");
      REQUIRE (trades[1].getOutcome() == TradeOutcome::Win);
    }

  SECTION ("No decisive trades gives zero rate and average")
    {
      auto summary = Simulator::simulate({open}, params);

      REQUIRE (summary->getNumDecisive() == 0);
      REQUIRE (summary->getWinRate() == createDecimal("0"));
      REQUIRE (summary->getAveragePnl() == createDecimal("0"));

      auto empty = Simulator::simulate({}, params);
      REQUIRE (empty.has_value());
      REQUIRE (empty->getNumTrades() == 0);
    }

  SECTION ("Invalid parameters are refused rather than simulated")
    {
      REQUIRE_FALSE (Simulator::simulate({winA}, longParams(0, "50", "30")).has_value());
      REQUIRE_FALSE (Simulator::simulate({winA}, longParams(1, "0", "30")).has_value());
      REQUIRE_FALSE (Simulator::simulate({}, longParams(1, "50", "0")).has_value());
    }
}

TEST_CASE ("Trade outcome names", "[TradeResult]")
{
  REQUIRE (tradeOutcomeToString(TradeOutcome::Win) == "WIN");
  REQUIRE (tradeOutcomeToString(TradeOutcome::Loss) == "LOSS");
  REQUIRE (tradeOutcomeToString(TradeOutcome::Skip) == "SKIP");
  REQUIRE (skipReasonToString(SkipReason::NotEnoughBars) == "not enough bars");
  REQUIRE (skipReasonToString(SkipReason::ZeroRange) == "zero range");
  REQUIRE (skipReasonToString(SkipReason::BothHit) == "both hit");
  REQUIRE (skipReasonToString(SkipReason::EndOfDay) == "end of day");
  REQUIRE (skipReasonToString(SkipReason::None).empty());
}

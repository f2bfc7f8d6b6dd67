// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SIMULATION_SUMMARY_H
#define __SIMULATION_SUMMARY_H 1

#include <vector>
#include "DecimalConstants.h"
#include "TradeResult.h"

namespace chartsieve
{
  /**
   * @class SimulationSummary
   * @brief Aggregate statistics over the trades of one simulation run.
   *
   * Only decisive trades (wins and losses) contribute to the win rate and the
   * average pnl. Both are zero when no trade was decisive.
   */
  template <class Decimal>
  class SimulationSummary
  {
  public:
    explicit SimulationSummary(std::vector<TradeResult<Decimal>> trades)
      : mTrades(std::move(trades)),
        mWins(0),
        mLosses(0),
        mSkipped(0),
        mTotalPnl(DecimalConstants<Decimal>::DecimalZero),
        mWinRate(DecimalConstants<Decimal>::DecimalZero),
        mAveragePnl(DecimalConstants<Decimal>::DecimalZero)
    {
      for (const auto& trade : mTrades)
        {
          switch (trade.getOutcome())
            {
            case TradeOutcome::Win:
              mWins++;
              mTotalPnl += trade.getPnl();
              break;

            case TradeOutcome::Loss:
              mLosses++;
              mTotalPnl += trade.getPnl();
              break;

            case TradeOutcome::Skip:
              mSkipped++;
              break;
            }
        }

      size_t decisive = getNumDecisive();
      if (decisive > 0)
        {
          Decimal numDecisive(static_cast<double>(decisive));
          mWinRate = (Decimal(static_cast<double>(mWins)) / numDecisive) *
            DecimalConstants<Decimal>::DecimalOneHundred;
          mAveragePnl = mTotalPnl / numDecisive;
        }
    }

    size_t getNumWins() const
    {
      return mWins;
    }

    size_t getNumLosses() const
    {
      return mLosses;
    }

    size_t getNumSkipped() const
    {
      return mSkipped;
    }

    size_t getNumDecisive() const
    {
      return mWins + mLosses;
    }

    size_t getNumTrades() const
    {
      return mTrades.size();
    }

    // Percentage of decisive trades that were wins
    const Decimal& getWinRate() const
    {
      return mWinRate;
    }

    const Decimal& getAveragePnl() const
    {
      return mAveragePnl;
    }

    const Decimal& getTotalPnl() const
    {
      return mTotalPnl;
    }

    const std::vector<TradeResult<Decimal>>& getTrades() const
    {
      return mTrades;
    }

  private:
    std::vector<TradeResult<Decimal>> mTrades;
    size_t mWins;
    size_t mLosses;
    size_t mSkipped;
    Decimal mTotalPnl;
    Decimal mWinRate;
    Decimal mAveragePnl;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRADE_RESULT_H
#define __TRADE_RESULT_H 1

#include <optional>
#include <string>
#include "DecimalConstants.h"

namespace chartsieve
{
  enum class TradeOutcome { Win, Loss, Skip };

  enum class SkipReason { None, NotEnoughBars, ZeroRange, BothHit, EndOfDay };

  // "WIN", "LOSS", "SKIP"
  std::string tradeOutcomeToString(TradeOutcome outcome);

  // "not enough bars", "zero range", "both hit", "end of day"; empty for None
  std::string skipReasonToString(SkipReason reason);

  /**
   * @brief Prices computed for a trade once the trigger bar is known.
   */
  template <class Decimal>
  class TradeLevels
  {
  public:
    TradeLevels(const Decimal& entry, const Decimal& target, const Decimal& stop)
      : mEntry(entry),
        mTarget(target),
        mStop(stop)
    {}

    const Decimal& getEntry() const
    {
      return mEntry;
    }

    const Decimal& getTarget() const
    {
      return mTarget;
    }

    const Decimal& getStop() const
    {
      return mStop;
    }

  private:
    Decimal mEntry;
    Decimal mTarget;
    Decimal mStop;
  };

  /**
   * @class TradeResult
   * @brief Outcome of simulating one trade on one chart view.
   *
   * Skipped trades have a pnl of zero and carry the reason they could not be
   * decided. Entry, target and stop are reported whenever they were computed,
   * including for ambiguous trades.
   */
  template <class Decimal>
  class TradeResult
  {
  public:
    static TradeResult<Decimal> win(const TradeLevels<Decimal>& levels,
                                    const Decimal& pnl,
                                    unsigned int resolutionBar)
    {
      return TradeResult<Decimal>(TradeOutcome::Win, pnl, std::nullopt, levels,
                                  SkipReason::None, resolutionBar, std::string());
    }

    static TradeResult<Decimal> loss(const TradeLevels<Decimal>& levels,
                                     const Decimal& pnl,
                                     unsigned int resolutionBar)
    {
      return TradeResult<Decimal>(TradeOutcome::Loss, pnl, std::nullopt, levels,
                                  SkipReason::None, resolutionBar, std::string());
    }

    static TradeResult<Decimal> skip(SkipReason reason)
    {
      return TradeResult<Decimal>(TradeOutcome::Skip, DecimalConstants<Decimal>::DecimalZero,
                                  std::nullopt, std::nullopt, reason, std::nullopt, std::string());
    }

    // Skip where only the entry price is known
    static TradeResult<Decimal> skip(SkipReason reason, const Decimal& entry)
    {
      return TradeResult<Decimal>(TradeOutcome::Skip, DecimalConstants<Decimal>::DecimalZero,
                                  entry, std::nullopt, reason, std::nullopt, std::string());
    }

    static TradeResult<Decimal> skip(SkipReason reason,
                                     const TradeLevels<Decimal>& levels,
                                     std::optional<unsigned int> resolutionBar = std::nullopt)
    {
      return TradeResult<Decimal>(TradeOutcome::Skip, DecimalConstants<Decimal>::DecimalZero,
                                  std::nullopt, levels, reason, resolutionBar, std::string());
    }

    TradeResult<Decimal> withKey(const std::string& key) const
    {
      TradeResult<Decimal> tagged(*this);
      tagged.mKey = key;
      return tagged;
    }

    TradeOutcome getOutcome() const
    {
      return mOutcome;
    }

    bool isDecisive() const
    {
      return mOutcome != TradeOutcome::Skip;
    }

    const Decimal& getPnl() const
    {
      return mPnl;
    }

    std::optional<Decimal> getEntry() const
    {
      if (mLevels)
        return mLevels->getEntry();

      return mEntry;
    }

    std::optional<Decimal> getTarget() const
    {
      if (mLevels)
        return mLevels->getTarget();

      return std::nullopt;
    }

    std::optional<Decimal> getStop() const
    {
      if (mLevels)
        return mLevels->getStop();

      return std::nullopt;
    }

    SkipReason getSkipReason() const
    {
      return mSkipReason;
    }

    // 1-based bar on which the target or stop was reached
    const std::optional<unsigned int>& getResolutionBar() const
    {
      return mResolutionBar;
    }

    // Key of the chart view the trade was simulated on
    const std::string& getKey() const
    {
      return mKey;
    }

  private:
    TradeResult(TradeOutcome outcome,
                const Decimal& pnl,
                const std::optional<Decimal>& entry,
                const std::optional<TradeLevels<Decimal>>& levels,
                SkipReason skipReason,
                const std::optional<unsigned int>& resolutionBar,
                const std::string& key)
      : mOutcome(outcome),
        mPnl(pnl),
        mEntry(entry),
        mLevels(levels),
        mSkipReason(skipReason),
        mResolutionBar(resolutionBar),
        mKey(key)
    {}

    TradeOutcome mOutcome;
    Decimal mPnl;
    std::optional<Decimal> mEntry;
    std::optional<TradeLevels<Decimal>> mLevels;
    SkipReason mSkipReason;
    std::optional<unsigned int> mResolutionBar;
    std::string mKey;
  };
}

#endif

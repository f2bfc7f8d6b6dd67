// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRADE_PARAMS_H
#define __TRADE_PARAMS_H 1

#include <optional>
#include <string>
#include "DecimalConstants.h"

namespace chartsieve
{
  enum class TradeDirection { Long, Short };

  // "Long", "Short"
  std::string tradeDirectionToString(TradeDirection direction);
  std::optional<TradeDirection> tradeDirectionFromString(const std::string& directionString);

  /**
   * @class TradeParams
   * @brief Parameters of the single-trade strategy applied to each chart view.
   *
   * The trade enters at the close of bar triggerBar (1-based). Target and
   * stop distances are percentages of the trigger bar's high-low range.
   * A TradeParams may hold values that do not describe a usable trade;
   * check isValid() before simulating.
   */
  template <class Decimal>
  class TradeParams
  {
  public:
    TradeParams(int triggerBar,
                TradeDirection direction,
                const Decimal& targetPct,
                const Decimal& stopPct)
      : mTriggerBar(triggerBar),
        mDirection(direction),
        mTargetPct(targetPct),
        mStopPct(stopPct)
    {}

    int getTriggerBar() const
    {
      return mTriggerBar;
    }

    TradeDirection getDirection() const
    {
      return mDirection;
    }

    bool isLong() const
    {
      return mDirection == TradeDirection::Long;
    }

    const Decimal& getTargetPct() const
    {
      return mTargetPct;
    }

    const Decimal& getStopPct() const
    {
      return mStopPct;
    }

    bool isValid() const
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      if (mTriggerBar < 1)
        return false;

      if (mDirection != TradeDirection::Long && mDirection != TradeDirection::Short)
        return false;

      return (mTargetPct > zero) && (mStopPct > zero);
    }

  private:
    int mTriggerBar;
    TradeDirection mDirection;
    Decimal mTargetPct;
    Decimal mStopPct;
  };
}

#endif

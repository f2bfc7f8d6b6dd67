// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRADE_SIMULATOR_H
#define __TRADE_SIMULATOR_H 1

#include <memory>
#include <optional>
#include <vector>
#include "ChartView.h"
#include "DecimalConstants.h"
#include "SimulationSummary.h"
#include "TradeParams.h"
#include "TradeResult.h"

namespace chartsieve
{
  /**
   * @class TradeSimulator
   * @brief Backtests a single target/stop trade on each chart view.
   *
   * The trade enters at the close of the trigger bar. The target and stop
   * are placed at targetPct and stopPct of the trigger bar's range away from
   * the entry. Bars after the trigger are scanned in order and the first bar
   * that reaches the target or the stop decides the trade. A bar that reaches
   * both cannot be ordered from OHLC data alone and the trade is skipped.
   */
  template <class Decimal>
  class TradeSimulator
  {
  public:
    using ViewPtr = std::shared_ptr<ChartView<Decimal>>;

    static TradeResult<Decimal> simulateOne(const ChartView<Decimal>& view,
                                            const TradeParams<Decimal>& params)
    {
      const auto& bars = view.getBars();

      if (params.getTriggerBar() < 1 ||
          static_cast<size_t>(params.getTriggerBar()) > bars.size())
        return TradeResult<Decimal>::skip(SkipReason::NotEnoughBars);

      size_t triggerIndex = static_cast<size_t>(params.getTriggerBar() - 1);
      const IntradayBar<Decimal>& triggerBar = bars[triggerIndex];

      Decimal entry = triggerBar.getCloseValue();
      Decimal range = triggerBar.getRange();

      if (range <= DecimalConstants<Decimal>::DecimalZero)
        return TradeResult<Decimal>::skip(SkipReason::ZeroRange, entry);

      Decimal targetOffset = (params.getTargetPct() / DecimalConstants<Decimal>::DecimalOneHundred) * range;
      Decimal stopOffset = (params.getStopPct() / DecimalConstants<Decimal>::DecimalOneHundred) * range;

      bool isLong = params.isLong();
      Decimal target = isLong ? entry + targetOffset : entry - targetOffset;
      Decimal stop = isLong ? entry - stopOffset : entry + stopOffset;
      TradeLevels<Decimal> levels(entry, target, stop);

      for (size_t i = triggerIndex + 1; i < bars.size(); ++i)
        {
          const IntradayBar<Decimal>& bar = bars[i];
          bool hitTarget, hitStop;

          if (isLong)
            {
              hitTarget = bar.getHighValue() >= target;
              hitStop = bar.getLowValue() <= stop;
            }
          else
            {
              hitTarget = bar.getLowValue() <= target;
              hitStop = bar.getHighValue() >= stop;
            }

          unsigned int barNumber = static_cast<unsigned int>(i + 1);

          if (hitTarget && hitStop)
            return TradeResult<Decimal>::skip(SkipReason::BothHit, levels, barNumber);
          else if (hitTarget)
            return TradeResult<Decimal>::win(levels, targetOffset, barNumber);
          else if (hitStop)
            return TradeResult<Decimal>::loss(levels, DecimalConstants<Decimal>::DecimalZero - stopOffset,
                                              barNumber);
        }

      return TradeResult<Decimal>::skip(SkipReason::EndOfDay, levels);
    }

    /**
     * @brief Simulates the trade on every view, in order.
     * @return The summary, or std::nullopt if params is not valid.
     */
    static std::optional<SimulationSummary<Decimal>> simulate(const std::vector<ViewPtr>& views,
                                                              const TradeParams<Decimal>& params)
    {
      if (!params.isValid())
        return std::nullopt;

      std::vector<TradeResult<Decimal>> trades;
      trades.reserve(views.size());

      for (const auto& view : views)
        trades.push_back(simulateOne(*view, params).withKey(view->getKey()));

      return SimulationSummary<Decimal>(std::move(trades));
    }
  };
}

#endif

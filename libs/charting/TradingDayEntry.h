// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRADING_DAY_ENTRY_H
#define __TRADING_DAY_ENTRY_H 1

#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "IntradayBar.h"

namespace chartsieve
{
  using boost::gregorian::date;

  /**
   * @brief Prior-session reference prices. Any of them may be missing, e.g.
   * for the first day of a source.
   */
  template <class Decimal>
  class PriorDayLevels
  {
  public:
    PriorDayLevels() = default;

    PriorDayLevels(const std::optional<Decimal>& prevClose,
                   const std::optional<Decimal>& prevHigh,
                   const std::optional<Decimal>& prevLow)
      : mPrevClose(prevClose),
        mPrevHigh(prevHigh),
        mPrevLow(prevLow)
    {}

    const std::optional<Decimal>& getPrevClose() const
    {
      return mPrevClose;
    }

    const std::optional<Decimal>& getPrevHigh() const
    {
      return mPrevHigh;
    }

    const std::optional<Decimal>& getPrevLow() const
    {
      return mPrevLow;
    }

  private:
    std::optional<Decimal> mPrevClose;
    std::optional<Decimal> mPrevHigh;
    std::optional<Decimal> mPrevLow;
  };

  /**
   * @class TradingDayEntry
   * @brief One trading day of one source at the dataset's base frequency.
   *
   * The gap labels and prior-day flags are precomputed by the data
   * preparation step and are taken as delivered. Entries are immutable and
   * are shared between the catalog and every view derived from them.
   */
  template <class Decimal>
  class TradingDayEntry
  {
  public:
    using BarVector = std::vector<IntradayBar<Decimal>>;

    TradingDayEntry(const std::string& sourceName,
                    const std::string& timezone,
                    const std::string& tradingHours,
                    const date& tradingDate,
                    const std::string& gapDirection,
                    const std::string& gapSizeClass,
                    bool openAbovePrevHigh,
                    bool closeBelowPrevLow,
                    const PriorDayLevels<Decimal>& priorDayLevels,
                    BarVector bars)
      : mSourceName(sourceName),
        mTimezone(timezone),
        mTradingHours(tradingHours),
        mDate(tradingDate),
        mGapDirection(gapDirection),
        mGapSizeClass(gapSizeClass),
        mOpenAbovePrevHigh(openAbovePrevHigh),
        mCloseBelowPrevLow(closeBelowPrevLow),
        mPriorDayLevels(priorDayLevels),
        mBars(std::move(bars))
    {}

    const std::string& getSourceName() const
    {
      return mSourceName;
    }

    // Timezone of the source the day belongs to, e.g. America/Chicago
    const std::string& getTimezone() const
    {
      return mTimezone;
    }

    // Session descriptor of the source, e.g. 08:00-17:00
    const std::string& getTradingHours() const
    {
      return mTradingHours;
    }

    const date& getDate() const
    {
      return mDate;
    }

    // Date in the dataset's YYYYMMDD form
    std::string getDateString() const
    {
      return boost::gregorian::to_iso_string(mDate);
    }

    const std::string& getGapDirection() const
    {
      return mGapDirection;
    }

    const std::string& getGapSizeClass() const
    {
      return mGapSizeClass;
    }

    bool isOpenAbovePrevHigh() const
    {
      return mOpenAbovePrevHigh;
    }

    bool isCloseBelowPrevLow() const
    {
      return mCloseBelowPrevLow;
    }

    const PriorDayLevels<Decimal>& getPriorDayLevels() const
    {
      return mPriorDayLevels;
    }

    const BarVector& getBars() const
    {
      return mBars;
    }

    size_t getNumBars() const
    {
      return mBars.size();
    }

  private:
    std::string mSourceName;
    std::string mTimezone;
    std::string mTradingHours;
    date mDate;
    std::string mGapDirection;
    std::string mGapSizeClass;
    bool mOpenAbovePrevHigh;
    bool mCloseBelowPrevLow;
    PriorDayLevels<Decimal> mPriorDayLevels;
    BarVector mBars;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __INTRADAY_BAR_H
#define __INTRADAY_BAR_H 1

#include <cstdint>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DecimalConstants.h"

namespace chartsieve
{
  using boost::posix_time::ptime;

  inline ptime timestampMsToPtime(std::int64_t timestampMs)
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch + boost::posix_time::milliseconds(timestampMs);
  }

  inline std::int64_t ptimeToTimestampMs(const ptime& dateTime)
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return (dateTime - epoch).total_milliseconds();
  }

  /**
   * @brief One intraday OHLC candle.
   *
   * Unlike a validated time series entry, an IntradayBar does not reject bars
   * whose open or close lie outside [low, high]: chart data is trusted as
   * delivered.
   */
  template <class Decimal>
  class IntradayBar
  {
  public:
    IntradayBar (const ptime& dateTime,
                 const Decimal& open,
                 const Decimal& high,
                 const Decimal& low,
                 const Decimal& close)
      : mDateTime(dateTime),
        mOpen(open),
        mHigh(high),
        mLow(low),
        mClose(close)
    {}

    IntradayBar (std::int64_t timestampMs,
                 const Decimal& open,
                 const Decimal& high,
                 const Decimal& low,
                 const Decimal& close)
      : IntradayBar(timestampMsToPtime(timestampMs), open, high, low, close)
    {}

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    std::int64_t getTimestampMs() const
    {
      return ptimeToTimestampMs(mDateTime);
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    Decimal getRange() const
    {
      return mHigh - mLow;
    }

  private:
    ptime mDateTime;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
  };

  template <class Decimal>
  bool operator==(const IntradayBar<Decimal>& lhs, const IntradayBar<Decimal>& rhs)
  {
    return ((lhs.getDateTime() == rhs.getDateTime()) &&
            (lhs.getOpenValue() == rhs.getOpenValue()) &&
            (lhs.getHighValue() == rhs.getHighValue()) &&
            (lhs.getLowValue() == rhs.getLowValue()) &&
            (lhs.getCloseValue() == rhs.getCloseValue()));
  }

  template <class Decimal>
  bool operator!=(const IntradayBar<Decimal>& lhs, const IntradayBar<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif

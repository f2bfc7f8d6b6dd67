// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BARS_OPTION_H
#define __BARS_OPTION_H 1

#include <cstddef>
#include <string>
#include "ChartSieveException.h"

namespace chartsieve
{
  /**
   * @brief How many bars of a trading day a chart view shows.
   *
   * Either the whole day (allBars) or the first n bars (limited(n)).
   */
  class BarsOption
  {
  public:
    static BarsOption allBars()
    {
      return BarsOption(0);
    }

    // @throws BarsOptionException if maxBars is zero
    static BarsOption limited(unsigned int maxBars);

    // Accepts "all" or a positive bar count
    static BarsOption fromString(const std::string& optionString);

    bool isAllBars() const
    {
      return mLimit == 0;
    }

    // Only meaningful when !isAllBars()
    unsigned int getLimit() const
    {
      return mLimit;
    }

    size_t getBarCount(size_t availableBars) const
    {
      if (isAllBars() || availableBars < mLimit)
        return availableBars;

      return mLimit;
    }

    /**
     * @brief A limit that covers the longest trading day shows the whole day,
     * so it is expressed as allBars.
     */
    BarsOption normalize(size_t longestDayBarCount) const
    {
      if (!isAllBars() && mLimit >= longestDayBarCount)
        return allBars();

      return *this;
    }

    // "all" or the limit, as used in view keys
    std::string toString() const;

    // "Full day" or "<n> bars"
    std::string getDisplayLabel() const;

  private:
    explicit BarsOption(unsigned int limit)
      : mLimit(limit)
    {}

    unsigned int mLimit;
  };

  inline bool operator==(const BarsOption& lhs, const BarsOption& rhs)
  {
    return lhs.isAllBars() == rhs.isAllBars() && lhs.getLimit() == rhs.getLimit();
  }

  inline bool operator!=(const BarsOption& lhs, const BarsOption& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif

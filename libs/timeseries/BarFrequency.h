// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BAR_FREQUENCY_H
#define __BAR_FREQUENCY_H 1

#include <string>
#include "ChartSieveException.h"

namespace chartsieve
{
  /**
   * @brief An intraday bar interval expressed in whole minutes.
   *
   * The textual form is "<N>min", e.g. "5min" or "60min", which is the form
   * used by the chart dataset and by run configuration files.
   */
  class BarFrequency
  {
  public:
    explicit BarFrequency(unsigned int minutes);

    /**
     * @brief Parses a frequency of the form "<N>min".
     * @throws BarFrequencyException if the string is not a positive number of minutes.
     */
    static BarFrequency fromString(const std::string& frequencyString);

    unsigned int getMinutes() const
    {
      return mMinutes;
    }

    std::string toString() const;

    /**
     * @brief Number of bars of frequency baseFrequency that make up one bar of
     * this frequency.
     * @throws BarFrequencyException if this frequency is not a whole multiple of
     * the base frequency.
     */
    unsigned int getAggregationFactor(const BarFrequency& baseFrequency) const;

  private:
    unsigned int mMinutes;
  };

  inline bool operator==(const BarFrequency& lhs, const BarFrequency& rhs)
  {
    return lhs.getMinutes() == rhs.getMinutes();
  }

  inline bool operator!=(const BarFrequency& lhs, const BarFrequency& rhs)
  {
    return !(lhs == rhs);
  }

  inline bool operator<(const BarFrequency& lhs, const BarFrequency& rhs)
  {
    return lhs.getMinutes() < rhs.getMinutes();
  }
}

#endif

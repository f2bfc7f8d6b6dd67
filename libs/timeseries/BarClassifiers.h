// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BAR_CLASSIFIERS_H
#define __BAR_CLASSIFIERS_H 1

#include <optional>
#include <string>
#include <vector>
#include "number.h"
#include "DecimalConstants.h"
#include "IntradayBar.h"

namespace chartsieve
{
  enum class BarDirection { Up, Down, Flat };

  enum class BodyRatioClass { LessThan25, From25To50, From50To75, Above75 };

  // "UP", "DOWN", "FLAT"
  std::string barDirectionToString(BarDirection direction);
  std::optional<BarDirection> barDirectionFromString(const std::string& directionString);

  // "<25%", "25-50%", "50-75%", ">75%"
  std::string bodyRatioClassToString(BodyRatioClass ratioClass);
  std::optional<BodyRatioClass> bodyRatioClassFromString(const std::string& ratioString);

  /**
   * @brief Labels a bar by the sign of close minus open.
   */
  class DirectionClassifier
  {
  public:
    template <class Decimal>
    static BarDirection classify(const IntradayBar<Decimal>& bar)
    {
      if (bar.getCloseValue() > bar.getOpenValue())
        return BarDirection::Up;
      else if (bar.getCloseValue() < bar.getOpenValue())
        return BarDirection::Down;
      else
        return BarDirection::Flat;
    }

    template <class Decimal>
    static std::vector<BarDirection> classifyAll(const std::vector<IntradayBar<Decimal>>& bars)
    {
      std::vector<BarDirection> directions;
      directions.reserve(bars.size());

      for (const auto& bar : bars)
        directions.push_back(classify(bar));

      return directions;
    }
  };

  /**
   * @brief Buckets a bar by the size of its body relative to its full range.
   *
   * The ratio is |close - open| / (high - low) * 100. A bar with no range
   * falls in the smallest bucket.
   */
  class BodyRatioClassifier
  {
  public:
    template <class Decimal>
    static BodyRatioClass classify(const IntradayBar<Decimal>& bar)
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      Decimal range = bar.getRange();

      if (range <= zero)
        return BodyRatioClass::LessThan25;

      Decimal body = num::abs<Decimal>(bar.getCloseValue() - bar.getOpenValue());
      Decimal scaledBody = body * DecimalConstants<Decimal>::DecimalOneHundred;

      // body * 100 against threshold * range, without dividing
      if (scaledBody < DecimalConstants<Decimal>::TwentyFivePercent * range)
        return BodyRatioClass::LessThan25;
      else if (scaledBody < DecimalConstants<Decimal>::FiftyPercent * range)
        return BodyRatioClass::From25To50;
      else if (scaledBody < DecimalConstants<Decimal>::SeventyFivePercent * range)
        return BodyRatioClass::From50To75;
      else
        return BodyRatioClass::Above75;
    }

    template <class Decimal>
    static std::vector<BodyRatioClass> classifyAll(const std::vector<IntradayBar<Decimal>>& bars)
    {
      std::vector<BodyRatioClass> ratios;
      ratios.reserve(bars.size());

      for (const auto& bar : bars)
        ratios.push_back(classify(bar));

      return ratios;
    }
  };
}

#endif

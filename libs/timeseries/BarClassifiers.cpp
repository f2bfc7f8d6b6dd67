// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <boost/algorithm/string.hpp>
#include "BarClassifiers.h"

namespace chartsieve
{
  std::string barDirectionToString(BarDirection direction)
  {
    switch (direction)
      {
      case BarDirection::Up:
        return "UP";
      case BarDirection::Down:
        return "DOWN";
      case BarDirection::Flat:
        return "FLAT";
      }

    return "FLAT";
  }

  std::optional<BarDirection> barDirectionFromString(const std::string& directionString)
  {
    std::string upperCaseStr = boost::to_upper_copy(boost::trim_copy(directionString));

    if (upperCaseStr == "UP")
      return BarDirection::Up;
    else if (upperCaseStr == "DOWN")
      return BarDirection::Down;
    else if (upperCaseStr == "FLAT")
      return BarDirection::Flat;
    else
      return std::nullopt;
  }

  std::string bodyRatioClassToString(BodyRatioClass ratioClass)
  {
    switch (ratioClass)
      {
      case BodyRatioClass::LessThan25:
        return "<25%";
      case BodyRatioClass::From25To50:
        return "25-50%";
      case BodyRatioClass::From50To75:
        return "50-75%";
      case BodyRatioClass::Above75:
        return ">75%";
      }

    return "<25%";
  }

  std::optional<BodyRatioClass> bodyRatioClassFromString(const std::string& ratioString)
  {
    std::string trimmed = boost::trim_copy(ratioString);

    if (trimmed == "<25%")
      return BodyRatioClass::LessThan25;
    else if (trimmed == "25-50%")
      return BodyRatioClass::From25To50;
    else if (trimmed == "50-75%")
      return BodyRatioClass::From50To75;
    else if (trimmed == ">75%")
      return BodyRatioClass::Above75;
    else
      return std::nullopt;
  }
}

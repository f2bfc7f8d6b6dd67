// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cctype>
#include <boost/algorithm/string.hpp>
#include "BarFrequency.h"

namespace chartsieve
{
  BarFrequency::BarFrequency(unsigned int minutes)
    : mMinutes(minutes)
  {
    if (minutes == 0)
      throw BarFrequencyException("BarFrequency: interval must be at least one minute");
  }

  BarFrequency BarFrequency::fromString(const std::string& frequencyString)
  {
    std::string lowerCaseStr = boost::to_lower_copy(boost::trim_copy(frequencyString));

    if (!boost::ends_with(lowerCaseStr, "min"))
      throw BarFrequencyException("BarFrequency: frequency string " + frequencyString + " not recognized");

    std::string digits = lowerCaseStr.substr(0, lowerCaseStr.size() - 3);
    if (digits.empty() || digits.size() > 4)
      throw BarFrequencyException("BarFrequency: frequency string " + frequencyString + " not recognized");

    for (char c : digits)
      if (!std::isdigit(static_cast<unsigned char>(c)))
        throw BarFrequencyException("BarFrequency: frequency string " + frequencyString + " not recognized");

    return BarFrequency(static_cast<unsigned int>(std::stoul(digits)));
  }

  std::string BarFrequency::toString() const
  {
    return std::to_string(mMinutes) + "min";
  }

  unsigned int BarFrequency::getAggregationFactor(const BarFrequency& baseFrequency) const
  {
    if (mMinutes < baseFrequency.getMinutes() || (mMinutes % baseFrequency.getMinutes()) != 0)
      throw BarFrequencyException("BarFrequency: " + toString() +
                                  " is not a whole multiple of base frequency " +
                                  baseFrequency.toString());

    return mMinutes / baseFrequency.getMinutes();
  }
}

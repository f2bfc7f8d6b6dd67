// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cctype>
#include <boost/algorithm/string.hpp>
#include "BarsOption.h"

namespace chartsieve
{
  BarsOption BarsOption::limited(unsigned int maxBars)
  {
    if (maxBars == 0)
      throw BarsOptionException("BarsOption::limited - bar limit must be positive");

    return BarsOption(maxBars);
  }

  BarsOption BarsOption::fromString(const std::string& optionString)
  {
    std::string lowerCaseStr = boost::to_lower_copy(boost::trim_copy(optionString));

    if (lowerCaseStr == "all")
      return allBars();

    if (lowerCaseStr.empty() || lowerCaseStr.size() > 6)
      throw BarsOptionException("BarsOption: bars option " + optionString + " not recognized");

    for (char c : lowerCaseStr)
      if (!std::isdigit(static_cast<unsigned char>(c)))
        throw BarsOptionException("BarsOption: bars option " + optionString + " not recognized");

    return limited(static_cast<unsigned int>(std::stoul(lowerCaseStr)));
  }

  std::string BarsOption::toString() const
  {
    if (isAllBars())
      return "all";

    return std::to_string(mLimit);
  }

  std::string BarsOption::getDisplayLabel() const
  {
    if (isAllBars())
      return "Full day";

    return std::to_string(mLimit) + " bars";
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <boost/algorithm/string.hpp>
#include "TradeParams.h"
#include "TradeResult.h"

namespace chartsieve
{
  std::string tradeDirectionToString(TradeDirection direction)
  {
    return (direction == TradeDirection::Long) ? "Long" : "Short";
  }

  std::optional<TradeDirection> tradeDirectionFromString(const std::string& directionString)
  {
    std::string lowerCaseStr = boost::to_lower_copy(boost::trim_copy(directionString));

    if (lowerCaseStr == "long")
      return TradeDirection::Long;
    else if (lowerCaseStr == "short")
      return TradeDirection::Short;
    else
      return std::nullopt;
  }

  std::string tradeOutcomeToString(TradeOutcome outcome)
  {
    switch (outcome)
      {
      case TradeOutcome::Win:
        return "WIN";
      case TradeOutcome::Loss:
        return "LOSS";
      case TradeOutcome::Skip:
        return "SKIP";
      }

    return "SKIP";
  }

  std::string skipReasonToString(SkipReason reason)
  {
    switch (reason)
      {
      case SkipReason::None:
        return "";
      case SkipReason::NotEnoughBars:
        return "not enough bars";
      case SkipReason::ZeroRange:
        return "zero range";
      case SkipReason::BothHit:
        return "both hit";
      case SkipReason::EndOfDay:
        return "end of day";
      }

    return "";
  }
}

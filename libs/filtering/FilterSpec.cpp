// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "FilterSpec.h"

namespace chartsieve
{
  std::string priorDayConditionToString(PriorDayCondition condition)
  {
    switch (condition)
      {
      case PriorDayCondition::OpenAbovePrevHigh:
        return "open_above_prev_high";
      case PriorDayCondition::CloseBelowPrevLow:
        return "close_below_prev_low";
      }

    return "open_above_prev_high";
  }

  std::optional<PriorDayCondition> priorDayConditionFromString(const std::string& conditionString)
  {
    std::string lowerCaseStr = boost::to_lower_copy(boost::trim_copy(conditionString));

    if (lowerCaseStr == "open_above_prev_high")
      return PriorDayCondition::OpenAbovePrevHigh;
    else if (lowerCaseStr == "close_below_prev_low")
      return PriorDayCondition::CloseBelowPrevLow;
    else
      return std::nullopt;
  }

  BarConstraint::BarConstraint(unsigned int barNumber,
                               BarDirection direction,
                               const std::optional<BodyRatioClass>& bodyRatio)
    : mBarNumber(barNumber),
      mDirection(direction),
      mBodyRatio(bodyRatio)
  {
    if (barNumber == 0)
      throw FilterSpecException("BarConstraint: bar numbers start at 1");
  }

  FilterSpec::FilterSpec()
    : mSources(),
      mFrequencies(),
      mBarsOptions(),
      mGapDirections(),
      mGapSizeClasses(),
      mPriorDayConditions(),
      mBarConstraints()
  {}

  void FilterSpec::addSource(const std::string& sourceName)
  {
    mSources.insert(sourceName);
  }

  void FilterSpec::addFrequency(const BarFrequency& frequency)
  {
    if (std::find(mFrequencies.begin(), mFrequencies.end(), frequency) == mFrequencies.end())
      mFrequencies.push_back(frequency);
  }

  void FilterSpec::addBarsOption(const BarsOption& barsOption)
  {
    if (std::find(mBarsOptions.begin(), mBarsOptions.end(), barsOption) == mBarsOptions.end())
      mBarsOptions.push_back(barsOption);
  }

  void FilterSpec::addGapDirection(const std::string& gapDirection)
  {
    mGapDirections.insert(gapDirection);
  }

  void FilterSpec::addGapSizeClass(const std::string& gapSizeClass)
  {
    mGapSizeClasses.insert(gapSizeClass);
  }

  void FilterSpec::addPriorDayCondition(PriorDayCondition condition)
  {
    mPriorDayConditions.insert(condition);
  }

  void FilterSpec::addBarConstraint(const BarConstraint& constraint)
  {
    removeBarConstraint(constraint.getBarNumber());

    auto pos = std::upper_bound(mBarConstraints.begin(), mBarConstraints.end(), constraint,
                                [](const BarConstraint& lhs, const BarConstraint& rhs) {
                                  return lhs.getBarNumber() < rhs.getBarNumber();
                                });
    mBarConstraints.insert(pos, constraint);
  }

  bool FilterSpec::removeBarConstraint(unsigned int barNumber)
  {
    auto it = std::find_if(mBarConstraints.begin(), mBarConstraints.end(),
                           [barNumber](const BarConstraint& c) { return c.getBarNumber() == barNumber; });
    if (it == mBarConstraints.end())
      return false;

    mBarConstraints.erase(it);
    return true;
  }
}

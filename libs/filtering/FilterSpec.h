// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __FILTER_SPEC_H
#define __FILTER_SPEC_H 1

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "BarClassifiers.h"
#include "BarFrequency.h"
#include "BarsOption.h"
#include "ChartSieveException.h"

namespace chartsieve
{
  enum class PriorDayCondition { OpenAbovePrevHigh, CloseBelowPrevLow };

  // "open_above_prev_high", "close_below_prev_low"
  std::string priorDayConditionToString(PriorDayCondition condition);
  std::optional<PriorDayCondition> priorDayConditionFromString(const std::string& conditionString);

  /**
   * @brief Requires bar `barNumber` (1-based) of a view to have the given
   * direction and, optionally, body ratio class.
   */
  class BarConstraint
  {
  public:
    // @throws FilterSpecException if barNumber is zero
    BarConstraint(unsigned int barNumber,
                  BarDirection direction,
                  const std::optional<BodyRatioClass>& bodyRatio = std::nullopt);

    unsigned int getBarNumber() const
    {
      return mBarNumber;
    }

    BarDirection getDirection() const
    {
      return mDirection;
    }

    // Empty means any body ratio
    const std::optional<BodyRatioClass>& getBodyRatio() const
    {
      return mBodyRatio;
    }

  private:
    unsigned int mBarNumber;
    BarDirection mDirection;
    std::optional<BodyRatioClass> mBodyRatio;
  };

  /**
   * @class FilterSpec
   * @brief The set of predicates a chart view must satisfy.
   *
   * Empty source, gap direction and gap size sets leave that dimension
   * unconstrained. An empty frequency list means the catalog's base
   * frequency and an empty bars option list means the whole day. Frequencies
   * and bars options keep the order in which they were added, which is the
   * order views are generated in.
   */
  class FilterSpec
  {
  public:
    FilterSpec();

    void addSource(const std::string& sourceName);
    void addFrequency(const BarFrequency& frequency);
    void addBarsOption(const BarsOption& barsOption);
    void addGapDirection(const std::string& gapDirection);
    void addGapSizeClass(const std::string& gapSizeClass);
    void addPriorDayCondition(PriorDayCondition condition);

    /**
     * @brief Adds a per-bar constraint. A constraint for a bar number that is
     * already constrained replaces the old one. Constraints stay sorted by
     * bar number.
     */
    void addBarConstraint(const BarConstraint& constraint);

    // @return true if a constraint for barNumber was removed
    bool removeBarConstraint(unsigned int barNumber);

    const std::set<std::string>& getSources() const
    {
      return mSources;
    }

    const std::vector<BarFrequency>& getFrequencies() const
    {
      return mFrequencies;
    }

    const std::vector<BarsOption>& getBarsOptions() const
    {
      return mBarsOptions;
    }

    const std::set<std::string>& getGapDirections() const
    {
      return mGapDirections;
    }

    const std::set<std::string>& getGapSizeClasses() const
    {
      return mGapSizeClasses;
    }

    const std::set<PriorDayCondition>& getPriorDayConditions() const
    {
      return mPriorDayConditions;
    }

    const std::vector<BarConstraint>& getBarConstraints() const
    {
      return mBarConstraints;
    }

  private:
    std::set<std::string> mSources;
    std::vector<BarFrequency> mFrequencies;
    std::vector<BarsOption> mBarsOptions;
    std::set<std::string> mGapDirections;
    std::set<std::string> mGapSizeClasses;
    std::set<PriorDayCondition> mPriorDayConditions;
    std::vector<BarConstraint> mBarConstraints;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __FILTER_ENGINE_H
#define __FILTER_ENGINE_H 1

#include <algorithm>
#include <memory>
#include <vector>
#include "ChartCatalog.h"
#include "FilterSpec.h"

namespace chartsieve
{
  /**
   * @class FilterEngine
   * @brief Produces the ordered list of chart views that satisfy a FilterSpec.
   *
   * Filtering runs in three stages:
   * 1. Trading days are matched on source, gap direction, gap size class and
   *    the requested prior-day conditions.
   * 2. Each surviving day is rendered once per (frequency, bars option)
   *    pair. Views with fewer than kMinimumViewBars bars are dropped.
   * 3. Every per-bar constraint must hold on the rendered view. A constraint
   *    naming a bar the view does not have fails.
   *
   * Results are in catalog order, then frequency order, then bars option
   * order. A bar limit covering the catalog's longest day is treated as the
   * whole day so that equivalent views are not produced twice.
   */
  template <class Decimal>
  class FilterEngine
  {
  public:
    using ViewPtr = typename ChartCatalog<Decimal>::ViewPtr;
    using EntryPtr = typename ChartCatalog<Decimal>::EntryPtr;

    static constexpr size_t kMinimumViewBars = 5;

    static std::vector<ViewPtr> generate(const ChartCatalog<Decimal>& catalog, const FilterSpec& spec)
    {
      std::vector<BarFrequency> frequencies(spec.getFrequencies());
      if (frequencies.empty())
        frequencies.push_back(catalog.getBaseFrequency());

      std::vector<BarsOption> barsOptions;
      if (spec.getBarsOptions().empty())
        barsOptions.push_back(BarsOption::allBars());
      else
        for (const auto& option : spec.getBarsOptions())
          {
            BarsOption normalized = option.normalize(catalog.getLongestDayBarCount());
            if (std::find(barsOptions.begin(), barsOptions.end(), normalized) == barsOptions.end())
              barsOptions.push_back(normalized);
          }

      std::vector<ViewPtr> views;

      for (auto it = catalog.beginEntries(); it != catalog.endEntries(); ++it)
        {
          const EntryPtr& entry = *it;
          if (!matchesEntry(*entry, spec))
            continue;

          for (const auto& frequency : frequencies)
            for (const auto& barsOption : barsOptions)
              {
                ViewPtr view = catalog.createView(entry, frequency, barsOption);

                if (view->getNumBars() < kMinimumViewBars)
                  continue;

                if (matchesBarConstraints(*view, spec))
                  views.push_back(view);
              }
        }

      return views;
    }

    static bool matchesEntry(const TradingDayEntry<Decimal>& entry, const FilterSpec& spec)
    {
      if (!spec.getSources().empty() &&
          spec.getSources().count(entry.getSourceName()) == 0)
        return false;

      if (!spec.getGapDirections().empty() &&
          spec.getGapDirections().count(entry.getGapDirection()) == 0)
        return false;

      if (!spec.getGapSizeClasses().empty() &&
          spec.getGapSizeClasses().count(entry.getGapSizeClass()) == 0)
        return false;

      for (PriorDayCondition condition : spec.getPriorDayConditions())
        {
          switch (condition)
            {
            case PriorDayCondition::OpenAbovePrevHigh:
              if (!entry.isOpenAbovePrevHigh())
                return false;
              break;

            case PriorDayCondition::CloseBelowPrevLow:
              if (!entry.isCloseBelowPrevLow())
                return false;
              break;
            }
        }

      return true;
    }

    static bool matchesBarConstraints(const ChartView<Decimal>& view, const FilterSpec& spec)
    {
      const auto& directions = view.getDirections();
      const auto& bodyRatios = view.getBodyRatios();

      for (const auto& constraint : spec.getBarConstraints())
        {
          size_t index = constraint.getBarNumber() - 1;

          if (index >= directions.size())
            return false;

          if (directions[index] != constraint.getDirection())
            return false;

          if (constraint.getBodyRatio() && bodyRatios[index] != *constraint.getBodyRatio())
            return false;
        }

      return true;
    }
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CHART_VIEW_H
#define __CHART_VIEW_H 1

#include <memory>
#include <string>
#include <vector>
#include "BarClassifiers.h"
#include "BarFrequency.h"
#include "BarsOption.h"
#include "TradingDayEntry.h"

namespace chartsieve
{
  /**
   * @class ChartView
   * @brief A trading day rendered at a requested frequency and bar limit.
   *
   * Views are derived on demand and never stored. The direction and body
   * ratio sequences always describe the bars held by the view, i.e. after
   * aggregation and truncation.
   */
  template <class Decimal>
  class ChartView
  {
  public:
    using EntryPtr = std::shared_ptr<const TradingDayEntry<Decimal>>;
    using BarVector = std::vector<IntradayBar<Decimal>>;

    ChartView(EntryPtr entry,
              const BarFrequency& frequency,
              const BarsOption& barsOption,
              BarVector bars)
      : mEntry(std::move(entry)),
        mFrequency(frequency),
        mBarsOption(barsOption),
        mBars(std::move(bars)),
        mDirections(DirectionClassifier::classifyAll(mBars)),
        mBodyRatios(BodyRatioClassifier::classifyAll(mBars))
    {}

    const TradingDayEntry<Decimal>& getEntry() const
    {
      return *mEntry;
    }

    const EntryPtr& getEntryPtr() const
    {
      return mEntry;
    }

    const BarFrequency& getFrequency() const
    {
      return mFrequency;
    }

    const BarsOption& getBarsOption() const
    {
      return mBarsOption;
    }

    const BarVector& getBars() const
    {
      return mBars;
    }

    size_t getNumBars() const
    {
      return mBars.size();
    }

    const std::vector<BarDirection>& getDirections() const
    {
      return mDirections;
    }

    const std::vector<BodyRatioClass>& getBodyRatios() const
    {
      return mBodyRatios;
    }

    /**
     * @brief Identifies the view as source-YYYYMMDD-frequency-barsOption,
     * e.g. "ES-20240105-15min-all".
     */
    std::string getKey() const
    {
      return mEntry->getSourceName() + "-" + mEntry->getDateString() + "-" +
        mFrequency.toString() + "-" + mBarsOption.toString();
    }

  private:
    EntryPtr mEntry;
    BarFrequency mFrequency;
    BarsOption mBarsOption;
    BarVector mBars;
    std::vector<BarDirection> mDirections;
    std::vector<BodyRatioClass> mBodyRatios;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CHART_DATASET_H
#define __CHART_DATASET_H 1

#include <memory>
#include <string>
#include <vector>
#include "BarFrequency.h"
#include "TradingDayEntry.h"

namespace chartsieve
{
  class DatasetMetadata
  {
  public:
    DatasetMetadata()
      : mGenerated(),
        mBaseFrequency(5),
        mSourceNames(),
        mTotalSources(0),
        mTotalTradingDays(0)
    {}

    DatasetMetadata(const std::string& generated,
                    const BarFrequency& baseFrequency,
                    const std::vector<std::string>& sourceNames,
                    size_t totalSources,
                    size_t totalTradingDays)
      : mGenerated(generated),
        mBaseFrequency(baseFrequency),
        mSourceNames(sourceNames),
        mTotalSources(totalSources),
        mTotalTradingDays(totalTradingDays)
    {}

    // Generation timestamp as written by the data preparation step
    const std::string& getGenerated() const
    {
      return mGenerated;
    }

    const BarFrequency& getBaseFrequency() const
    {
      return mBaseFrequency;
    }

    const std::vector<std::string>& getSourceNames() const
    {
      return mSourceNames;
    }

    size_t getTotalSources() const
    {
      return mTotalSources;
    }

    size_t getTotalTradingDays() const
    {
      return mTotalTradingDays;
    }

  private:
    std::string mGenerated;
    BarFrequency mBaseFrequency;
    std::vector<std::string> mSourceNames;
    size_t mTotalSources;
    size_t mTotalTradingDays;
  };

  /**
   * @brief Descriptive information about an instrument source.
   */
  class SourceMetadata
  {
  public:
    SourceMetadata(const std::string& name,
                   const std::string& timezone,
                   const std::string& tradingHours,
                   size_t numTradingDays)
      : mName(name),
        mTimezone(timezone),
        mTradingHours(tradingHours),
        mNumTradingDays(numTradingDays)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    const std::string& getTimezone() const
    {
      return mTimezone;
    }

    // e.g. "08:00-17:00"
    const std::string& getTradingHours() const
    {
      return mTradingHours;
    }

    size_t getNumTradingDays() const
    {
      return mNumTradingDays;
    }

  private:
    std::string mName;
    std::string mTimezone;
    std::string mTradingHours;
    size_t mNumTradingDays;
  };

  template <class Decimal>
  class ChartDataSource
  {
  public:
    using EntryPtr = std::shared_ptr<const TradingDayEntry<Decimal>>;

    ChartDataSource(const std::string& name,
                    const std::string& timezone,
                    const std::string& tradingHours,
                    std::vector<EntryPtr> tradingDays)
      : mName(name),
        mTimezone(timezone),
        mTradingHours(tradingHours),
        mTradingDays(std::move(tradingDays))
    {}

    const std::string& getName() const
    {
      return mName;
    }

    const std::string& getTimezone() const
    {
      return mTimezone;
    }

    const std::string& getTradingHours() const
    {
      return mTradingHours;
    }

    const std::vector<EntryPtr>& getTradingDays() const
    {
      return mTradingDays;
    }

    SourceMetadata getMetadata() const
    {
      return SourceMetadata(mName, mTimezone, mTradingHours, mTradingDays.size());
    }

  private:
    std::string mName;
    std::string mTimezone;
    std::string mTradingHours;
    std::vector<EntryPtr> mTradingDays;
  };

  /**
   * @brief The raw dataset: every source with its trading days, in file order.
   */
  template <class Decimal>
  class ChartDataset
  {
  public:
    ChartDataset(const DatasetMetadata& metadata,
                 std::vector<ChartDataSource<Decimal>> sources)
      : mMetadata(metadata),
        mSources(std::move(sources))
    {}

    const DatasetMetadata& getMetadata() const
    {
      return mMetadata;
    }

    const std::vector<ChartDataSource<Decimal>>& getSources() const
    {
      return mSources;
    }

  private:
    DatasetMetadata mMetadata;
    std::vector<ChartDataSource<Decimal>> mSources;
  };
}

#endif

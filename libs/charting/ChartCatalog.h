// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CHART_CATALOG_H
#define __CHART_CATALOG_H 1

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "BarAggregator.h"
#include "ChartDataset.h"
#include "ChartSieveException.h"
#include "ChartView.h"

namespace chartsieve
{
  /**
   * @class ChartCatalog
   * @brief Flat, read-only index of every trading day in a chart dataset.
   *
   * Entries are kept source-major, then in the day order of the dataset. The
   * catalog never changes after construction and may be shared freely.
   */
  template <class Decimal>
  class ChartCatalog
  {
  public:
    using EntryPtr = std::shared_ptr<const TradingDayEntry<Decimal>>;
    using EntryVector = std::vector<EntryPtr>;
    using ConstEntryIterator = typename EntryVector::const_iterator;
    using ViewPtr = std::shared_ptr<ChartView<Decimal>>;

    static constexpr unsigned int kDefaultBarEnumerationCeiling = 120;

    /**
     * @param dataset The parsed dataset.
     * @param barEnumerationCeiling Upper bound reported by getMaxBaseBarCount().
     */
    explicit ChartCatalog(const ChartDataset<Decimal>& dataset,
                          unsigned int barEnumerationCeiling = kDefaultBarEnumerationCeiling)
      : mMetadata(dataset.getMetadata()),
        mBarEnumerationCeiling(barEnumerationCeiling),
        mEntries(),
        mSourceNames(),
        mSourceMetadata(),
        mEntryIndex(),
        mLongestDayBarCount(0)
    {
      for (const auto& source : dataset.getSources())
        {
          if (mSourceMetadata.find(source.getName()) == mSourceMetadata.end())
            {
              mSourceNames.push_back(source.getName());
              mSourceMetadata.emplace(source.getName(), source.getMetadata());
            }

          for (const auto& entry : source.getTradingDays())
            {
              // Lookups resolve to the first entry for a (source, date) pair
              mEntryIndex.emplace(std::make_pair(entry->getSourceName(), entry->getDate()),
                                  mEntries.size());
              mEntries.push_back(entry);
              mLongestDayBarCount = std::max(mLongestDayBarCount, entry->getNumBars());
            }
        }
    }

    static ChartCatalog<Decimal> load(const ChartDataset<Decimal>& dataset,
                                      unsigned int barEnumerationCeiling = kDefaultBarEnumerationCeiling)
    {
      return ChartCatalog<Decimal>(dataset, barEnumerationCeiling);
    }

    // Distinct source names in dataset order
    const std::vector<std::string>& getSources() const
    {
      return mSourceNames;
    }

    std::optional<SourceMetadata> getSourceMetadata(const std::string& sourceName) const
    {
      auto it = mSourceMetadata.find(sourceName);
      if (it == mSourceMetadata.end())
        return std::nullopt;

      return it->second;
    }

    /**
     * @brief Largest base-frequency bar count of any trading day, capped at the
     * bar enumeration ceiling. Used to bound the bar numbers offered for
     * per-bar constraints.
     */
    size_t getMaxBaseBarCount() const
    {
      return std::min(mLongestDayBarCount, static_cast<size_t>(mBarEnumerationCeiling));
    }

    // Uncapped counterpart of getMaxBaseBarCount()
    size_t getLongestDayBarCount() const
    {
      return mLongestDayBarCount;
    }

    size_t getNumTradingDays() const
    {
      return mEntries.size();
    }

    const BarFrequency& getBaseFrequency() const
    {
      return mMetadata.getBaseFrequency();
    }

    const DatasetMetadata& getMetadata() const
    {
      return mMetadata;
    }

    ConstEntryIterator beginEntries() const
    {
      return mEntries.begin();
    }

    ConstEntryIterator endEntries() const
    {
      return mEntries.end();
    }

    const EntryVector& getEntries() const
    {
      return mEntries;
    }

    /**
     * @brief Builds the view of (source, date) at the requested frequency and
     * bar limit.
     * @return The view, or nullptr if the catalog has no such trading day.
     * @throws BarFrequencyException if frequency is not a whole multiple of the
     * base frequency.
     */
    ViewPtr getView(const std::string& sourceName,
                    const date& tradingDate,
                    const BarFrequency& frequency,
                    const BarsOption& barsOption) const
    {
      auto it = mEntryIndex.find(std::make_pair(sourceName, tradingDate));
      if (it == mEntryIndex.end())
        return ViewPtr();

      return createView(mEntries[it->second], frequency, barsOption);
    }

    ViewPtr createView(const EntryPtr& entry,
                       const BarFrequency& frequency,
                       const BarsOption& barsOption) const
    {
      auto bars = BarAggregator<Decimal>::aggregate(entry->getBars(),
                                                    getBaseFrequency(),
                                                    frequency);
      size_t barCount = barsOption.getBarCount(bars.size());
      bars.erase(bars.begin() + barCount, bars.end());

      return std::make_shared<ChartView<Decimal>>(entry, frequency, barsOption, std::move(bars));
    }

  private:
    DatasetMetadata mMetadata;
    unsigned int mBarEnumerationCeiling;
    EntryVector mEntries;
    std::vector<std::string> mSourceNames;
    std::map<std::string, SourceMetadata> mSourceMetadata;
    std::map<std::pair<std::string, date>, size_t> mEntryIndex;
    size_t mLongestDayBarCount;
  };
}

#endif

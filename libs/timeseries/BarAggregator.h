// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BAR_AGGREGATOR_H
#define __BAR_AGGREGATOR_H 1

#include <algorithm>
#include <vector>
#include "BarFrequency.h"
#include "IntradayBar.h"

namespace chartsieve
{
  /**
   * @class BarAggregator
   * @brief Combines consecutive fine-grained bars into coarser bars.
   *
   * Bars are grouped into consecutive chunks of `factor` bars starting at the
   * first bar. A final chunk with fewer than `factor` bars is kept. Each chunk
   * becomes one bar carrying the timestamp and open of its first bar, the
   * highest high, the lowest low and the close of its last bar.
   */
  template <class Decimal>
  class BarAggregator
  {
  public:
    using BarVector = std::vector<IntradayBar<Decimal>>;

    static BarVector aggregate(const BarVector& bars, unsigned int factor)
    {
      if (factor == 0)
        throw BarAggregatorException("BarAggregator::aggregate - aggregation factor must be positive");

      if (factor == 1)
        return bars;

      BarVector aggregated;
      aggregated.reserve((bars.size() + factor - 1) / factor);

      for (size_t chunkStart = 0; chunkStart < bars.size(); chunkStart += factor)
        {
          size_t chunkEnd = std::min(chunkStart + factor, bars.size());
          const IntradayBar<Decimal>& first = bars[chunkStart];

          Decimal high = first.getHighValue();
          Decimal low = first.getLowValue();

          for (size_t i = chunkStart + 1; i < chunkEnd; ++i)
            {
              if (bars[i].getHighValue() > high)
                high = bars[i].getHighValue();

              if (bars[i].getLowValue() < low)
                low = bars[i].getLowValue();
            }

          aggregated.emplace_back(first.getDateTime(),
                                  first.getOpenValue(),
                                  high,
                                  low,
                                  bars[chunkEnd - 1].getCloseValue());
        }

      return aggregated;
    }

    static BarVector aggregate(const BarVector& bars,
                               const BarFrequency& baseFrequency,
                               const BarFrequency& targetFrequency)
    {
      return aggregate(bars, targetFrequency.getAggregationFactor(baseFrequency));
    }
  };
}

#endif

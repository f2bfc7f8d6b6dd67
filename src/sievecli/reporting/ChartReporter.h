#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "number.h"
#include "BarClassifiers.h"
#include "ChartCatalog.h"
#include "ChartView.h"

namespace sievecli
{
namespace reporting
{

using Num = num::DefaultNumber;
using ChartViewPtr = std::shared_ptr<chartsieve::ChartView<Num>>;

/**
 * @brief Console and log-file listings of the dataset and of filtered charts
 */
class ChartReporter
{
public:
    /**
     * @brief Order views by trading date for presentation. Views with the same
     * date keep their relative order.
     */
    static std::vector<ChartViewPtr> sortChronologically(const std::vector<ChartViewPtr>& views);

    /**
     * @brief Write one line per chart. The first maxCharts views, in the
     * order given, are listed in chronological order.
     */
    static void writeChartList(std::ostream& os,
                               const std::vector<ChartViewPtr>& views,
                               size_t maxCharts);

    static void writeSourceList(std::ostream& os,
                                const chartsieve::ChartCatalog<Num>& catalog);

    // e.g. "UP DOWN FLAT ..." limited to the first maxBars bars
    static std::string formatDirections(const std::vector<chartsieve::BarDirection>& directions,
                                        size_t maxBars);
};

} // namespace reporting
} // namespace sievecli

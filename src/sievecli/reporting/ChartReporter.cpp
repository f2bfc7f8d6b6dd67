#include "ChartReporter.h"
#include "TimeUtils.h"
#include <algorithm>
#include <iomanip>

using namespace chartsieve;

namespace sievecli
{
namespace reporting
{

namespace
{
    const size_t kDirectionsShown = 20;
}

std::vector<ChartViewPtr> ChartReporter::sortChronologically(const std::vector<ChartViewPtr>& views)
{
    std::vector<ChartViewPtr> sorted(views);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ChartViewPtr& lhs, const ChartViewPtr& rhs) {
                         return lhs->getEntry().getDate() < rhs->getEntry().getDate();
                     });
    return sorted;
}

void ChartReporter::writeChartList(std::ostream& os,
                                   const std::vector<ChartViewPtr>& views,
                                   size_t maxCharts)
{
    os << "Matching charts: " << views.size() << std::endl;

    if (views.empty())
    {
        return;
    }

    // The first maxCharts in generation order are shown, ordered by date
    size_t numShown = std::min(maxCharts, views.size());
    std::vector<ChartViewPtr> shown(views.begin(), views.begin() + numShown);
    std::vector<ChartViewPtr> sorted = sortChronologically(shown);

    for (size_t i = 0; i < numShown; ++i)
    {
        const ChartView<Num>& view = *sorted[i];
        const TradingDayEntry<Num>& entry = view.getEntry();

        os << "  " << std::left << std::setw(8) << entry.getSourceName()
           << " " << utils::formatTradingDate(entry.getDate())
           << " " << std::setw(6) << view.getFrequency().toString()
           << " " << std::setw(9) << view.getBarsOption().getDisplayLabel()
           << " " << std::setw(9) << entry.getGapDirection()
           << " " << std::setw(11) << entry.getGapSizeClass()
           << " bars=" << view.getNumBars()
           << "  " << formatDirections(view.getDirections(), kDirectionsShown)
           << std::right << std::endl;
    }

    if (numShown < views.size())
    {
        os << "  ... " << (views.size() - numShown) << " more charts not shown" << std::endl;
    }
}

void ChartReporter::writeSourceList(std::ostream& os, const ChartCatalog<Num>& catalog)
{
    const DatasetMetadata& metadata = catalog.getMetadata();

    os << "Dataset generated: " << (metadata.getGenerated().empty() ? "unknown" : metadata.getGenerated())
       << ", base frequency " << catalog.getBaseFrequency().toString() << std::endl;
    os << "Sources: " << catalog.getSources().size()
       << ", trading days: " << catalog.getNumTradingDays()
       << ", max bars per day: " << catalog.getLongestDayBarCount() << std::endl;

    for (const auto& sourceName : catalog.getSources())
    {
        auto sourceMetadata = catalog.getSourceMetadata(sourceName);
        if (!sourceMetadata)
        {
            continue;
        }

        os << "  " << std::left << std::setw(8) << sourceMetadata->getName() << std::right
           << " days=" << sourceMetadata->getNumTradingDays()
           << " timezone=" << sourceMetadata->getTimezone()
           << " hours=" << sourceMetadata->getTradingHours() << std::endl;
    }
}

std::string ChartReporter::formatDirections(const std::vector<BarDirection>& directions,
                                            size_t maxBars)
{
    std::string result;
    size_t numShown = std::min(maxBars, directions.size());

    for (size_t i = 0; i < numShown; ++i)
    {
        if (i > 0)
        {
            result += " ";
        }
        result += barDirectionToString(directions[i]);
    }

    if (numShown < directions.size())
    {
        result += " ...";
    }

    return result;
}

} // namespace reporting
} // namespace sievecli

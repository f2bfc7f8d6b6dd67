#include "TestUtils.h"
#include "DecimalConstants.h"

using namespace boost::gregorian;
using namespace boost::posix_time;
using namespace chartsieve;

DecimalType
createDecimal(const std::string& valueString)
{
  return dec::fromString<DecimalType>(valueString);
}

BarType
createBar(const std::string& dateString,
          const std::string& timeString,
          const std::string& openPrice,
          const std::string& highPrice,
          const std::string& lowPrice,
          const std::string& closePrice)
{
  ptime dateTime(from_undelimited_string(dateString), duration_from_string(timeString));

  return BarType(dateTime,
                 createDecimal(openPrice),
                 createDecimal(highPrice),
                 createDecimal(lowPrice),
                 createDecimal(closePrice));
}

BarVector
createBars(const std::string& dateString, const std::vector<OHLCRow>& rows)
{
  ptime sessionStart(from_undelimited_string(dateString), hours(8));
  BarVector bars;

  for (size_t i = 0; i < rows.size(); ++i)
    bars.emplace_back(sessionStart + minutes(static_cast<long>(5 * i)),
                      createDecimal(rows[i][0]),
                      createDecimal(rows[i][1]),
                      createDecimal(rows[i][2]),
                      createDecimal(rows[i][3]));

  return bars;
}

BarVector
createUpBars(const std::string& dateString, size_t count)
{
  ptime sessionStart(from_undelimited_string(dateString), hours(8));
  BarVector bars;

  for (size_t i = 0; i < count; ++i)
    {
      DecimalType offset(static_cast<double>(i));
      bars.emplace_back(sessionStart + minutes(static_cast<long>(5 * i)),
                        createDecimal("100.0") + offset,
                        createDecimal("101.5") + offset,
                        createDecimal("99.5") + offset,
                        createDecimal("101.0") + offset);
    }

  return bars;
}

BarVector
createDownBars(const std::string& dateString, size_t count)
{
  ptime sessionStart(from_undelimited_string(dateString), hours(8));
  BarVector bars;

  for (size_t i = 0; i < count; ++i)
    {
      DecimalType offset(static_cast<double>(i));
      bars.emplace_back(sessionStart + minutes(static_cast<long>(5 * i)),
                        createDecimal("101.0") - offset,
                        createDecimal("101.5") - offset,
                        createDecimal("99.5") - offset,
                        createDecimal("100.0") - offset);
    }

  return bars;
}

EntryPtr
createTradingDay(const std::string& sourceName,
                 const std::string& dateString,
                 const std::string& gapDirection,
                 const std::string& gapSizeClass,
                 bool openAbovePrevHigh,
                 bool closeBelowPrevLow,
                 BarVector bars)
{
  return std::make_shared<const TradingDayEntry<DecimalType>>(sourceName,
                                                              kTestTimezone,
                                                              kTestTradingHours,
                                                              from_undelimited_string(dateString),
                                                              gapDirection,
                                                              gapSizeClass,
                                                              openAbovePrevHigh,
                                                              closeBelowPrevLow,
                                                              PriorDayLevels<DecimalType>(),
                                                              std::move(bars));
}

EntryPtr
createTradingDay(const std::string& sourceName,
                 const std::string& dateString,
                 BarVector bars)
{
  return createTradingDay(sourceName, dateString, "FLAT", "0-0.1%", false, false, std::move(bars));
}

ChartDataSource<DecimalType>
createSource(const std::string& sourceName, std::vector<EntryPtr> tradingDays)
{
  return ChartDataSource<DecimalType>(sourceName, kTestTimezone, kTestTradingHours, std::move(tradingDays));
}

ChartDataset<DecimalType>
createDataset(std::vector<ChartDataSource<DecimalType>> sources)
{
  std::vector<std::string> names;
  size_t numDays = 0;

  for (const auto& source : sources)
    {
      names.push_back(source.getName());
      numDays += source.getTradingDays().size();
    }

  DatasetMetadata metadata("2024-06-01T00:00:00", BarFrequency(5), names, names.size(), numDays);
  return ChartDataset<DecimalType>(metadata, std::move(sources));
}

#ifndef __CHARTSIEVE_TEST_UTILS_H
#define __CHARTSIEVE_TEST_UTILS_H 1

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <boost/date_time.hpp>
#include "number.h"
#include "IntradayBar.h"
#include "ChartDataset.h"
#include "TradingDayEntry.h"

typedef dec::decimal<7> DecimalType;
typedef chartsieve::IntradayBar<DecimalType> BarType;
typedef std::vector<BarType> BarVector;
typedef std::shared_ptr<const chartsieve::TradingDayEntry<DecimalType>> EntryPtr;

// open, high, low, close
typedef std::array<std::string, 4> OHLCRow;

// Timezone and session given to every source and day built here
const std::string kTestTimezone("America/Chicago");
const std::string kTestTradingHours("08:00-17:00");

DecimalType
createDecimal(const std::string& valueString);

BarType
createBar(const std::string& dateString,
          const std::string& timeString,
          const std::string& openPrice,
          const std::string& highPrice,
          const std::string& lowPrice,
          const std::string& closePrice);

// 5 minute bars starting at 08:00 on dateString (YYYYMMDD)
BarVector
createBars(const std::string& dateString, const std::vector<OHLCRow>& rows);

// count bars, each closing above its open: open 100+i, high 101.5+i, low 99.5+i, close 101+i
BarVector
createUpBars(const std::string& dateString, size_t count);

// count bars, each closing below its open: open 101-i, high 101.5-i, low 99.5-i, close 100-i
BarVector
createDownBars(const std::string& dateString, size_t count);

EntryPtr
createTradingDay(const std::string& sourceName,
                 const std::string& dateString,
                 const std::string& gapDirection,
                 const std::string& gapSizeClass,
                 bool openAbovePrevHigh,
                 bool closeBelowPrevLow,
                 BarVector bars);

// Convenience overload: no gap, no prior-day flags
EntryPtr
createTradingDay(const std::string& sourceName,
                 const std::string& dateString,
                 BarVector bars);

chartsieve::ChartDataSource<DecimalType>
createSource(const std::string& sourceName, std::vector<EntryPtr> tradingDays);

chartsieve::ChartDataset<DecimalType>
createDataset(std::vector<chartsieve::ChartDataSource<DecimalType>> sources);

#endif

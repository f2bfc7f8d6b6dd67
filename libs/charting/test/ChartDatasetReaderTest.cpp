#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <boost/filesystem.hpp>
#include "TestUtils.h"
#include "ChartDatasetReader.h"

using namespace chartsieve;
using boost::gregorian::date;

namespace
{
  const char* kSampleDataset = R"({
    "metadata": {
      "generated": "2024-06-01T12:00:00",
      "baseFrequency": "5min",
      "sources": ["ES", "NQ"],
      "totalSources": 2,
      "totalTradingDays": 3
    },
    "sources": [
      {
        "name": "ES",
        "timezone": "America/Chicago",
        "tradingHours": "08:00-17:00",
        "tradingDays": [
          {
            "date": "20240103",
            "prevClose": null, "prevHigh": null, "prevLow": null,
            "gapDirection": "N/A", "gapSizeClass": "N/A",
            "openAbovePrevHigh": null, "closeBelowPrevLow": null,
            "bars": [[1704290400000, 4700.25, 4702.5, 4699.0, 4701.75],
                     [1704290700000, 4701.75, 4703.0, 4700.0, 4700.5]],
            "barDirections": ["UP", "DOWN"],
            "bodyRatios": ["50-75%", "25-50%"]
          },
          {
            "date": "20240104",
            "prevClose": 4700.5, "prevHigh": 4703.0, "prevLow": 4699.0,
            "gapDirection": "GAP UP", "gapSizeClass": "0.1%-0.25%",
            "openAbovePrevHigh": true, "closeBelowPrevLow": false,
            "bars": [[1704376800000, 4710.0, 4712.0, 4708.0, 4711.0]]
          }
        ]
      },
      {
        "name": "NQ",
        "timezone": "America/Chicago",
        "tradingHours": "08:00-17:00",
        "tradingDays": [
          {
            "date": "20240103",
            "gapDirection": "GAP DOWN", "gapSizeClass": "0.5%-1.0%",
            "openAbovePrevHigh": false, "closeBelowPrevLow": true,
            "prevClose": 16500.0, "prevHigh": 16550.0, "prevLow": 16480.0,
            "bars": [[1704290400000, 16400.0, 16410.0, 16390.0, 16395.0]]
          }
        ]
      }
    ]
  })";

  void requireMalformed(const std::string& json)
  {
    REQUIRE_THROWS_AS (ChartDatasetReader<DecimalType>::parse(json), ChartDatasetException);
  }
}

TEST_CASE ("ChartDatasetReader parses a well formed dataset", "[ChartDatasetReader]")
{
  auto dataset = ChartDatasetReader<DecimalType>::parse(kSampleDataset);

  REQUIRE (dataset != nullptr);

  SECTION ("Metadata")
    {
      const DatasetMetadata& metadata = dataset->getMetadata();

      REQUIRE (metadata.getGenerated() == "2024-06-01T12:00:00");
      REQUIRE (metadata.getBaseFrequency() == BarFrequency(5));
      REQUIRE (metadata.getTotalSources() == 2);
      REQUIRE (metadata.getTotalTradingDays() == 3);
      REQUIRE (metadata.getSourceNames() == std::vector<std::string>{"ES", "NQ"});
    }

  SECTION ("Sources and days")
    {
      const auto& sources = dataset->getSources();

      REQUIRE (sources.size() == 2);
      REQUIRE (sources[0].getName() == "ES");
      REQUIRE (sources[0].getTimezone() == "America/Chicago");
      REQUIRE (sources[0].getTradingHours() == "08:00-17:00");
      REQUIRE (sources[0].getTradingDays().size() == 2);
      REQUIRE (sources[1].getTradingDays().size() == 1);
    }

  SECTION ("Every trading day carries its source's timezone and trading hours")
    {
      for (const auto& source : dataset->getSources())
        for (const auto& day : source.getTradingDays())
          {
            REQUIRE (day->getSourceName() == source.getName());
            REQUIRE (day->getTimezone() == "America/Chicago");
            REQUIRE (day->getTradingHours() == "08:00-17:00");
          }
    }

  SECTION ("Null prior day values read as missing and null flags as false")
    {
      const auto& firstDay = dataset->getSources()[0].getTradingDays()[0];

      REQUIRE (firstDay->getDate() == date(2024, 1, 3));
      REQUIRE (firstDay->getGapDirection() == "N/A");
      REQUIRE_FALSE (firstDay->isOpenAbovePrevHigh());
      REQUIRE_FALSE (firstDay->isCloseBelowPrevLow());
      REQUIRE_FALSE (firstDay->getPriorDayLevels().getPrevClose().has_value());
      REQUIRE_FALSE (firstDay->getPriorDayLevels().getPrevHigh().has_value());
      REQUIRE_FALSE (firstDay->getPriorDayLevels().getPrevLow().has_value());
    }

  SECTION ("Populated prior day values and flags")
    {
      const auto& secondDay = dataset->getSources()[0].getTradingDays()[1];

      REQUIRE (secondDay->getGapDirection() == "GAP UP");
      REQUIRE (secondDay->getGapSizeClass() == "0.1%-0.25%");
      REQUIRE (secondDay->isOpenAbovePrevHigh());
      REQUIRE_FALSE (secondDay->isCloseBelowPrevLow());
      REQUIRE (secondDay->getPriorDayLevels().getPrevHigh().value() == createDecimal("4703.0"));
    }

  SECTION ("Bars keep their timestamp and prices")
    {
      const auto& bars = dataset->getSources()[0].getTradingDays()[0]->getBars();

      REQUIRE (bars.size() == 2);
      REQUIRE (bars[0].getTimestampMs() == 1704290400000);
      REQUIRE (bars[0].getOpenValue() == createDecimal("4700.25"));
      REQUIRE (bars[0].getHighValue() == createDecimal("4702.5"));
      REQUIRE (bars[0].getLowValue() == createDecimal("4699.0"));
      REQUIRE (bars[0].getCloseValue() == createDecimal("4701.75"));
    }
}

TEST_CASE ("ChartDatasetReader defaults when metadata is absent", "[ChartDatasetReader]")
{
  auto dataset = ChartDatasetReader<DecimalType>::parse(R"({
    "sources": [ { "name": "CL", "tradingDays": [
      { "date": "20240110", "bars": [[1704880800000, 72.1, 72.4, 71.9, 72.3]] } ] } ] })");

  REQUIRE (dataset->getMetadata().getBaseFrequency() == BarFrequency(5));
  REQUIRE (dataset->getMetadata().getTotalSources() == 1);
  REQUIRE (dataset->getMetadata().getTotalTradingDays() == 1);
  REQUIRE (dataset->getMetadata().getSourceNames() == std::vector<std::string>{"CL"});
  REQUIRE (dataset->getSources()[0].getTimezone().empty());
  REQUIRE (dataset->getSources()[0].getTradingDays()[0]->getTimezone().empty());
  REQUIRE (dataset->getSources()[0].getTradingDays()[0]->getTradingHours().empty());
}

TEST_CASE ("ChartDatasetReader rejects malformed datasets", "[ChartDatasetReader]")
{
  SECTION ("Invalid JSON")
    {
      requireMalformed("{ \"sources\": [ ");
    }

  SECTION ("Missing sources")
    {
      requireMalformed("{ \"metadata\": {} }");
      requireMalformed("[]");
    }

  SECTION ("Source without a name or trading days")
    {
      requireMalformed(R"({ "sources": [ { "tradingDays": [] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES" } ] })");
    }

  SECTION ("Bad dates")
    {
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "2024-01-03", "bars": [] } ] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20241303", "bars": [] } ] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "bars": [] } ] } ] })");
    }

  SECTION ("Malformed bars")
    {
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20240103" } ] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20240103", "bars": [[1704290400000, 1.0, 2.0, 0.5]] } ] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20240103", "bars": [[1704290400000, "1.0", 2.0, 0.5, 1.5]] } ] } ] })");
    }

  SECTION ("Wrongly typed optional members")
    {
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20240103", "openAbovePrevHigh": "yes", "bars": [] } ] } ] })");
      requireMalformed(R"({ "sources": [ { "name": "ES", "tradingDays": [
        { "date": "20240103", "prevClose": "4700", "bars": [] } ] } ] })");
      requireMalformed(R"({ "metadata": { "baseFrequency": "5m" }, "sources": [] })");
    }
}

TEST_CASE ("ChartDatasetReader reads from a file", "[ChartDatasetReader]")
{
  boost::filesystem::path tempFile = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path("chartsieve-%%%%-%%%%.json");

  {
    std::ofstream out(tempFile.string());
    out << kSampleDataset;
  }

  ChartDatasetReader<DecimalType> reader(tempFile.string());
  reader.readFile();

  REQUIRE (reader.getDataset()->getSources().size() == 2);

  boost::filesystem::remove(tempFile);

  ChartDatasetReader<DecimalType> missing(tempFile.string());
  REQUIRE_THROWS_AS (missing.readFile(), ChartDatasetException);
}

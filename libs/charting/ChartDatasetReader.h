// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CHART_DATASET_READER_H
#define __CHART_DATASET_READER_H 1

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include "number.h"
#include "ChartDataset.h"
#include "ChartSieveException.h"

namespace chartsieve
{
  /**
   * @class ChartDatasetReader
   * @brief Reads the JSON chart dataset produced by the data preparation step.
   *
   * Expected layout:
   * @code
   * { "metadata": { "generated": ..., "baseFrequency": "5min", ... },
   *   "sources": [ { "name": "ES", "timezone": ..., "tradingHours": ...,
   *                  "tradingDays": [ { "date": "20240105", "bars": [[ms,o,h,l,c], ...], ... } ] } ] }
   * @endcode
   *
   * Precomputed direction and body ratio arrays in the file are ignored; views
   * always derive them from their own bars. Any structural problem is
   * reported by throwing ChartDatasetException.
   */
  template <class Decimal>
  class ChartDatasetReader
  {
  public:
    using DatasetPtr = std::shared_ptr<ChartDataset<Decimal>>;

    explicit ChartDatasetReader(const std::string& fileName)
      : mFileName(fileName),
        mDataset()
    {}

    void readFile()
    {
      if (!boost::filesystem::exists(mFileName))
        throw ChartDatasetException("ChartDatasetReader: dataset file " + mFileName + " does not exist");

      std::ifstream file(mFileName);
      if (!file.is_open())
        throw ChartDatasetException("ChartDatasetReader: cannot open dataset file " + mFileName);

      rapidjson::IStreamWrapper isw(file);
      rapidjson::Document doc;
      doc.ParseStream(isw);

      if (doc.HasParseError())
        throw ChartDatasetException("ChartDatasetReader: JSON parse error in " + mFileName + " at offset " +
                                    std::to_string(doc.GetErrorOffset()) + ": " +
                                    rapidjson::GetParseError_En(doc.GetParseError()));

      mDataset = buildDataset(doc);
    }

    DatasetPtr getDataset() const
    {
      return mDataset;
    }

    const std::string& getFileName() const
    {
      return mFileName;
    }

    static DatasetPtr parse(const std::string& jsonText)
    {
      rapidjson::Document doc;
      doc.Parse(jsonText.c_str());

      if (doc.HasParseError())
        throw ChartDatasetException("ChartDatasetReader: JSON parse error at offset " +
                                    std::to_string(doc.GetErrorOffset()) + ": " +
                                    rapidjson::GetParseError_En(doc.GetParseError()));

      return buildDataset(doc);
    }

  private:
    static DatasetPtr buildDataset(const rapidjson::Document& doc)
    {
      if (!doc.IsObject())
        throw ChartDatasetException("ChartDatasetReader: dataset root must be an object");

      if (!doc.HasMember("sources") || !doc["sources"].IsArray())
        throw ChartDatasetException("ChartDatasetReader: dataset has no sources array");

      BarFrequency baseFrequency(5);
      std::string generated;
      std::vector<std::string> metadataSourceNames;
      std::optional<size_t> totalSources;
      std::optional<size_t> totalTradingDays;

      if (doc.HasMember("metadata"))
        {
          const rapidjson::Value& metadata = doc["metadata"];
          if (!metadata.IsObject())
            throw ChartDatasetException("ChartDatasetReader: metadata must be an object");

          generated = getOptionalString(metadata, "generated", "", "metadata");

          if (metadata.HasMember("baseFrequency"))
            {
              std::string frequencyStr = getOptionalString(metadata, "baseFrequency", "5min", "metadata");
              try
                {
                  baseFrequency = BarFrequency::fromString(frequencyStr);
                }
              catch (const BarFrequencyException& e)
                {
                  throw ChartDatasetException("ChartDatasetReader: metadata baseFrequency: " + std::string(e.what()));
                }
            }

          if (metadata.HasMember("sources") && metadata["sources"].IsArray())
            for (const auto& name : metadata["sources"].GetArray())
              if (name.IsString())
                metadataSourceNames.push_back(name.GetString());

          if (metadata.HasMember("totalSources") && metadata["totalSources"].IsUint())
            totalSources = metadata["totalSources"].GetUint();

          if (metadata.HasMember("totalTradingDays") && metadata["totalTradingDays"].IsUint())
            totalTradingDays = metadata["totalTradingDays"].GetUint();
        }

      std::vector<ChartDataSource<Decimal>> sources;
      size_t numTradingDays = 0;

      for (const auto& sourceJson : doc["sources"].GetArray())
        {
          sources.push_back(buildSource(sourceJson));
          numTradingDays += sources.back().getTradingDays().size();
        }

      if (metadataSourceNames.empty())
        for (const auto& source : sources)
          metadataSourceNames.push_back(source.getName());

      DatasetMetadata datasetMetadata(generated,
                                      baseFrequency,
                                      metadataSourceNames,
                                      totalSources.value_or(sources.size()),
                                      totalTradingDays.value_or(numTradingDays));

      return std::make_shared<ChartDataset<Decimal>>(datasetMetadata, std::move(sources));
    }

    static ChartDataSource<Decimal> buildSource(const rapidjson::Value& sourceJson)
    {
      if (!sourceJson.IsObject())
        throw ChartDatasetException("ChartDatasetReader: source entry must be an object");

      if (!sourceJson.HasMember("name") || !sourceJson["name"].IsString())
        throw ChartDatasetException("ChartDatasetReader: source entry has no name");

      std::string name = sourceJson["name"].GetString();
      std::string context = "source " + name;
      std::string timezone = getOptionalString(sourceJson, "timezone", "", context);
      std::string tradingHours = getOptionalString(sourceJson, "tradingHours", "", context);

      if (!sourceJson.HasMember("tradingDays") || !sourceJson["tradingDays"].IsArray())
        throw ChartDatasetException("ChartDatasetReader: " + context + " has no tradingDays array");

      std::vector<typename ChartDataSource<Decimal>::EntryPtr> tradingDays;
      for (const auto& dayJson : sourceJson["tradingDays"].GetArray())
        tradingDays.push_back(buildTradingDay(name, timezone, tradingHours, dayJson));

      return ChartDataSource<Decimal>(name, timezone, tradingHours, std::move(tradingDays));
    }

    static typename ChartDataSource<Decimal>::EntryPtr
    buildTradingDay(const std::string& sourceName,
                    const std::string& timezone,
                    const std::string& tradingHours,
                    const rapidjson::Value& dayJson)
    {
      if (!dayJson.IsObject())
        throw ChartDatasetException("ChartDatasetReader: trading day of source " + sourceName +
                                    " must be an object");

      if (!dayJson.HasMember("date") || !dayJson["date"].IsString())
        throw ChartDatasetException("ChartDatasetReader: trading day of source " + sourceName +
                                    " has no date");

      std::string dateString = dayJson["date"].GetString();
      std::string context = "source " + sourceName + " day " + dateString;
      date tradingDate = parseDate(dateString, context);

      std::string gapDirection = getOptionalString(dayJson, "gapDirection", "N/A", context);
      std::string gapSizeClass = getOptionalString(dayJson, "gapSizeClass", "N/A", context);
      bool openAbovePrevHigh = getNullableFlag(dayJson, "openAbovePrevHigh", context);
      bool closeBelowPrevLow = getNullableFlag(dayJson, "closeBelowPrevLow", context);

      PriorDayLevels<Decimal> priorDayLevels(getNullablePrice(dayJson, "prevClose", context),
                                             getNullablePrice(dayJson, "prevHigh", context),
                                             getNullablePrice(dayJson, "prevLow", context));

      if (!dayJson.HasMember("bars") || !dayJson["bars"].IsArray())
        throw ChartDatasetException("ChartDatasetReader: " + context + " has no bars array");

      std::vector<IntradayBar<Decimal>> bars;
      bars.reserve(dayJson["bars"].Size());

      for (const auto& barJson : dayJson["bars"].GetArray())
        bars.push_back(buildBar(barJson, context));

      return std::make_shared<const TradingDayEntry<Decimal>>(sourceName,
                                                              timezone,
                                                              tradingHours,
                                                              tradingDate,
                                                              gapDirection,
                                                              gapSizeClass,
                                                              openAbovePrevHigh,
                                                              closeBelowPrevLow,
                                                              priorDayLevels,
                                                              std::move(bars));
    }

    // A bar is [timestampMs, open, high, low, close]
    static IntradayBar<Decimal> buildBar(const rapidjson::Value& barJson, const std::string& context)
    {
      if (!barJson.IsArray() || barJson.Size() != 5)
        throw ChartDatasetException("ChartDatasetReader: " + context +
                                    " has a bar that is not [timestamp, open, high, low, close]");

      for (rapidjson::SizeType i = 0; i < barJson.Size(); ++i)
        if (!barJson[i].IsNumber())
          throw ChartDatasetException("ChartDatasetReader: " + context + " has a non-numeric bar field");

      std::int64_t timestampMs = barJson[0].IsInt64() ? barJson[0].GetInt64()
        : static_cast<std::int64_t>(barJson[0].GetDouble());

      return IntradayBar<Decimal>(timestampMs,
                                  num::fromDouble<Decimal>(barJson[1].GetDouble()),
                                  num::fromDouble<Decimal>(barJson[2].GetDouble()),
                                  num::fromDouble<Decimal>(barJson[3].GetDouble()),
                                  num::fromDouble<Decimal>(barJson[4].GetDouble()));
    }

    static date parseDate(const std::string& dateString, const std::string& context)
    {
      if (dateString.size() != 8)
        throw ChartDatasetException("ChartDatasetReader: " + context + " date is not YYYYMMDD");

      try
        {
          return boost::gregorian::from_undelimited_string(dateString);
        }
      catch (const std::exception& e)
        {
          throw ChartDatasetException("ChartDatasetReader: " + context + " has an invalid date: " +
                                      std::string(e.what()));
        }
    }

    static std::string getOptionalString(const rapidjson::Value& object,
                                         const char* member,
                                         const std::string& defaultValue,
                                         const std::string& context)
    {
      if (!object.HasMember(member) || object[member].IsNull())
        return defaultValue;

      if (!object[member].IsString())
        throw ChartDatasetException("ChartDatasetReader: " + context + " member " + member +
                                    " must be a string");

      return object[member].GetString();
    }

    // A missing or null flag reads as false
    static bool getNullableFlag(const rapidjson::Value& object,
                                const char* member,
                                const std::string& context)
    {
      if (!object.HasMember(member) || object[member].IsNull())
        return false;

      if (!object[member].IsBool())
        throw ChartDatasetException("ChartDatasetReader: " + context + " member " + member +
                                    " must be a boolean or null");

      return object[member].GetBool();
    }

    static std::optional<Decimal> getNullablePrice(const rapidjson::Value& object,
                                                   const char* member,
                                                   const std::string& context)
    {
      if (!object.HasMember(member) || object[member].IsNull())
        return std::nullopt;

      if (!object[member].IsNumber())
        throw ChartDatasetException("ChartDatasetReader: " + context + " member " + member +
                                    " must be a number or null");

      return num::fromDouble<Decimal>(object[member].GetDouble());
    }

  private:
    std::string mFileName;
    DatasetPtr mDataset;
  };
}

#endif

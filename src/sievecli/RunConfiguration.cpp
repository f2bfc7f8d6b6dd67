// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "RunConfiguration.h"
#include <fstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include "DecimalConstants.h"

using namespace rapidjson;
using namespace chartsieve;

namespace sievecli
{
  namespace
  {
    using Decimal = num::DefaultNumber;

    std::vector<std::string> getStringArray(const Value& section, const char* member)
    {
      std::vector<std::string> values;

      if (!section.HasMember(member))
        return values;

      if (!section[member].IsArray())
        throw RunConfigurationException(std::string("RunConfiguration: ") + member + " must be an array");

      for (const auto& item : section[member].GetArray())
        {
          if (!item.IsString())
            throw RunConfigurationException(std::string("RunConfiguration: ") + member +
                                            " must contain only strings");
          values.push_back(item.GetString());
        }

      return values;
    }

    Decimal getPercent(const Value& section, const char* member)
    {
      if (section[member].IsNumber())
        return num::fromDouble<Decimal>(section[member].GetDouble());

      if (section[member].IsString())
        return parsePercent(section[member].GetString());

      throw RunConfigurationException(std::string("RunConfiguration: trade ") + member + " must be a number");
    }

    void readFilterSection(const Value& filters, FilterSpec& spec)
    {
      if (!filters.IsObject())
        throw RunConfigurationException("RunConfiguration: filters must be an object");

      for (const auto& source : getStringArray(filters, "sources"))
        spec.addSource(source);

      for (const auto& frequency : getStringArray(filters, "frequencies"))
        spec.addFrequency(parseFrequency(frequency));

      if (filters.HasMember("barsOptions"))
        {
          if (!filters["barsOptions"].IsArray())
            throw RunConfigurationException("RunConfiguration: barsOptions must be an array");

          for (const auto& option : filters["barsOptions"].GetArray())
            {
              if (option.IsUint())
                spec.addBarsOption(parseBarsOption(std::to_string(option.GetUint())));
              else if (option.IsString())
                spec.addBarsOption(parseBarsOption(option.GetString()));
              else
                throw RunConfigurationException("RunConfiguration: barsOptions entries must be a bar count or \"all\"");
            }
        }

      for (const auto& gapDirection : getStringArray(filters, "gapDirections"))
        spec.addGapDirection(gapDirection);

      for (const auto& gapSizeClass : getStringArray(filters, "gapSizeClasses"))
        spec.addGapSizeClass(gapSizeClass);

      for (const auto& condition : getStringArray(filters, "prevDayFilters"))
        spec.addPriorDayCondition(parsePriorDayCondition(condition));

      if (filters.HasMember("barFilters"))
        {
          if (!filters["barFilters"].IsArray())
            throw RunConfigurationException("RunConfiguration: barFilters must be an array");

          for (const auto& barFilter : filters["barFilters"].GetArray())
            {
              if (!barFilter.IsObject() ||
                  !barFilter.HasMember("bar") || !barFilter["bar"].IsUint() ||
                  !barFilter.HasMember("direction") || !barFilter["direction"].IsString())
                throw RunConfigurationException("RunConfiguration: each barFilter needs a bar number and a direction");

              std::string constraintString = std::to_string(barFilter["bar"].GetUint()) + ":" +
                barFilter["direction"].GetString();

              if (barFilter.HasMember("bodyRatio") && barFilter["bodyRatio"].IsString())
                constraintString += std::string(":") + barFilter["bodyRatio"].GetString();

              spec.addBarConstraint(parseBarConstraint(constraintString));
            }
        }
    }

    void readTradeSection(const Value& trade, TradeSettings& settings)
    {
      if (!trade.IsObject())
        throw RunConfigurationException("RunConfiguration: trade must be an object");

      if (trade.HasMember("triggerBar"))
        {
          if (!trade["triggerBar"].IsInt())
            throw RunConfigurationException("RunConfiguration: trade triggerBar must be an integer");
          settings.setTriggerBar(trade["triggerBar"].GetInt());
        }

      if (trade.HasMember("direction"))
        {
          if (!trade["direction"].IsString())
            throw RunConfigurationException("RunConfiguration: trade direction must be a string");
          settings.setDirection(parseTradeDirection(trade["direction"].GetString()));
        }

      if (trade.HasMember("targetPct"))
        settings.setTargetPct(getPercent(trade, "targetPct"));

      if (trade.HasMember("stopPct"))
        settings.setStopPct(getPercent(trade, "stopPct"));
    }

    std::shared_ptr<RunConfiguration> buildConfiguration(const Document& doc)
    {
      if (!doc.IsObject())
        throw RunConfigurationException("RunConfiguration: run file root must be an object");

      auto configuration = std::make_shared<RunConfiguration>();

      if (doc.HasMember("filters"))
        readFilterSection(doc["filters"], configuration->getFilterSpec());

      if (doc.HasMember("trade"))
        readTradeSection(doc["trade"], configuration->getTradeSettings());

      if (doc.HasMember("report"))
        {
          const Value& report = doc["report"];
          if (!report.IsObject())
            throw RunConfigurationException("RunConfiguration: report must be an object");

          if (report.HasMember("maxCharts"))
            {
              if (!report["maxCharts"].IsUint())
                throw RunConfigurationException("RunConfiguration: report maxCharts must be a non-negative integer");
              configuration->setMaxCharts(report["maxCharts"].GetUint());
            }
        }

      return configuration;
    }
  }

  TradeSettings::TradeSettings()
    : mTriggerBar(),
      mDirection(),
      mTargetPct(),
      mStopPct()
  {}

  bool TradeSettings::isSpecified() const
  {
    return mTriggerBar || mDirection || mTargetPct || mStopPct;
  }

  TradeParams<num::DefaultNumber> TradeSettings::getTradeParams() const
  {
    if (!mTriggerBar)
      throw RunConfigurationException("TradeSettings: trigger bar not specified");

    if (!mDirection)
      throw RunConfigurationException("TradeSettings: trade direction not specified");

    if (!mTargetPct)
      throw RunConfigurationException("TradeSettings: target percent not specified");

    if (!mStopPct)
      throw RunConfigurationException("TradeSettings: stop percent not specified");

    return TradeParams<Decimal>(*mTriggerBar, *mDirection, *mTargetPct, *mStopPct);
  }

  RunConfiguration::RunConfiguration()
    : mFilterSpec(),
      mTradeSettings(),
      mMaxCharts(kDefaultMaxCharts)
  {}

  RunConfigurationFileReader::RunConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<RunConfiguration> RunConfigurationFileReader::readConfigurationFile()
  {
    if (!boost::filesystem::exists(mConfigurationFileName))
      throw RunConfigurationException("RunConfigurationFileReader::readConfigurationFile - run file " +
                                      mConfigurationFileName + " does not exist");

    std::ifstream file(mConfigurationFileName);
    if (!file.is_open())
      throw RunConfigurationException("RunConfigurationFileReader::readConfigurationFile - cannot open " +
                                      mConfigurationFileName);

    IStreamWrapper isw(file);
    Document doc;
    doc.ParseStream(isw);

    if (doc.HasParseError())
      throw RunConfigurationException("RunConfigurationFileReader::readConfigurationFile - JSON parse error in " +
                                      mConfigurationFileName + ": " +
                                      GetParseError_En(doc.GetParseError()));

    return buildConfiguration(doc);
  }

  std::shared_ptr<RunConfiguration> RunConfigurationFileReader::parseConfiguration(const std::string& jsonText)
  {
    Document doc;
    doc.Parse(jsonText.c_str());

    if (doc.HasParseError())
      throw RunConfigurationException(std::string("RunConfigurationFileReader::parseConfiguration - JSON parse error: ") +
                                      GetParseError_En(doc.GetParseError()));

    return buildConfiguration(doc);
  }

  BarFrequency parseFrequency(const std::string& frequencyString)
  {
    try
      {
        return BarFrequency::fromString(frequencyString);
      }
    catch (const BarFrequencyException& e)
      {
        throw RunConfigurationException(e.what());
      }
  }

  BarsOption parseBarsOption(const std::string& optionString)
  {
    try
      {
        return BarsOption::fromString(optionString);
      }
    catch (const BarsOptionException& e)
      {
        throw RunConfigurationException(e.what());
      }
  }

  PriorDayCondition parsePriorDayCondition(const std::string& conditionString)
  {
    auto condition = priorDayConditionFromString(conditionString);
    if (!condition)
      throw RunConfigurationException("Unknown prior day filter " + conditionString +
                                      " (expected open_above_prev_high or close_below_prev_low)");

    return *condition;
  }

  TradeDirection parseTradeDirection(const std::string& directionString)
  {
    auto direction = tradeDirectionFromString(directionString);
    if (!direction)
      throw RunConfigurationException("Unknown trade direction " + directionString +
                                      " (expected Long or Short)");

    return *direction;
  }

  num::DefaultNumber parsePercent(const std::string& percentString)
  {
    std::string trimmed = boost::trim_copy(percentString);

    try
      {
        boost::lexical_cast<double>(trimmed);
      }
    catch (const boost::bad_lexical_cast&)
      {
        throw RunConfigurationException("Percent value " + percentString + " is not a number");
      }

    return DecimalConstants<Decimal>::createDecimal(trimmed);
  }

  BarConstraint parseBarConstraint(const std::string& constraintString)
  {
    std::vector<std::string> fields;
    boost::split(fields, constraintString, boost::is_any_of(":"));

    if (fields.size() < 2 || fields.size() > 3)
      throw RunConfigurationException("Bar filter " + constraintString + " is not BAR:DIRECTION[:RATIO]");

    int barNumber = 0;
    try
      {
        barNumber = boost::lexical_cast<int>(boost::trim_copy(fields[0]));
      }
    catch (const boost::bad_lexical_cast&)
      {
        throw RunConfigurationException("Bar filter " + constraintString + " has an invalid bar number");
      }

    if (barNumber < 1)
      throw RunConfigurationException("Bar filter " + constraintString + " has an invalid bar number");

    auto direction = barDirectionFromString(fields[1]);
    if (!direction)
      throw RunConfigurationException("Bar filter " + constraintString + " has an unknown direction");

    std::optional<BodyRatioClass> bodyRatio;
    if (fields.size() == 3 && boost::to_lower_copy(boost::trim_copy(fields[2])) != "any")
      {
        bodyRatio = bodyRatioClassFromString(fields[2]);
        if (!bodyRatio)
          throw RunConfigurationException("Bar filter " + constraintString + " has an unknown body ratio");
      }

    return BarConstraint(static_cast<unsigned int>(barNumber), *direction, bodyRatio);
  }
}

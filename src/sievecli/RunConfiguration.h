// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "number.h"
#include "ChartSieveException.h"
#include "FilterSpec.h"
#include "TradeParams.h"

namespace sievecli
{
  using chartsieve::BarConstraint;
  using chartsieve::BarFrequency;
  using chartsieve::BarsOption;
  using chartsieve::FilterSpec;
  using chartsieve::PriorDayCondition;
  using chartsieve::TradeDirection;
  using chartsieve::TradeParams;

  class RunConfigurationException : public chartsieve::ChartSieveException
  {
  public:
    explicit RunConfigurationException(const std::string& msg)
      : chartsieve::ChartSieveException(msg)
    {}
  };

  /**
   * @brief Trade parameters as collected from the run file and the command
   * line. Any of them may still be missing.
   */
  class TradeSettings
  {
  public:
    using Decimal = num::DefaultNumber;

    TradeSettings();

    void setTriggerBar(int triggerBar)
    {
      mTriggerBar = triggerBar;
    }

    void setDirection(TradeDirection direction)
    {
      mDirection = direction;
    }

    void setTargetPct(const Decimal& targetPct)
    {
      mTargetPct = targetPct;
    }

    void setStopPct(const Decimal& stopPct)
    {
      mStopPct = stopPct;
    }

    // True if at least one trade parameter was given
    bool isSpecified() const;

    /**
     * @throws RunConfigurationException unless every trade parameter was given
     */
    TradeParams<Decimal> getTradeParams() const;

  private:
    std::optional<int> mTriggerBar;
    std::optional<TradeDirection> mDirection;
    std::optional<Decimal> mTargetPct;
    std::optional<Decimal> mStopPct;
  };

  class RunConfiguration
  {
  public:
    static constexpr size_t kDefaultMaxCharts = 50;

    RunConfiguration();

    FilterSpec& getFilterSpec()
    {
      return mFilterSpec;
    }

    const FilterSpec& getFilterSpec() const
    {
      return mFilterSpec;
    }

    TradeSettings& getTradeSettings()
    {
      return mTradeSettings;
    }

    const TradeSettings& getTradeSettings() const
    {
      return mTradeSettings;
    }

    // Number of charts listed in reports
    size_t getMaxCharts() const
    {
      return mMaxCharts;
    }

    void setMaxCharts(size_t maxCharts)
    {
      mMaxCharts = maxCharts;
    }

  private:
    FilterSpec mFilterSpec;
    TradeSettings mTradeSettings;
    size_t mMaxCharts;
  };

  /**
   * @brief Reads a JSON run file with optional "filters", "trade" and
   * "report" sections.
   */
  class RunConfigurationFileReader
  {
  public:
    explicit RunConfigurationFileReader(const std::string& configurationFileName);

    std::shared_ptr<RunConfiguration> readConfigurationFile();

    static std::shared_ptr<RunConfiguration> parseConfiguration(const std::string& jsonText);

  private:
    std::string mConfigurationFileName;
  };

  // Parsers for single values given on the command line or in the run file.
  // All of them throw RunConfigurationException on bad input.
  BarFrequency parseFrequency(const std::string& frequencyString);
  BarsOption parseBarsOption(const std::string& optionString);
  PriorDayCondition parsePriorDayCondition(const std::string& conditionString);
  TradeDirection parseTradeDirection(const std::string& directionString);
  num::DefaultNumber parsePercent(const std::string& percentString);

  /**
   * @brief Parses BAR:DIRECTION[:RATIO], e.g. "3:UP:>75%" or "1:DOWN".
   * A RATIO of "any" places no body ratio constraint.
   */
  BarConstraint parseBarConstraint(const std::string& constraintString);
}

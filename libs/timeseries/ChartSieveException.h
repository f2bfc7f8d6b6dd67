// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CHARTSIEVE_EXCEPTION_H
#define __CHARTSIEVE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace chartsieve
{
  // Base class for structural errors detected while loading or configuring
  class ChartSieveException : public std::runtime_error
  {
  public:
    explicit ChartSieveException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~ChartSieveException() = default;
  };

  // The chart dataset does not have the expected shape
  class ChartDatasetException : public ChartSieveException
  {
  public:
    explicit ChartDatasetException(const std::string& msg)
      : ChartSieveException(msg)
    {}
  };

  class BarFrequencyException : public std::domain_error
  {
  public:
    explicit BarFrequencyException(const std::string& msg)
      : std::domain_error(msg)
    {}
  };

  class BarAggregatorException : public std::domain_error
  {
  public:
    explicit BarAggregatorException(const std::string& msg)
      : std::domain_error(msg)
    {}
  };

  class BarsOptionException : public std::domain_error
  {
  public:
    explicit BarsOptionException(const std::string& msg)
      : std::domain_error(msg)
    {}
  };

  class FilterSpecException : public std::domain_error
  {
  public:
    explicit FilterSpecException(const std::string& msg)
      : std::domain_error(msg)
    {}
  };
}

#endif

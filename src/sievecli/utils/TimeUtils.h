#pragma once

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace sievecli
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 *
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM" suitable for use in filenames.
 * Example: "Aug_25_2024_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Format a trading date for display, e.g. 2024-01-05
 */
std::string formatTradingDate(const boost::gregorian::date& tradingDate);

} // namespace utils
} // namespace sievecli

#ifndef NUMBER_H
#define NUMBER_H

#include <cmath>
#include <string>
#include <type_traits>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Utility functions for the price type used throughout chartsieve.
 *
 * Every price-carrying class is templated on a Decimal type. The helpers in
 * namespace `num` hide the difference between a fixed-point `dec::decimal`
 * and a plain floating point instantiation.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a price to its string representation.
   * @param d The value to convert.
   * @return A std::string representing the number.
   */
  template<typename Decimal>
  inline std::string toString(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return std::to_string(d);
    else
      return dec::toString(d);
  }

  /**
   * @brief Converts a price to a double.
   * Note: This conversion may result in a loss of precision.
   */
  template<typename Decimal>
  inline double to_double(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return static_cast<double>(d);
    else
      return d.getAsDouble();
  }

  /**
   * @brief Converts a double (as delivered by a JSON parser) to a price.
   */
  template<typename Decimal>
  inline Decimal fromDouble(double value)
  {
    return Decimal(value);
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber, dec::decimal<P, RP>).
   */
  template<class N>
  inline N fromString(const std::string& s)
  {
    return chartsieve::DecimalConstants<N>::createDecimal(s);
  }

  /**
   * @brief Calculates the absolute value of a price.
   */
  template<typename Decimal>
  inline Decimal abs(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return std::fabs(d);
    else
      return d.abs();
  }

} // namespace num

#endif // NUMBER_H

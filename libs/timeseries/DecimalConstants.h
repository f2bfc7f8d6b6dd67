// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace chartsieve
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalOneHundred;
      static Decimal TwentyFivePercent;
      static Decimal FiftyPercent;
      static Decimal SeventyFivePercent;

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::TwentyFivePercent(
      DecimalConstants<Decimal>::createDecimal("25.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::FiftyPercent(
      DecimalConstants<Decimal>::createDecimal("50.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::SeventyFivePercent(
      DecimalConstants<Decimal>::createDecimal("75.0"));
}

#endif

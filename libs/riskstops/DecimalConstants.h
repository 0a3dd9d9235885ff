// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace mkc_riskstops
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalTwo;
      static Decimal DefaultStopLossMultiplier;
      static Decimal DefaultProfitTargetMultiplier;

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  // ---------------------------------------------------------------------------
  // Static member definitions
  //
  // All values are initialised via createDecimal(string) so that dec::decimal<N>
  // objects are never built from floating-point literals.
  // ---------------------------------------------------------------------------

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalTwo(
      DecimalConstants<Decimal>::createDecimal("2.0"));

  // Stop distance in ATR units when no multiplier is configured
  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultStopLossMultiplier(
      DecimalConstants<Decimal>::createDecimal("1.5"));

  // Target distance in ATR units when no multiplier is configured
  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultProfitTargetMultiplier(
      DecimalConstants<Decimal>::createDecimal("3.0"));
} // namespace mkc_riskstops

#endif // __DECIMAL_CONSTANT_H

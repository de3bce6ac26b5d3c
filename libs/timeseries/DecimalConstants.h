// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace regime_backtest
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalOneHundred;
      static Decimal BasisPointsPerUnit;       // 10000 basis points == 1.0
      static Decimal DefaultFeeBasisPoints;
      static Decimal DefaultCrashWeekDrop;     // 0.08 (an 8% drop over five bars)
      static Decimal DefaultDownLeverage;
      static Decimal DefaultRsiBuyBelow;
      static Decimal DefaultRsiSellAbove;

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
  // All values are initialised via createDecimal(string) so that
  // dec::decimal<N> never sees a rounded double literal.
  // ---------------------------------------------------------------------------

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
    DecimalConstants<Decimal>::BasisPointsPerUnit(
      DecimalConstants<Decimal>::createDecimal("10000.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultFeeBasisPoints(
      DecimalConstants<Decimal>::createDecimal("2.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultCrashWeekDrop(
      DecimalConstants<Decimal>::createDecimal("0.08"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultDownLeverage(
      DecimalConstants<Decimal>::createDecimal("1.3"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultRsiBuyBelow(
      DecimalConstants<Decimal>::createDecimal("30.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultRsiSellAbove(
      DecimalConstants<Decimal>::createDecimal("70.0"));
}

#endif

#ifndef NUMBER_H
#define NUMBER_H

#include <cmath>
#include <sstream>
#include <string>
#include <type_traits>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Conversions between the fixed-point decimal used for prices and
 *        exposures and the built-in types used for reporting.
 *
 * Every helper accepts either a dec::decimal<N> or a built-in floating point
 * type so that library templates can be instantiated with both.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a decimal (or floating point) value to its string representation.
   */
  template<typename Decimal>
  inline std::string toString(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>) {
      std::ostringstream oss;
      oss << d;
      return oss.str();
    } else {
      return dec::toString(d);
    }
  }

  /**
   * @brief Converts a decimal (or floating point) value to a double.
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
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber, double).
   */
  template<class N>
  inline N fromString(const std::string& s)
  {
    return regime_backtest::DecimalConstants<N>::createDecimal(s);
  }

  /**
   * @brief Absolute value of a decimal (or floating point) number.
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

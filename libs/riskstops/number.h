#ifndef NUMBER_H
#define NUMBER_H

#include <cmath>
#include <string>
#include <type_traits>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Utility functions for the decimal price type: conversions and tick rounding.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  inline std::string toString(const DefaultNumber& d) {
    return dec::toString(d);
  }

  inline std::string toString(double d) {
    return std::to_string(d);
  }

  /**
   * @brief Converts a DefaultNumber to a double.
   * Note: This conversion may result in a loss of precision.
   */
  inline double to_double(const DefaultNumber& d) {
    return d.getAsDouble();
  }

  inline double to_double(double d) {
    return d;
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber or double).
   */
  template<class N>
  inline N fromString(const std::string& s) {
    return mkc_riskstops::DecimalConstants<N>::createDecimal(s);
  }

  template<typename Decimal>
  inline Decimal abs(const Decimal& d) {
    if constexpr (std::is_floating_point_v<Decimal>)
      return d < 0 ? -d : d;
    else
      return d.abs();
  }

  using mkc_riskstops::DecimalConstants;

  /**
   * @brief Rounds a price to the nearest tick value, ties away from zero.
   *
   * @param price The price to be rounded.
   * @param tick The tick size, must be positive.
   * @param tickDiv2 Half of the tick size (`tick / 2`).
   *
   * @details
   * `rem = price % tick` is the distance above the lower tick boundary for a
   * positive price. `price - rem` rounds down to that boundary and a full tick
   * is added back when `rem >= tickDiv2`, so an exact half tick moves up.
   *
   * The remainder of a negative price is negative, so negative prices are
   * mirrored through zero, rounded, and mirrored back. This keeps exact half
   * ticks moving away from zero on both sides.
   */
  template<typename Decimal>
  inline Decimal Round2Tick(Decimal price,
                            Decimal tick,
                            Decimal tickDiv2)
  {
    static const Decimal zero = DecimalConstants<Decimal>::DecimalZero;

    if (price < zero)
      return zero - Round2Tick<Decimal>(zero - price, tick, tickDiv2);

    Decimal rem;
    if constexpr (std::is_floating_point_v<Decimal>)
      rem = std::fmod(price, tick);
    else
      rem = price % tick;

    return price - rem + ((rem < tickDiv2) ? zero : tick);
  }

  /**
   * @brief Rounds a price to the nearest tick value (two-argument version).
   */
  template<typename Decimal>
  inline Decimal Round2Tick(Decimal price,
                            Decimal tick)
  {
    Decimal half = tick / DecimalConstants<Decimal>::DecimalTwo;
    return Round2Tick<Decimal>(price, tick, half);
  }

  inline DefaultNumber Round2Tick(DefaultNumber price,
                                  DefaultNumber tick)
  {
    return Round2Tick<DefaultNumber>(price, tick);
  }

  inline DefaultNumber Round2Tick(DefaultNumber price,
                                  DefaultNumber tick,
                                  DefaultNumber tickDiv2)
  {
    return Round2Tick<DefaultNumber>(price, tick, tickDiv2);
  }

} // namespace num

#endif // NUMBER_H

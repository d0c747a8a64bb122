#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include <bursar/currency/error.hpp>

namespace bursar::currency {

constexpr std::uint64_t cents_per_unit = 100;

/**
 * An exact, non-negative amount counted in minor units (hundredths of the base unit).
 *
 * Values are immutable. Arithmetic goes through add() and subtract(), which reject any
 * result outside of [0, 2^64-1] instead of wrapping.
 */
class cents final
{
public:
  constexpr cents() noexcept = default;

  constexpr explicit cents( std::uint64_t minor_units ) noexcept:
      _minor_units( minor_units )
  {}

  constexpr std::uint64_t value() const noexcept
  {
    return _minor_units;
  }

  constexpr std::uint64_t units() const noexcept
  {
    return _minor_units / cents_per_unit;
  }

  constexpr std::uint64_t fraction() const noexcept
  {
    return _minor_units % cents_per_unit;
  }

  constexpr auto operator<=>( const cents& ) const noexcept = default;

  static constexpr cents max() noexcept
  {
    return cents{ std::numeric_limits< std::uint64_t >::max() };
  }

private:
  std::uint64_t _minor_units = 0;
};

/**
 * Parses a non-negative decimal with at most two fractional digits.
 *
 * Accepts "12", "12.3", "12.34", ".5" and rejects signs, empty fractions ("1."),
 * a lone separator, more than one separator or more than two fractional digits.
 * A single fractional digit counts tenths, so ".1" is ten minor units.
 */
result< cents > parse( std::string_view text ) noexcept;

std::string to_string( cents c );
std::string to_display_string( cents c );

result< cents > add( cents a, cents b ) noexcept;
result< cents > subtract( cents a, cents b ) noexcept;

} // namespace bursar::currency

#include <bursar/currency/cents.hpp>

#include <algorithm>
#include <charconv>
#include <format>

namespace bursar::currency {

constexpr char decimal_separator        = '.';
constexpr std::size_t max_decimal_digits = 2;
constexpr std::uint64_t tenths_scale     = 10;

static bool is_digits( std::string_view sv ) noexcept
{
  return std::ranges::all_of( sv,
                              []( char c )
                              {
                                return c >= '0' && c <= '9';
                              } );
}

static result< std::uint64_t > to_integer( std::string_view digits ) noexcept
{
  if( digits.empty() )
    return 0;

  std::uint64_t value = 0;
  auto [ ptr, ec ]    = std::from_chars( digits.data(), digits.data() + digits.size(), value );

  // Digits already validated, so an out of range value is an overflow rather than bad input
  if( ec == std::errc::result_out_of_range )
    return std::unexpected( currency_errc::amount_overflow );

  if( ec != std::errc{} || ptr != digits.data() + digits.size() )
    return std::unexpected( currency_errc::invalid_amount );

  return value;
}

result< cents > parse( std::string_view text ) noexcept
{
  auto integer_text  = text;
  auto fraction_text = std::string_view{};

  if( auto pos = text.find( decimal_separator ); pos != std::string_view::npos )
  {
    integer_text  = text.substr( 0, pos );
    fraction_text = text.substr( pos + 1 );

    if( fraction_text.empty() || fraction_text.size() > max_decimal_digits )
      return std::unexpected( currency_errc::invalid_amount );
  }
  else if( text.empty() )
    return std::unexpected( currency_errc::invalid_amount );

  // Also rejects a second separator, since it is not a digit
  if( !is_digits( integer_text ) || !is_digits( fraction_text ) )
    return std::unexpected( currency_errc::invalid_amount );

  auto integer_part = to_integer( integer_text );
  if( !integer_part )
    return std::unexpected( integer_part.error() );

  auto fraction_part = to_integer( fraction_text );
  if( !fraction_part )
    return std::unexpected( fraction_part.error() );

  if( fraction_text.size() == 1 )
    *fraction_part *= tenths_scale;

  if( *integer_part > std::numeric_limits< std::uint64_t >::max() / cents_per_unit )
    return std::unexpected( currency_errc::amount_overflow );

  auto minor_units = *integer_part * cents_per_unit;

  if( std::numeric_limits< std::uint64_t >::max() - minor_units < *fraction_part )
    return std::unexpected( currency_errc::amount_overflow );

  return cents{ minor_units + *fraction_part };
}

std::string to_string( cents c )
{
  return std::format( "{}.{:02}", c.units(), c.fraction() );
}

std::string to_display_string( cents c )
{
  return "$" + to_string( c );
}

result< cents > add( cents a, cents b ) noexcept
{
  if( std::numeric_limits< std::uint64_t >::max() - a.value() < b.value() )
    return std::unexpected( currency_errc::balance_overflow );

  return cents{ a.value() + b.value() };
}

result< cents > subtract( cents a, cents b ) noexcept
{
  if( a < b )
    return std::unexpected( currency_errc::account_overdraft );

  return cents{ a.value() - b.value() };
}

} // namespace bursar::currency

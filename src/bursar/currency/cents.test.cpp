#include <gtest/gtest.h>

#include <array>
#include <limits>
#include <string>
#include <string_view>

#include <bursar/currency/cents.hpp>

using namespace std::string_view_literals;
using bursar::currency::cents;
using bursar::currency::currency_errc;

namespace {

void expect_parse( std::string_view text, std::uint64_t expected )
{
  auto value = bursar::currency::parse( text );
  if( value )
    EXPECT_EQ( value->value(), expected ) << "parsing \"" << text << "\"";
  else
    ADD_FAILURE() << "parsing \"" << text << "\" failed: " << value.error().message();
}

void expect_parse_error( std::string_view text, currency_errc expected )
{
  auto value = bursar::currency::parse( text );
  if( value )
    ADD_FAILURE() << "parsing \"" << text << "\" erroneously succeeded";
  else
    EXPECT_EQ( value.error(), bursar::currency::make_error_code( expected ) ) << "parsing \"" << text << "\"";
}

} // namespace

TEST( cents, parse_without_decimal )
{
  expect_parse( "0"sv, 0 );
  expect_parse( "2"sv, 200 );
  expect_parse( "30"sv, 3'000 );
  expect_parse( "007"sv, 700 );

  expect_parse_error( ""sv, currency_errc::invalid_amount );
  expect_parse_error( "-2"sv, currency_errc::invalid_amount );
  expect_parse_error( "+2"sv, currency_errc::invalid_amount );
  expect_parse_error( "2a"sv, currency_errc::invalid_amount );
  expect_parse_error( "wef"sv, currency_errc::invalid_amount );
  expect_parse_error( " 2"sv, currency_errc::invalid_amount );
  expect_parse_error( "2 "sv, currency_errc::invalid_amount );
}

TEST( cents, parse_with_decimal )
{
  expect_parse( ".0"sv, 0 );
  expect_parse( ".02"sv, 2 );
  expect_parse( ".2"sv, 20 );
  expect_parse( ".1"sv, 10 );
  expect_parse( "0.0"sv, 0 );
  expect_parse( "0.00"sv, 0 );
  expect_parse( "1.00"sv, 100 );
  expect_parse( "1.02"sv, 102 );
  expect_parse( "3.1"sv, 310 );
  expect_parse( "30.2"sv, 3'020 );
  expect_parse( "40.02"sv, 4'002 );
  expect_parse( "40.12"sv, 4'012 );
  expect_parse( "40.2"sv, 4'020 );
  expect_parse( "40.20"sv, 4'020 );
  expect_parse( "50.99"sv, 5'099 );

  expect_parse_error( "."sv, currency_errc::invalid_amount );
  expect_parse_error( "-0.0"sv, currency_errc::invalid_amount );
  expect_parse_error( "-1.0"sv, currency_errc::invalid_amount );
  expect_parse_error( "1."sv, currency_errc::invalid_amount );
  expect_parse_error( "2.002"sv, currency_errc::invalid_amount );
  expect_parse_error( ".002"sv, currency_errc::invalid_amount );
  expect_parse_error( "1.1.2"sv, currency_errc::invalid_amount );
  expect_parse_error( ".1.2"sv, currency_errc::invalid_amount );
  expect_parse_error( ".1a"sv, currency_errc::invalid_amount );
  expect_parse_error( "a.2"sv, currency_errc::invalid_amount );
  expect_parse_error( "..2"sv, currency_errc::invalid_amount );
  expect_parse_error( "1,00"sv, currency_errc::invalid_amount );
}

TEST( cents, parse_overflow )
{
  constexpr auto max = std::numeric_limits< std::uint64_t >::max();

  expect_parse( "184467440737095516.15"sv, max );
  expect_parse( "184467440737095516"sv, max - 15 );

  expect_parse_error( std::to_string( max ), currency_errc::amount_overflow );
  expect_parse_error( std::to_string( max ) + ".1", currency_errc::amount_overflow );
  expect_parse_error( std::to_string( max - 1 ) + ".9", currency_errc::amount_overflow );
  expect_parse_error( "184467440737095516.16"sv, currency_errc::amount_overflow );
  expect_parse_error( "184467440737095517"sv, currency_errc::amount_overflow );
  expect_parse_error( "99999999999999999999999999"sv, currency_errc::amount_overflow );

  // Grammar errors are reported even when the digits would also overflow
  expect_parse_error( "99999999999999999999999999x"sv, currency_errc::invalid_amount );
}

TEST( cents, format )
{
  EXPECT_EQ( bursar::currency::to_string( cents{ 0 } ), "0.00" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 9 } ), "0.09" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 10 } ), "0.10" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 99 } ), "0.99" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 100 } ), "1.00" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 109 } ), "1.09" );
  EXPECT_EQ( bursar::currency::to_string( cents{ 4'023 } ), "40.23" );
  EXPECT_EQ( bursar::currency::to_string( cents::max() ), "184467440737095516.15" );

  EXPECT_EQ( bursar::currency::to_display_string( cents{ 5'000 } ), "$50.00" );
  EXPECT_EQ( bursar::currency::to_display_string( cents{ 12 } ), "$0.12" );
}

TEST( cents, format_parse_round_trip )
{
  constexpr auto max = std::numeric_limits< std::uint64_t >::max();
  constexpr std::array< std::uint64_t, 10 > values{ 0, 1, 10, 99, 100, 101, 4'020, 123'456'789, max - 1, max };

  for( auto v: values )
  {
    auto parsed = bursar::currency::parse( bursar::currency::to_string( cents{ v } ) );
    ASSERT_TRUE( parsed );
    EXPECT_EQ( *parsed, cents{ v } );
  }
}

TEST( cents, add )
{
  auto sum = bursar::currency::add( cents{ 2'000 }, cents{ 2'000 } );
  ASSERT_TRUE( sum );
  EXPECT_EQ( sum->value(), 4'000 );

  sum = bursar::currency::add( cents::max(), cents{ 0 } );
  ASSERT_TRUE( sum );
  EXPECT_EQ( *sum, cents::max() );

  sum = bursar::currency::add( cents{ cents::max().value() - 1 }, cents{ 200 } );
  ASSERT_FALSE( sum );
  EXPECT_EQ( sum.error(), currency_errc::balance_overflow );
  EXPECT_EQ( sum.error().message(), "balance overflow" );
}

TEST( cents, subtract )
{
  auto difference = bursar::currency::subtract( cents{ 120 }, cents{ 100 } );
  ASSERT_TRUE( difference );
  EXPECT_EQ( difference->value(), 20 );

  difference = bursar::currency::subtract( cents{ 100 }, cents{ 100 } );
  ASSERT_TRUE( difference );
  EXPECT_EQ( difference->value(), 0 );

  difference = bursar::currency::subtract( cents{ 2 }, cents{ 10 } );
  ASSERT_FALSE( difference );
  EXPECT_EQ( difference.error(), currency_errc::account_overdraft );
  EXPECT_EQ( std::string( difference.error().category().name() ), "currency" );
}

TEST( cents, ordering )
{
  EXPECT_LT( cents{ 1 }, cents{ 2 } );
  EXPECT_EQ( cents{ 42 }, cents{ 42 } );
  EXPECT_NE( cents{ 42 }, cents{ 43 } );
  EXPECT_EQ( cents{}, cents{ 0 } );
}

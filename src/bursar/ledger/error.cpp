#include <bursar/ledger/error.hpp>

#include <format>
#include <string>
#include <utility>

namespace bursar::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ledger";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< ledger_errc >( condition ) )
    {
      case ledger_errc::ok:
        return "ok"s;
      case ledger_errc::empty_account_name:
        return "empty account name"s;
      case ledger_errc::duplicate_account_name:
        return "duplicate account name"s;
      case ledger_errc::account_not_found:
        return "account not found"s;
    }
    std::unreachable();
  }
};

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

error::error( std::error_code code ):
    _code( code )
{}

error error::invalid_amount( std::string text )
{
  error e( currency::currency_errc::invalid_amount );
  e._text = std::move( text );
  return e;
}

error error::amount_overflow( std::string text )
{
  error e( currency::currency_errc::amount_overflow );
  e._text = std::move( text );
  return e;
}

error error::empty_account_name()
{
  return error( ledger_errc::empty_account_name );
}

error error::duplicate_account_name( std::string name )
{
  error e( ledger_errc::duplicate_account_name );
  e._name = std::move( name );
  return e;
}

error error::account_not_found( std::string name )
{
  error e( ledger_errc::account_not_found );
  e._name = std::move( name );
  return e;
}

error error::balance_overflow( std::string name, currency::cents deposit_amount )
{
  error e( currency::currency_errc::balance_overflow );
  e._name   = std::move( name );
  e._amount = deposit_amount;
  return e;
}

error error::account_overdraft( std::string name, currency::cents balance, currency::cents withdraw_amount )
{
  error e( currency::currency_errc::account_overdraft );
  e._name    = std::move( name );
  e._balance = balance;
  e._amount  = withdraw_amount;
  return e;
}

const std::error_code& error::code() const noexcept
{
  return _code;
}

const std::string& error::name() const noexcept
{
  return _name;
}

const std::string& error::text() const noexcept
{
  return _text;
}

currency::cents error::balance() const noexcept
{
  return _balance;
}

currency::cents error::amount() const noexcept
{
  return _amount;
}

std::string error::message() const
{
  using currency::to_display_string;

  if( _code == currency::currency_errc::invalid_amount )
    return std::format(
      "invalid amount \"{}\", must be a non-negative number only containing digits up to two decimal places",
      _text );

  if( _code == currency::currency_errc::amount_overflow )
    return std::format( "amount {} would overflow", _text );

  if( _code == currency::currency_errc::balance_overflow )
    return std::format( "account {} would have balance overflow if {} was deposited",
                        _name,
                        to_display_string( _amount ) );

  if( _code == currency::currency_errc::account_overdraft )
    return std::format( "account {} would overdraft if {} was withdrawn from balance {}",
                        _name,
                        to_display_string( _amount ),
                        to_display_string( _balance ) );

  if( _code == ledger_errc::empty_account_name )
    return "account name cannot be empty";

  if( _code == ledger_errc::duplicate_account_name )
    return std::format( "account with name {} already exists", _name );

  if( _code == ledger_errc::account_not_found )
    return std::format( "account with name {} not found", _name );

  return _code.message();
}

} // namespace bursar::ledger

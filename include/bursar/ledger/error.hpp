#pragma once

#include <expected>
#include <string>
#include <system_error>

#include <bursar/currency/cents.hpp>

namespace bursar::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_account_name,
  duplicate_account_name,
  account_not_found
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

/**
 * A failed ledger operation.
 *
 * The code identifies the kind of failure, either a ledger_errc or a currency_errc
 * propagated from amount parsing and arithmetic. The remaining fields carry whatever
 * context the failure has: the account involved, its balance, the attempted amount
 * and the amount text as supplied by the caller.
 */
class error final
{
public:
  error( std::error_code code );

  static error invalid_amount( std::string text );
  static error amount_overflow( std::string text );
  static error empty_account_name();
  static error duplicate_account_name( std::string name );
  static error account_not_found( std::string name );
  static error balance_overflow( std::string name, currency::cents deposit_amount );
  static error account_overdraft( std::string name, currency::cents balance, currency::cents withdraw_amount );

  const std::error_code& code() const noexcept;
  const std::string& name() const noexcept;
  const std::string& text() const noexcept;
  currency::cents balance() const noexcept;
  currency::cents amount() const noexcept;

  std::string message() const;

  bool operator==( const error& ) const = default;

private:
  std::error_code _code;
  std::string _name;
  std::string _text;
  currency::cents _balance;
  currency::cents _amount;
};

template< typename T >
using result = std::expected< T, error >;

} // namespace bursar::ledger

template<>
struct std::is_error_code_enum< bursar::ledger::ledger_errc >: public std::true_type
{};

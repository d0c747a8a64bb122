#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <bursar/currency/cents.hpp>
#include <bursar/ledger/account.hpp>
#include <bursar/ledger/error.hpp>

namespace bursar::ledger {

struct transfer_receipt
{
  currency::cents from_balance;
  currency::cents to_balance;

  bool operator==( const transfer_receipt& ) const = default;
};

/**
 * The ordered set of uniquely named accounts.
 *
 * Every operation either succeeds completely or fails without modifying any account.
 * Account names are checked before amounts are parsed, so a call naming a missing or
 * duplicate account reports that even when its amount is also malformed.
 *
 * Not thread safe. Callers sharing a ledger must serialize all operations.
 */
class ledger
{
public:
  ledger() = default;

  /**
   * Rebuilds a ledger from previously persisted accounts, keeping their order.
   *
   * Fails on the first empty or repeated name.
   */
  static result< ledger > restore( std::vector< account > accounts );

  result< account > create( std::string_view name, std::string_view amount );
  result< currency::cents > deposit( std::string_view name, std::string_view amount );
  result< currency::cents > withdraw( std::string_view name, std::string_view amount );

  /**
   * Moves an amount between two accounts as a single unit.
   *
   * The withdrawal is first tried against a copy of the source account and the deposit
   * is applied to the destination. The source is only debited once both legs are known
   * to succeed.
   */
  result< transfer_receipt > transfer( std::string_view from, std::string_view to, std::string_view amount );

  std::span< const account > accounts() const noexcept;
  const account* find( std::string_view name ) const noexcept;

  std::size_t size() const noexcept;
  bool empty() const noexcept;

private:
  result< std::size_t > index_of( std::string_view name ) const;

  std::vector< account > _accounts;
};

} // namespace bursar::ledger

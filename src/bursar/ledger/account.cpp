#include <bursar/ledger/account.hpp>

namespace bursar::ledger {

result< currency::cents > account::deposit( currency::cents amount )
{
  auto new_balance = currency::add( balance, amount );
  if( !new_balance )
    return std::unexpected( error::balance_overflow( name, amount ) );

  balance = *new_balance;
  return balance;
}

result< currency::cents > account::withdraw( currency::cents amount )
{
  auto new_balance = currency::subtract( balance, amount );
  if( !new_balance )
    return std::unexpected( error::account_overdraft( name, balance, amount ) );

  balance = *new_balance;
  return balance;
}

} // namespace bursar::ledger

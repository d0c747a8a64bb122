#pragma once

#include <string>

#include <bursar/currency/cents.hpp>
#include <bursar/ledger/error.hpp>

namespace bursar::ledger {

struct account
{
  std::string name;
  currency::cents balance;

  // Both leave the balance untouched on failure and return the new balance otherwise
  result< currency::cents > deposit( currency::cents amount );
  result< currency::cents > withdraw( currency::cents amount );

  bool operator==( const account& ) const = default;
};

} // namespace bursar::ledger

#include <bursar/ledger/ledger.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <bursar/log.hpp>

namespace bursar::ledger {

static result< currency::cents > parse_amount( std::string_view text )
{
  auto amount = currency::parse( text );
  if( amount )
    return *amount;

  if( amount.error() == currency::currency_errc::amount_overflow )
    return std::unexpected( error::amount_overflow( std::string( text ) ) );

  return std::unexpected( error::invalid_amount( std::string( text ) ) );
}

result< ledger > ledger::restore( std::vector< account > accounts )
{
  ledger l;
  l._accounts.reserve( accounts.size() );

  for( auto& acc: accounts )
  {
    if( acc.name.empty() )
      return std::unexpected( error::empty_account_name() );

    if( l.find( acc.name ) )
      return std::unexpected( error::duplicate_account_name( std::move( acc.name ) ) );

    l._accounts.push_back( std::move( acc ) );
  }

  return l;
}

result< std::size_t > ledger::index_of( std::string_view name ) const
{
  auto itr = std::ranges::find( _accounts, name, &account::name );
  if( itr == _accounts.end() )
    return std::unexpected( error::account_not_found( std::string( name ) ) );

  return static_cast< std::size_t >( std::distance( _accounts.begin(), itr ) );
}

result< account > ledger::create( std::string_view name, std::string_view amount )
{
  if( name.empty() )
    return std::unexpected( error::empty_account_name() );

  if( find( name ) )
    return std::unexpected( error::duplicate_account_name( std::string( name ) ) );

  auto balance = parse_amount( amount );
  if( !balance )
    return std::unexpected( balance.error() );

  const auto& acc = _accounts.emplace_back( std::string( name ), *balance );
  LOG_INFO( log::instance(), "Account created with name {} and balance {}", acc.name, acc.balance );

  return acc;
}

result< currency::cents > ledger::deposit( std::string_view name, std::string_view amount )
{
  auto index = index_of( name );
  if( !index )
    return std::unexpected( index.error() );

  auto value = parse_amount( amount );
  if( !value )
    return std::unexpected( value.error() );

  auto& acc        = _accounts[ *index ];
  auto new_balance = acc.deposit( *value );
  if( !new_balance )
    return std::unexpected( new_balance.error() );

  LOG_INFO( log::instance(), "Account {} balance is now {}", acc.name, *new_balance );
  return new_balance;
}

result< currency::cents > ledger::withdraw( std::string_view name, std::string_view amount )
{
  auto index = index_of( name );
  if( !index )
    return std::unexpected( index.error() );

  auto value = parse_amount( amount );
  if( !value )
    return std::unexpected( value.error() );

  auto& acc        = _accounts[ *index ];
  auto new_balance = acc.withdraw( *value );
  if( !new_balance )
    return std::unexpected( new_balance.error() );

  LOG_INFO( log::instance(), "Account {} balance is now {}", acc.name, *new_balance );
  return new_balance;
}

result< transfer_receipt > ledger::transfer( std::string_view from, std::string_view to, std::string_view amount )
{
  auto from_index = index_of( from );
  if( !from_index )
    return std::unexpected( from_index.error() );

  auto to_index = index_of( to );
  if( !to_index )
    return std::unexpected( to_index.error() );

  auto value = parse_amount( amount );
  if( !value )
    return std::unexpected( value.error() );

  // Trial withdrawal against a snapshot, the real source account is not touched yet
  auto snapshot = _accounts[ *from_index ];
  if( auto trial = snapshot.withdraw( *value ); !trial )
    return std::unexpected( trial.error() );

  if( auto deposited = _accounts[ *to_index ].deposit( *value ); !deposited )
    return std::unexpected( deposited.error() );

  if( auto committed = _accounts[ *from_index ].withdraw( *value ); !committed )
    throw std::logic_error( "transfer withdrawal failed after a successful trial: " + committed.error().message() );

  transfer_receipt receipt{ .from_balance = _accounts[ *from_index ].balance,
                            .to_balance   = _accounts[ *to_index ].balance };

  LOG_INFO( log::instance(),
            "{} balance is now {}, {} balance is now {}",
            _accounts[ *from_index ].name,
            receipt.from_balance,
            _accounts[ *to_index ].name,
            receipt.to_balance );

  return receipt;
}

std::span< const account > ledger::accounts() const noexcept
{
  return _accounts;
}

const account* ledger::find( std::string_view name ) const noexcept
{
  auto itr = std::ranges::find( _accounts, name, &account::name );
  return itr == _accounts.end() ? nullptr : &*itr;
}

std::size_t ledger::size() const noexcept
{
  return _accounts.size();
}

bool ledger::empty() const noexcept
{
  return _accounts.empty();
}

} // namespace bursar::ledger

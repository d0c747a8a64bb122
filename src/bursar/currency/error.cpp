#include <bursar/currency/error.hpp>

#include <string>
#include <utility>

namespace bursar::currency {

struct _currency_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "currency";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< currency_errc >( condition ) )
    {
      case currency_errc::ok:
        return "ok"s;
      case currency_errc::invalid_amount:
        return "invalid amount"s;
      case currency_errc::amount_overflow:
        return "amount overflow"s;
      case currency_errc::balance_overflow:
        return "balance overflow"s;
      case currency_errc::account_overdraft:
        return "account overdraft"s;
    }
    std::unreachable();
  }
};

const std::error_category& currency_category() noexcept
{
  static _currency_category category;
  return category;
}

std::error_code make_error_code( currency_errc e )
{
  return std::error_code( static_cast< int >( e ), currency_category() );
}

} // namespace bursar::currency

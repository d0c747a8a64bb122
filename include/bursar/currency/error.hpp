#pragma once

#include <expected>
#include <system_error>

namespace bursar::currency {

enum class currency_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_amount,
  amount_overflow,
  balance_overflow,
  account_overdraft
};

const std::error_category& currency_category() noexcept;

std::error_code make_error_code( currency_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace bursar::currency

template<>
struct std::is_error_code_enum< bursar::currency::currency_errc >: public std::true_type
{};

#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <system_error>

namespace bursar::storage {

enum class storage_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  read_failed,
  write_failed,
  malformed_record,
  empty_account_name,
  duplicate_account_name
};

const std::error_category& storage_category() noexcept;

std::error_code make_error_code( storage_errc e );

class error final
{
public:
  error( std::error_code code, std::size_t line = 0, std::string detail = {} );

  const std::error_code& code() const noexcept;

  // 1-based line of the offending record, 0 when the failure is not tied to a record
  std::size_t line() const noexcept;
  const std::string& detail() const noexcept;

  std::string message() const;

private:
  std::error_code _code;
  std::size_t _line = 0;
  std::string _detail;
};

template< typename T >
using result = std::expected< T, error >;

} // namespace bursar::storage

template<>
struct std::is_error_code_enum< bursar::storage::storage_errc >: public std::true_type
{};

#include <bursar/storage/error.hpp>

#include <format>
#include <string>
#include <utility>

namespace bursar::storage {

struct _storage_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "storage";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< storage_errc >( condition ) )
    {
      case storage_errc::ok:
        return "ok"s;
      case storage_errc::read_failed:
        return "read failed"s;
      case storage_errc::write_failed:
        return "write failed"s;
      case storage_errc::malformed_record:
        return "malformed record"s;
      case storage_errc::empty_account_name:
        return "empty account name"s;
      case storage_errc::duplicate_account_name:
        return "duplicate account name"s;
    }
    std::unreachable();
  }
};

const std::error_category& storage_category() noexcept
{
  static _storage_category category;
  return category;
}

std::error_code make_error_code( storage_errc e )
{
  return std::error_code( static_cast< int >( e ), storage_category() );
}

error::error( std::error_code code, std::size_t line, std::string detail ):
    _code( code ),
    _line( line ),
    _detail( std::move( detail ) )
{}

const std::error_code& error::code() const noexcept
{
  return _code;
}

std::size_t error::line() const noexcept
{
  return _line;
}

const std::string& error::detail() const noexcept
{
  return _detail;
}

std::string error::message() const
{
  auto msg = _code.message();

  if( _line )
    msg = std::format( "{} on line {}", msg, _line );

  if( !_detail.empty() )
    msg = std::format( "{}: {}", msg, _detail );

  return msg;
}

} // namespace bursar::storage

#include <bursar/storage/csv.hpp>

#include <charconv>
#include <format>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/algorithm/string/replace.hpp>

#include <bursar/log.hpp>

namespace bursar::storage {

constexpr std::string_view header = "name,balance";
constexpr std::size_t columns     = 2;
constexpr char delimiter          = ',';
constexpr char quote_char         = '"';

static std::string quote( const std::string& field )
{
  if( field.find_first_of( ",\"\r\n" ) == std::string::npos )
    return field;

  return quote_char + boost::algorithm::replace_all_copy( field, "\"", "\"\"" ) + quote_char;
}

struct record
{
  std::vector< std::string > fields;
  std::size_t line = 0;
};

/**
 * Reads one RFC 4180 record. Quoted fields may contain delimiters, doubled quotes and
 * line breaks. Returns an empty optional at the end of the input.
 */
static result< std::optional< record > > read_record( std::istream& in, std::size_t& line_number )
{
  using traits = std::istream::traits_type;

  if( in.peek() == traits::eof() )
    return std::nullopt;

  record r;
  r.line = ++line_number;

  std::string field;
  bool in_quotes = false;
  bool quoted    = false;

  for( auto c = in.get(); c != traits::eof(); c = in.get() )
  {
    auto ch = traits::to_char_type( c );

    if( in_quotes )
    {
      if( ch == quote_char )
      {
        if( in.peek() == quote_char )
        {
          in.get();
          field += quote_char;
        }
        else
          in_quotes = false;
      }
      else
      {
        if( ch == '\n' )
          ++line_number;
        field += ch;
      }
      continue;
    }

    if( ch == '\r' && in.peek() == '\n' )
      continue;

    if( ch == '\n' )
    {
      r.fields.push_back( std::move( field ) );
      return r;
    }

    if( ch == delimiter )
    {
      r.fields.push_back( std::move( field ) );
      field.clear();
      quoted = false;
    }
    else if( ch == quote_char && field.empty() && !quoted )
    {
      in_quotes = true;
      quoted    = true;
    }
    else if( ch == quote_char || quoted )
      return std::unexpected( error( storage_errc::malformed_record, line_number, "unexpected character around quoted field" ) );
    else
      field += ch;
  }

  if( in_quotes )
    return std::unexpected( error( storage_errc::malformed_record, r.line, "unterminated quoted field" ) );

  r.fields.push_back( std::move( field ) );
  return r;
}

result< ledger::ledger > load( const std::filesystem::path& p )
{
  std::error_code ec;
  if( !std::filesystem::exists( p, ec ) )
  {
    if( ec )
      return std::unexpected( error( storage_errc::read_failed, 0, ec.message() ) );

    LOG_INFO( log::instance(), "Ledger file {} does not exist, starting empty", p.string() );
    return ledger::ledger{};
  }

  if( !std::filesystem::is_regular_file( p, ec ) )
    return std::unexpected( error( storage_errc::read_failed, 0, std::format( "{} is not a regular file", p.string() ) ) );

  std::ifstream in( p, std::ios::binary );
  if( !in )
    return std::unexpected( error( storage_errc::read_failed, 0, p.string() ) );

  std::vector< ledger::account > accounts;
  std::unordered_set< std::string > names;
  std::size_t line_number = 0;
  bool header_read        = false;

  while( true )
  {
    auto next = read_record( in, line_number );
    if( !next )
      return std::unexpected( next.error() );

    if( !*next )
      break;

    auto& [ fields, line ] = **next;

    // Blank line
    if( fields.size() == 1 && fields.front().empty() )
      continue;

    if( !header_read )
    {
      if( fields.size() != columns || fields[ 0 ] != "name" || fields[ 1 ] != "balance" )
        return std::unexpected(
          error( storage_errc::malformed_record, line, std::format( "expected header \"{}\"", header ) ) );

      header_read = true;
      continue;
    }

    if( fields.size() != columns )
      return std::unexpected( error( storage_errc::malformed_record, line, std::format( "expected {} fields", columns ) ) );

    auto& name          = fields[ 0 ];
    const auto& balance = fields[ 1 ];

    std::uint64_t minor_units = 0;
    auto [ ptr, err ]         = std::from_chars( balance.data(), balance.data() + balance.size(), minor_units );
    if( balance.empty() || err != std::errc{} || ptr != balance.data() + balance.size() )
      return std::unexpected(
        error( storage_errc::malformed_record, line, std::format( "invalid balance \"{}\"", balance ) ) );

    if( name.empty() )
      return std::unexpected( error( storage_errc::empty_account_name, line ) );

    if( !names.insert( name ).second )
      return std::unexpected( error( storage_errc::duplicate_account_name, line, name ) );

    accounts.push_back( ledger::account{ .name = std::move( name ), .balance = currency::cents{ minor_units } } );
  }

  if( in.bad() )
    return std::unexpected( error( storage_errc::read_failed, line_number, p.string() ) );

  auto restored = ledger::ledger::restore( std::move( accounts ) );
  if( !restored )
  {
    if( restored.error().code() == ledger::ledger_errc::empty_account_name )
      return std::unexpected( error( storage_errc::empty_account_name ) );

    return std::unexpected( error( storage_errc::duplicate_account_name, 0, restored.error().name() ) );
  }

  LOG_DEBUG( log::instance(), "Loaded {} accounts from {}", restored->size(), p.string() );
  return std::move( *restored );
}

result< void > save( const ledger::ledger& l, const std::filesystem::path& p )
{
  std::ofstream out( p, std::ios::out | std::ios::trunc | std::ios::binary );
  if( !out )
    return std::unexpected( error( storage_errc::write_failed, 0, p.string() ) );

  out << header << '\n';
  for( const auto& acc: l.accounts() )
    out << quote( acc.name ) << delimiter << acc.balance.value() << '\n';

  out.flush();
  if( !out )
    return std::unexpected( error( storage_errc::write_failed, 0, p.string() ) );

  LOG_DEBUG( log::instance(), "Saved {} accounts to {}", l.size(), p.string() );
  return {};
}

} // namespace bursar::storage

#include <algorithm>
#include <array>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <print>
#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <bursar/config.hpp>
#include <bursar/currency.hpp>
#include <bursar/ledger.hpp>
#include <bursar/log.hpp>
#include <bursar/storage.hpp>

namespace constants {

using namespace std::string_literals;

const auto help_option          = "help,h"s;
const auto version_option       = "version,v"s;
const auto basedir_option       = "basedir,d"s;
const auto basedir_default      = "."s;
const auto ledger_file_option   = "ledger-file"s;
const auto ledger_file_default  = "banking_system.csv"s;
const auto log_level_option     = "log-level,l"s;
const auto log_level_default    = "warning"s;
const auto command_option       = "command"s;
const auto name_option          = "name,n"s;
const auto from_option          = "from,f"s;
const auto to_option            = "to,t"s;
const auto amount_option        = "amount,a"s;

const auto show_command     = "show"s;
const auto create_command   = "create"s;
const auto deposit_command  = "deposit"s;
const auto withdraw_command = "withdraw"s;
const auto transfer_command = "transfer"s;

const std::array commands{ show_command, create_command, deposit_command, withdraw_command, transfer_command };

} // namespace constants

using namespace bursar;

namespace {

std::string require( const boost::program_options::variables_map& args, const std::string& key )
{
  auto name = config::option_name( key );
  if( !args.count( name ) )
    throw boost::program_options::required_option( name );

  return args[ name ].as< std::string >();
}

void show( const ledger::ledger& l )
{
  for( const auto& acc: l.accounts() )
    std::println( "name: {}\tbalance: {}", acc.name, currency::to_display_string( acc.balance ) );
}

ledger::result< void >
execute( ledger::ledger& l, const std::string& command, const boost::program_options::variables_map& args )
{
  if( command == constants::create_command )
  {
    auto acc = l.create( require( args, constants::name_option ), require( args, constants::amount_option ) );
    if( !acc )
      return std::unexpected( acc.error() );

    std::println( "Account created with name {} and balance {}",
                  acc->name,
                  currency::to_display_string( acc->balance ) );
  }
  else if( command == constants::deposit_command )
  {
    auto balance = l.deposit( require( args, constants::name_option ), require( args, constants::amount_option ) );
    if( !balance )
      return std::unexpected( balance.error() );

    std::println( "Account balance is now {}", currency::to_display_string( *balance ) );
  }
  else if( command == constants::withdraw_command )
  {
    auto balance = l.withdraw( require( args, constants::name_option ), require( args, constants::amount_option ) );
    if( !balance )
      return std::unexpected( balance.error() );

    std::println( "Account balance is now {}", currency::to_display_string( *balance ) );
  }
  else if( command == constants::transfer_command )
  {
    auto from    = require( args, constants::from_option );
    auto to      = require( args, constants::to_option );
    auto receipt = l.transfer( from, to, require( args, constants::amount_option ) );
    if( !receipt )
      return std::unexpected( receipt.error() );

    std::println( "{} balance is now {}, {} balance is now {}",
                  from,
                  currency::to_display_string( receipt->from_balance ),
                  to,
                  currency::to_display_string( receipt->to_balance ) );
  }
  else
  {
    show( l );
  }

  return {};
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  bursar::log::initialize();

  try
  {
    boost::program_options::options_description options( "Usage: bursar <show|create|deposit|withdraw|transfer> [options]" );

    // clang-format off
    options.add_options()
      ( constants::help_option.data()       , "Print this help message and exit" )
      ( constants::version_option.data()    , "Print version string and exit" )
      ( constants::basedir_option.data()    , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Bursar base directory" )
      ( constants::ledger_file_option.data(), boost::program_options::value< std::string >(), "The ledger CSV file (absolute path or relative to basedir)" )
      ( constants::log_level_option.data()  , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::name_option.data()       , boost::program_options::value< std::string >(), "Account name" )
      ( constants::from_option.data()       , boost::program_options::value< std::string >(), "Account to transfer from" )
      ( constants::to_option.data()         , boost::program_options::value< std::string >(), "Account to transfer to" )
      ( constants::amount_option.data()     , boost::program_options::value< std::string >(), "Amount, up to two decimal places" );
    // clang-format on

    boost::program_options::options_description hidden;
    hidden.add_options()( constants::command_option.data(), boost::program_options::value< std::string >() );

    boost::program_options::options_description all;
    all.add( options ).add( hidden );

    boost::program_options::positional_options_description positional;
    positional.add( constants::command_option.data(), 1 );

    boost::program_options::variables_map args;
    boost::program_options::store(
      boost::program_options::command_line_parser( argc, argv ).options( all ).positional( positional ).run(),
      args );
    boost::program_options::notify( args );

    if( args.count( config::option_name( constants::help_option ) ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( config::option_name( constants::version_option ) ) )
    {
      std::println( "v0.1.0" );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ config::option_name( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    auto yaml_config    = config::load( basedir );
    auto service_config = yaml_config[ std::string( config::service_name ) ];
    auto global_config  = yaml_config[ std::string( config::global_name ) ];

    // clang-format off
    auto log_level   = config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    auto ledger_file = std::filesystem::path( config::get_option< std::string >( constants::ledger_file_option, constants::ledger_file_default, args, service_config, global_config ) );
    // clang-format on

    if( !bursar::log::set_level( log_level ) )
    {
      std::println( std::cerr, "error: unknown log level '{}'", log_level );
      return EXIT_FAILURE;
    }

    if( ledger_file.is_relative() )
      ledger_file = basedir / ledger_file;

    if( !args.count( constants::command_option ) )
    {
      std::println( std::cerr, "error: a command is required" );
      options.print( std::cerr );
      return EXIT_FAILURE;
    }

    const auto command = args[ constants::command_option ].as< std::string >();

    if( std::ranges::find( constants::commands, command ) == constants::commands.end() )
    {
      std::println( std::cerr, "error: unknown command '{}'", command );
      options.print( std::cerr );
      return EXIT_FAILURE;
    }

    LOG_DEBUG( bursar::log::instance(), "Using ledger file {}", ledger_file.string() );

    auto l = storage::load( ledger_file );
    if( !l )
    {
      LOG_ERROR( bursar::log::instance(), "Failed to load {}: {}", ledger_file.string(), l.error().message() );
      std::println( std::cerr, "error: {}", l.error().message() );
      return EXIT_FAILURE;
    }

    if( auto executed = execute( *l, command, args ); !executed )
    {
      LOG_INFO( bursar::log::instance(), "Command {} failed: {}", command, executed.error().message() );
      std::println( std::cerr, "error: {}", executed.error().message() );
      return EXIT_FAILURE;
    }

    if( auto saved = storage::save( *l, ledger_file ); !saved )
    {
      LOG_ERROR( bursar::log::instance(), "Failed to save {}: {}", ledger_file.string(), saved.error().message() );
      std::println( std::cerr, "error: {}", saved.error().message() );
      return EXIT_FAILURE;
    }
  }
  catch( const boost::program_options::error& e )
  {
    std::println( std::cerr, "error: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( bursar::log::instance(), "Invalid configuration: {}", e.what() );
    std::println( std::cerr, "error: invalid configuration: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( bursar::log::instance(), "Unexpected error: {}", e.what() );
    std::println( std::cerr, "error: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

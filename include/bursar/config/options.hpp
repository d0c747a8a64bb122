#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <boost/program_options/variables_map.hpp>
#include <yaml-cpp/yaml.h>

namespace bursar::config {

constexpr std::string_view service_name = "bursar";
constexpr std::string_view global_name  = "global";

/**
 * Loads config.yml (or config.yaml) from the base directory. The returned node is
 * null when neither file exists. Throws YAML::Exception on malformed files.
 */
YAML::Node load( const std::filesystem::path& basedir );

// Strips the short alias from a program options key, "log-level,l" becomes "log-level"
std::string option_name( std::string_view key );

/**
 * Looks up an option in order of precedence: the command line, the service section of
 * the config file, the global section, then the default value.
 */
template< typename T >
T get_option( std::string_view key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config = YAML::Node{},
              const YAML::Node& global_config  = YAML::Node{} )
{
  auto name = option_name( key );

  if( args.count( name ) )
    return args[ name ].as< T >();

  if( service_config.IsMap() && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config.IsMap() && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

} // namespace bursar::config

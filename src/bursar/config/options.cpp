#include <bursar/config/options.hpp>

namespace bursar::config {

YAML::Node load( const std::filesystem::path& basedir )
{
  auto yaml_config = basedir / "config.yml";
  if( !std::filesystem::exists( yaml_config ) )
    yaml_config = basedir / "config.yaml";

  if( !std::filesystem::exists( yaml_config ) )
    return YAML::Node{};

  return YAML::LoadFile( yaml_config.string() );
}

std::string option_name( std::string_view key )
{
  return std::string( key.substr( 0, key.find( ',' ) ) );
}

} // namespace bursar::config

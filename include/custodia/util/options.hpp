#pragma once

#include <optional>
#include <string>
#include <type_traits>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <custodia/net/endpoint.hpp>
#include <custodia/util/error.hpp>

namespace custodia::util {

constexpr auto endpoint_option       = "endpoint,e";
constexpr auto clear_endpoint_option = "clear-endpoint";

// "name,n" -> "name"
std::string option_name( const std::string& option );

/**
 * Resolves an option from the command line first, then the service section of the
 * config file, then its global section, then the default.
 *
 * Options without a value, such as "--clear-endpoint", resolve to true when present.
 */
template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  const auto name = option_name( option );

  if( args.count( name ) )
  {
    if constexpr( std::is_same_v< T, bool > )
      return true;
    else
      return args[ name ].as< T >();
  }

  if( service_config && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

// No value: leave the endpoint alone. A present nullopt: clear it.
using endpoint_update = std::optional< std::optional< net::endpoint > >;

/**
 * Decides how the remote harvesting endpoint changes.
 *
 * "--endpoint" and "--clear-endpoint" conflict only when both are on the command line.
 * "--clear-endpoint" overrides an endpoint taken from the config file.
 */
result< endpoint_update > resolve_endpoint_update( const boost::program_options::variables_map& args,
                                                   const YAML::Node& service_config = YAML::Node(),
                                                   const YAML::Node& global_config  = YAML::Node() );

} // namespace custodia::util

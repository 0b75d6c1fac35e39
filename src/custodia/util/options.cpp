#include <custodia/util/options.hpp>

#include <utility>

namespace custodia::util {

std::string option_name( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

result< endpoint_update > resolve_endpoint_update( const boost::program_options::variables_map& args,
                                                   const YAML::Node& service_config,
                                                   const YAML::Node& global_config )
{
  const bool clear        = args.count( option_name( clear_endpoint_option ) );
  const bool endpoint_arg = args.count( option_name( endpoint_option ) );

  if( clear && endpoint_arg )
    return std::unexpected( util_errc::conflicting_options );

  if( clear )
    return endpoint_update( std::in_place, std::nullopt );

  auto endpoint_str = get_option< std::string >( endpoint_option, "", args, service_config, global_config );
  if( endpoint_str.empty() )
    return endpoint_update();

  auto ep = net::endpoint::from_string( endpoint_str );
  if( !ep )
    return std::unexpected( ep.error() );

  return endpoint_update( std::in_place, std::move( *ep ) );
}

} // namespace custodia::util

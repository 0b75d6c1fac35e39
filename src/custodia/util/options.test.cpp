// NOLINTBEGIN

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <custodia/net/error.hpp>
#include <custodia/util/options.hpp>

namespace {

boost::program_options::variables_map parse( std::vector< const char* > argv )
{
  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( custodia::util::endpoint_option      , boost::program_options::value< std::string >(), "Endpoint" )
    ( custodia::util::clear_endpoint_option, "Clear the endpoint" )
    ( "log-level,l"                        , boost::program_options::value< std::string >(), "Log level" )
    ( "verbose"                            , "Verbose" );
  // clang-format on

  argv.insert( argv.begin(), "custodia_wallet" );

  boost::program_options::variables_map args;
  boost::program_options::store(
    boost::program_options::parse_command_line( static_cast< int >( argv.size() ), argv.data(), options ),
    args );
  boost::program_options::notify( args );
  return args;
}

} // namespace

TEST( options, option_name )
{
  EXPECT_EQ( custodia::util::option_name( "endpoint,e" ), "endpoint" );
  EXPECT_EQ( custodia::util::option_name( "clear-endpoint" ), "clear-endpoint" );
}

TEST( options, get_option_precedence )
{
  auto wallet_config = YAML::Load( "log-level: debug\n" );
  auto global_config = YAML::Load( "log-level: error\nverbose: true\n" );

  auto args = parse( { "--log-level", "trace" } );
  EXPECT_EQ( custodia::util::get_option< std::string >( "log-level,l", "info", args, wallet_config, global_config ),
             "trace" );

  args = parse( {} );
  EXPECT_EQ( custodia::util::get_option< std::string >( "log-level,l", "info", args, wallet_config, global_config ),
             "debug" );
  EXPECT_EQ( custodia::util::get_option< std::string >( "log-level,l", "info", args, YAML::Node(), global_config ),
             "error" );
  EXPECT_EQ( custodia::util::get_option< std::string >( "log-level,l", "info", args ), "info" );

  EXPECT_TRUE( custodia::util::get_option< bool >( "verbose", false, args, wallet_config, global_config ) );
  EXPECT_FALSE( custodia::util::get_option< bool >( "verbose", false, args ) );

  args = parse( { "--verbose" } );
  EXPECT_TRUE( custodia::util::get_option< bool >( "verbose", false, args ) );
}

TEST( options, endpoint_unchanged )
{
  auto update = custodia::util::resolve_endpoint_update( parse( {} ) );
  ASSERT_TRUE( update );
  EXPECT_FALSE( *update );
}

TEST( options, endpoint_from_config )
{
  auto wallet_config = YAML::Load( "endpoint: http://10.0.0.1:7890\n" );

  auto update = custodia::util::resolve_endpoint_update( parse( {} ), wallet_config );
  ASSERT_TRUE( update );
  ASSERT_TRUE( *update );
  ASSERT_TRUE( **update );
  EXPECT_EQ( ( **update )->to_string(), "http://10.0.0.1:7890" );

  auto global_config = YAML::Load( "endpoint: https://node.example:443\n" );

  update = custodia::util::resolve_endpoint_update( parse( {} ), YAML::Node(), global_config );
  ASSERT_TRUE( update );
  ASSERT_TRUE( *update );
  ASSERT_TRUE( **update );
  EXPECT_EQ( ( **update )->to_string(), "https://node.example:443" );
}

TEST( options, command_line_endpoint_overrides_config )
{
  auto wallet_config = YAML::Load( "endpoint: http://10.0.0.1:7890\n" );

  auto update = custodia::util::resolve_endpoint_update( parse( { "--endpoint", "http://127.0.0.1:1234" } ),
                                                         wallet_config );
  ASSERT_TRUE( update );
  ASSERT_TRUE( *update );
  ASSERT_TRUE( **update );
  EXPECT_EQ( ( **update )->to_string(), "http://127.0.0.1:1234" );
}

TEST( options, clear_endpoint_overrides_config )
{
  auto wallet_config = YAML::Load( "endpoint: http://10.0.0.1:7890\n" );
  auto global_config = YAML::Load( "endpoint: https://node.example:443\n" );

  auto update = custodia::util::resolve_endpoint_update( parse( { "--clear-endpoint" } ), wallet_config, global_config );
  ASSERT_TRUE( update );
  ASSERT_TRUE( *update );
  EXPECT_FALSE( **update );

  update = custodia::util::resolve_endpoint_update( parse( { "--clear-endpoint" } ) );
  ASSERT_TRUE( update );
  ASSERT_TRUE( *update );
  EXPECT_FALSE( **update );
}

TEST( options, endpoint_and_clear_endpoint_conflict )
{
  auto update =
    custodia::util::resolve_endpoint_update( parse( { "--endpoint", "http://127.0.0.1:1234", "--clear-endpoint" } ) );
  ASSERT_FALSE( update );
  EXPECT_EQ( update.error(), custodia::util::util_errc::conflicting_options );
  EXPECT_EQ( update.error().message(), "conflicting command line options" );
}

TEST( options, invalid_endpoint )
{
  auto update = custodia::util::resolve_endpoint_update( parse( { "-e", "127.0.0.1:1234" } ) );
  ASSERT_FALSE( update );
  EXPECT_EQ( update.error(), custodia::net::net_errc::invalid_endpoint );

  auto wallet_config = YAML::Load( "endpoint: not-an-endpoint\n" );

  update = custodia::util::resolve_endpoint_update( parse( {} ), wallet_config );
  ASSERT_FALSE( update );
}

// NOLINTEND

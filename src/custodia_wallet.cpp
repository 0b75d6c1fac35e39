#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <custodia/encode.hpp>
#include <custodia/log.hpp>
#include <custodia/memory.hpp>
#include <custodia/net.hpp>
#include <custodia/serialization.hpp>
#include <custodia/util.hpp>
#include <custodia/wallet.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto xml_format    = "xml"s;
constexpr auto binary_format = "binary"s;

constexpr auto config_section = "wallet"s;

constexpr auto help_option              = "help,h"s;
constexpr auto version_option           = "version,v"s;
constexpr auto basedir_option           = "basedir,d"s;
constexpr auto basedir_default          = "."s;
constexpr auto log_level_option         = "log-level,l"s;
constexpr auto log_level_default        = "info"s;
constexpr auto new_option               = "new,n"s;
constexpr auto private_key_option       = "private-key,k"s;
constexpr auto remote_key_option        = "remote-key,r"s;
constexpr auto input_option             = "input,i"s;
constexpr auto output_option            = "output,o"s;
constexpr auto format_option            = "format,f"s;
constexpr auto format_default           = xml_format;
const auto ensure_remote_key_option     = "ensure-remote-key"s;
constexpr auto ensure_remote_key_default = false;

} // namespace constants

using custodia::util::get_option;
using custodia::util::option_name;

namespace {

std::optional< std::vector< std::byte > > read_file( const std::filesystem::path& path )
{
  std::ifstream ifs( path, std::ios::binary );
  if( !ifs )
    return std::nullopt;

  std::string contents( ( std::istreambuf_iterator< char >( ifs ) ), std::istreambuf_iterator< char >() );
  auto bytes = custodia::memory::as_bytes( contents );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

bool write_file( const std::filesystem::path& path, std::span< const std::byte > bytes )
{
  std::ofstream ofs( path, std::ios::binary | std::ios::trunc );
  if( !ofs )
    return false;

  auto sv = custodia::memory::as_string_view( bytes );
  ofs.write( sv.data(), static_cast< std::streamsize >( sv.size() ) );
  return static_cast< bool >( ofs );
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  custodia::log::initialize();

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()             , "Print this help message and exit" )
      ( constants::version_option.data()          , "Print version string and exit" )
      ( constants::basedir_option.data()          , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Directory searched for config.yml" )
      ( constants::log_level_option.data()        , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::new_option.data()              , "Create a new account" )
      ( constants::private_key_option.data()      , boost::program_options::value< std::string >(), "Create the account from a private key (decimal or 0x prefixed hex)" )
      ( constants::remote_key_option.data()       , boost::program_options::value< std::string >(), "Remote harvesting private key used with --private-key" )
      ( constants::input_option.data()            , boost::program_options::value< std::string >(), "Load a serialized account" )
      ( constants::output_option.data()           , boost::program_options::value< std::string >(), "Write the serialized account to a file" )
      ( constants::format_option.data()           , boost::program_options::value< std::string >(), "Serialization format, 'xml' or 'binary'" )
      ( custodia::util::endpoint_option            , boost::program_options::value< std::string >(), "Remote harvesting endpoint, <protocol>://<host>:<port>" )
      ( custodia::util::clear_endpoint_option      , "Remove the remote harvesting endpoint" )
      ( constants::ensure_remote_key_option.data(), "Generate a remote harvesting key if the account has none" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( option_name( constants::help_option ) ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( option_name( constants::version_option ) ) )
    {
      std::println( "v0.1.0" );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ option_name( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node wallet_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ "global" ];
      wallet_config = config[ constants::config_section ];
    }

    // clang-format off
    auto log_level         = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, wallet_config, global_config );
    auto format            = get_option< std::string >( constants::format_option, constants::format_default, args, wallet_config, global_config );
    auto ensure_remote_key = get_option< bool >( constants::ensure_remote_key_option, constants::ensure_remote_key_default, args, wallet_config, global_config );
    // clang-format on

    if( !custodia::log::set_level( log_level ) )
    {
      LOG_ERROR( custodia::log::instance(), "Unknown log level: {}", log_level );
      return EXIT_FAILURE;
    }

    if( config.IsNull() )
      LOG_DEBUG( custodia::log::instance(), "No config found in {}, using defaults", basedir.string() );

    if( format != constants::xml_format && format != constants::binary_format )
    {
      LOG_ERROR( custodia::log::instance(), "Unknown format '{}', expected 'xml' or 'binary'", format );
      return EXIT_FAILURE;
    }

    const bool create_new = args.count( option_name( constants::new_option ) );
    const bool from_key   = args.count( option_name( constants::private_key_option ) );
    const bool from_input = args.count( option_name( constants::input_option ) );

    if( create_new + from_key + from_input != 1 )
    {
      LOG_ERROR( custodia::log::instance(), "Exactly one of --new, --private-key or --input is required" );
      return EXIT_FAILURE;
    }

    if( args.count( option_name( constants::remote_key_option ) ) && !from_key )
    {
      LOG_ERROR( custodia::log::instance(), "--remote-key requires --private-key" );
      return EXIT_FAILURE;
    }

    auto endpoint_change = custodia::util::resolve_endpoint_update( args, wallet_config, global_config );
    if( !endpoint_change )
    {
      if( endpoint_change.error() == custodia::util::util_errc::conflicting_options )
        LOG_ERROR( custodia::log::instance(), "--endpoint and --clear-endpoint are mutually exclusive" );
      else
        LOG_ERROR( custodia::log::instance(), "Invalid endpoint: {}", endpoint_change.error().message() );

      return EXIT_FAILURE;
    }

    std::optional< custodia::wallet::account > acct;

    if( create_new )
    {
      acct = custodia::wallet::account::create();
      LOG_INFO( custodia::log::instance(), "Created account {}", acct->to_string() );
    }
    else if( from_key )
    {
      std::optional< custodia::crypto::raw_key > remote_raw;

      try
      {
        custodia::crypto::raw_key primary_raw( args[ option_name( constants::private_key_option ) ].as< std::string >() );

        if( args.count( option_name( constants::remote_key_option ) ) )
          remote_raw = custodia::crypto::raw_key( args[ option_name( constants::remote_key_option ) ].as< std::string >() );

        auto imported = custodia::wallet::account::create( custodia::crypto::secret_key( primary_raw ), remote_raw );
        if( !imported )
        {
          LOG_ERROR( custodia::log::instance(), "Could not create account: {}", imported.error().message() );
          return EXIT_FAILURE;
        }

        acct = std::move( *imported );
      }
      catch( const std::runtime_error& e )
      {
        LOG_ERROR( custodia::log::instance(), "Invalid private key: {}", e.what() );
        return EXIT_FAILURE;
      }

      LOG_INFO( custodia::log::instance(), "Imported account {}", acct->to_string() );
    }
    else
    {
      const std::filesystem::path input( args[ option_name( constants::input_option ) ].as< std::string >() );

      auto bytes = read_file( input );
      if( !bytes )
      {
        LOG_ERROR( custodia::log::instance(), "Could not read {}", input.string() );
        return EXIT_FAILURE;
      }

      auto loaded = format == constants::binary_format
                      ? custodia::serialization::from_binary< custodia::wallet::account >( *bytes )
                      : custodia::serialization::from_xml< custodia::wallet::account >(
                          custodia::memory::as_string_view( *bytes ) );
      if( !loaded )
      {
        LOG_ERROR( custodia::log::instance(), "Could not load {}: {}", input.string(), loaded.error().message() );
        return EXIT_FAILURE;
      }

      acct = std::move( *loaded );
      LOG_INFO( custodia::log::instance(), "Loaded account {}", acct->to_string() );
    }

    if( *endpoint_change )
    {
      const auto& ep = **endpoint_change;
      acct->set_remote_endpoint( ep );

      if( ep )
        LOG_INFO( custodia::log::instance(), "Remote harvesting endpoint set to {}", ep->to_string() );
      else
        LOG_INFO( custodia::log::instance(), "Remote harvesting endpoint cleared" );
    }

    if( ensure_remote_key )
      acct->ensure_remote_key();

    std::println( "{}", acct->to_string() );

    if( args.count( option_name( constants::output_option ) ) )
    {
      const std::filesystem::path output( args[ option_name( constants::output_option ) ].as< std::string >() );

      bool written = false;
      if( format == constants::binary_format )
        written = write_file( output, custodia::serialization::to_binary( *acct ) );
      else
        written = write_file( output, custodia::memory::as_bytes( custodia::serialization::to_xml( *acct ) ) );

      if( !written )
      {
        LOG_ERROR( custodia::log::instance(), "Could not write {}", output.string() );
        return EXIT_FAILURE;
      }

      LOG_INFO( custodia::log::instance(), "Wrote account to {}", output.string() );
    }
    else if( format == constants::binary_format )
    {
      std::println( "{}", custodia::encode::to_hex( custodia::serialization::to_binary( *acct ) ) );
    }
    else
    {
      std::print( "{}", custodia::serialization::to_xml( *acct ) );
    }
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( custodia::log::instance(), "Invalid command line: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( custodia::log::instance(), "Invalid config: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( custodia::log::instance(), "Unexpected error: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

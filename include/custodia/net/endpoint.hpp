#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <custodia/net/error.hpp>
#include <custodia/serialization/field.hpp>

namespace custodia::net {

constexpr std::uint16_t default_port = 7'890;

// Network location of a remote node, e.g. "http://127.0.0.1:7890"
struct endpoint
{
  std::string protocol;
  std::string host;
  std::uint16_t port = default_port;

  static result< endpoint > from_string( std::string_view sv );

  std::string to_string() const;

  bool operator==( const endpoint& rhs ) const = default;

  template< class Archive >
  void save( Archive& ar ) const
  {
    serialization::write_field( ar, "protocol", protocol );
    serialization::write_field( ar, "host", host );
    serialization::write_field( ar, "port", port );
  }

  template< class Archive >
  static serialization::result< endpoint > load( Archive& ar )
  {
    auto proto = serialization::read_field< std::string >( ar, "protocol" );
    if( !proto )
      return std::unexpected( proto.error() );

    auto hostname = serialization::read_field< std::string >( ar, "host" );
    if( !hostname )
      return std::unexpected( hostname.error() );

    auto port_number = serialization::read_field< std::uint16_t >( ar, "port" );
    if( !port_number )
      return std::unexpected( port_number.error() );

    return endpoint{ std::move( *proto ), std::move( *hostname ), *port_number };
  }
};

std::ostream& operator<<( std::ostream& os, const endpoint& ep );

} // namespace custodia::net

#include <custodia/net/endpoint.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace custodia::net {

constexpr std::string_view scheme_separator = "://";

static bool valid_protocol( std::string_view protocol ) noexcept
{
  if( protocol.empty() || !std::isalpha( static_cast< unsigned char >( protocol.front() ) ) )
    return false;

  return std::ranges::all_of( protocol,
                              []( char c )
                              {
                                return std::isalnum( static_cast< unsigned char >( c ) ) || c == '+' || c == '-'
                                       || c == '.';
                              } );
}

result< endpoint > endpoint::from_string( std::string_view sv )
{
  const auto scheme_pos = sv.find( scheme_separator );
  if( scheme_pos == std::string_view::npos )
    return std::unexpected( net_errc::invalid_endpoint );

  const auto protocol = sv.substr( 0, scheme_pos );
  if( !valid_protocol( protocol ) )
    return std::unexpected( net_errc::invalid_protocol );

  const auto authority = sv.substr( scheme_pos + scheme_separator.size() );
  const auto colon_pos = authority.rfind( ':' );
  if( colon_pos == std::string_view::npos || colon_pos == 0 )
    return std::unexpected( net_errc::invalid_endpoint );

  // Bracketed IPv6 hosts carry their own colons
  if( authority.front() == '[' && authority.find( ']' ) != colon_pos - 1 )
    return std::unexpected( net_errc::invalid_endpoint );

  const auto host     = authority.substr( 0, colon_pos );
  const auto port_str = authority.substr( colon_pos + 1 );

  std::uint16_t port = 0;
  auto [ ptr, ec ]   = std::from_chars( port_str.data(), port_str.data() + port_str.size(), port );
  if( ec != std::errc() || ptr != port_str.data() + port_str.size() || port == 0 )
    return std::unexpected( net_errc::invalid_port );

  return endpoint{ std::string( protocol ), std::string( host ), port };
}

std::string endpoint::to_string() const
{
  return protocol + std::string( scheme_separator ) + host + ":" + std::to_string( port );
}

std::ostream& operator<<( std::ostream& os, const endpoint& ep )
{
  return os << ep.to_string();
}

} // namespace custodia::net

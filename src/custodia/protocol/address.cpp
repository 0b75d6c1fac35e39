#include <custodia/protocol/address.hpp>

#include <algorithm>

#include <custodia/crypto/hash.hpp>
#include <custodia/encode/base58.hpp>

namespace custodia::protocol {

constexpr std::size_t checksum_offset = 1 + address_hash_length;

static crypto::digest checksum( std::span< const std::byte > payload ) noexcept
{
  return crypto::hash( payload );
}

address::address( const address_data& bytes ) noexcept:
    _bytes( bytes )
{}

address address::from_public_key( const crypto::public_key& pub_key ) noexcept
{
  address_data bytes{ address_version };

  auto digest = crypto::hash( pub_key.bytes() );
  std::ranges::copy_n( digest.begin(), address_hash_length, bytes.begin() + 1 );

  auto check = checksum( std::span( bytes ).first( checksum_offset ) );
  std::ranges::copy_n( check.begin(), address_checksum_length, bytes.begin() + checksum_offset );

  return address( bytes );
}

result< address > address::from_string( std::string_view sv ) noexcept
{
  auto decoded = encode::from_base58( sv );
  if( !decoded )
    return std::unexpected( protocol_errc::invalid_encoding );

  if( decoded->size() != address_length )
    return std::unexpected( protocol_errc::invalid_length );

  address_data bytes;
  std::ranges::copy( *decoded, bytes.begin() );

  if( bytes.front() != address_version )
    return std::unexpected( protocol_errc::invalid_version );

  auto check = checksum( std::span( bytes ).first( checksum_offset ) );
  if( !std::ranges::equal( std::span( check ).first( address_checksum_length ),
                           std::span( bytes ).subspan( checksum_offset ) ) )
    return std::unexpected( protocol_errc::invalid_checksum );

  return address( bytes );
}

std::string address::to_string() const noexcept
{
  return encode::to_base58( _bytes );
}

address_span address::bytes() const noexcept
{
  return _bytes;
}

bool address::operator==( const address& rhs ) const noexcept
{
  return _bytes == rhs._bytes;
}

bool address::operator!=( const address& rhs ) const noexcept
{
  return !( *this == rhs );
}

std::ostream& operator<<( std::ostream& os, const address& addr )
{
  return os << addr.to_string();
}

} // namespace custodia::protocol

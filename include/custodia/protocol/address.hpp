#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <custodia/crypto/public_key.hpp>
#include <custodia/protocol/error.hpp>

namespace custodia::protocol {

constexpr std::size_t address_hash_length     = 20;
constexpr std::size_t address_checksum_length = 4;
constexpr std::size_t address_length          = 1 + address_hash_length + address_checksum_length;

constexpr std::byte address_version{ 0x68 };

using address_data = std::array< std::byte, address_length >;
using address_span = std::span< const std::byte, address_length >;

/**
 * Public identifier of an account.
 *
 * Layout: version byte, the first 20 bytes of the BLAKE3 digest of the public key,
 * then the first 4 bytes of the BLAKE3 digest of the preceding 21 bytes. The text
 * form is the base58 encoding of all 25 bytes.
 */
class address
{
public:
  address() = delete;

  static address from_public_key( const crypto::public_key& pub_key ) noexcept;
  static result< address > from_string( std::string_view sv ) noexcept;

  std::string to_string() const noexcept;
  address_span bytes() const noexcept;

  bool operator==( const address& rhs ) const noexcept;
  bool operator!=( const address& rhs ) const noexcept;

private:
  explicit address( const address_data& bytes ) noexcept;

  address_data _bytes;
};

std::ostream& operator<<( std::ostream& os, const address& addr );

} // namespace custodia::protocol

template<>
struct std::hash< custodia::protocol::address >
{
  std::size_t operator()( const custodia::protocol::address& addr ) const noexcept
  {
    std::size_t seed = 0;
    for( const auto& value: addr.bytes() )
      seed ^= std::hash< std::byte >()( value ) + 0x9e3779b9 + ( seed << 6 ) + ( seed >> 2 );
    return seed;
  }
};

// NOLINTBEGIN

#include <gtest/gtest.h>

#include <sstream>
#include <unordered_set>

#include <custodia/crypto.hpp>
#include <custodia/encode.hpp>
#include <custodia/protocol/address.hpp>

using namespace std::string_view_literals;

// RFC 8032, section 7.1, test 1 key pair
const custodia::crypto::raw_key known_raw( "0x607fae1c03ac3b701969327b69c54944c42cec92f44a84ba605afdef9db1619d" );
constexpr auto known_address = "j21o6hM62wBY5y5AYEVQzmi1MgDL4yZUX7"sv;
constexpr auto known_bytes   = "0x686c31041268f471609c79f5f2dbcc38e4a4ab2f4dd4fa96be"sv;

TEST( address, from_public_key )
{
  custodia::crypto::secret_key skey( known_raw );
  auto addr = custodia::protocol::address::from_public_key( skey.public_key() );

  EXPECT_EQ( addr.to_string(), known_address );
  EXPECT_EQ( custodia::encode::to_hex( addr.bytes() ), known_bytes );
  EXPECT_EQ( addr.bytes().front(), custodia::protocol::address_version );

  EXPECT_EQ( addr, custodia::protocol::address::from_public_key( skey.public_key() ) );

  auto other = custodia::protocol::address::from_public_key(
    custodia::crypto::secret_key::create( custodia::crypto::hash( "bob" ) ).public_key() );
  EXPECT_NE( addr, other );

  std::stringstream ss;
  ss << addr;
  EXPECT_EQ( ss.str(), known_address );
}

TEST( address, from_string )
{
  auto addr = custodia::protocol::address::from_string( known_address );
  ASSERT_TRUE( addr );
  EXPECT_EQ( addr->to_string(), known_address );
  EXPECT_EQ( *addr,
             custodia::protocol::address::from_public_key( custodia::crypto::secret_key( known_raw ).public_key() ) );

  auto fresh = custodia::protocol::address::from_public_key( custodia::crypto::secret_key::create().public_key() );
  auto parsed = custodia::protocol::address::from_string( fresh.to_string() );
  ASSERT_TRUE( parsed );
  EXPECT_EQ( *parsed, fresh );
}

TEST( address, from_string_errors )
{
  auto addr = custodia::protocol::address::from_string( "j21o6hM62wBY5y5AYEVQzmi1MgDL4yZUX0"sv );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), custodia::protocol::protocol_errc::invalid_encoding );

  addr = custodia::protocol::address::from_string( known_address.substr( 0, known_address.size() - 4 ) );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), custodia::protocol::protocol_errc::invalid_length );

  auto bytes = *custodia::encode::from_hex( known_bytes );
  bytes.back() ^= std::byte{ 0x01 };
  addr = custodia::protocol::address::from_string( custodia::encode::to_base58( bytes ) );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), custodia::protocol::protocol_errc::invalid_checksum );

  // Valid checksum over a foreign version byte
  bytes          = *custodia::encode::from_hex( known_bytes );
  bytes.front()  = std::byte{ 0x98 };
  auto check     = custodia::crypto::hash( std::span( bytes ).first( 1 + custodia::protocol::address_hash_length ) );
  std::ranges::copy_n( check.begin(),
                       custodia::protocol::address_checksum_length,
                       bytes.begin() + 1 + custodia::protocol::address_hash_length );
  addr = custodia::protocol::address::from_string( custodia::encode::to_base58( bytes ) );
  ASSERT_FALSE( addr );
  EXPECT_EQ( addr.error(), custodia::protocol::protocol_errc::invalid_version );
  EXPECT_EQ( addr.error().message(), "unknown address version" );
}

TEST( address, hash )
{
  auto addr1 = custodia::protocol::address::from_public_key( custodia::crypto::secret_key( known_raw ).public_key() );
  auto addr2 = *custodia::protocol::address::from_string( known_address );
  auto addr3 = custodia::protocol::address::from_public_key(
    custodia::crypto::secret_key::create( custodia::crypto::hash( "carol" ) ).public_key() );

  std::hash< custodia::protocol::address > hasher;
  EXPECT_EQ( hasher( addr1 ), hasher( addr2 ) );

  std::unordered_set< custodia::protocol::address > addresses{ addr1, addr2, addr3 };
  EXPECT_EQ( addresses.size(), 2 );
}

// NOLINTEND

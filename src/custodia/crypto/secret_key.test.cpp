// NOLINTBEGIN

#include <gtest/gtest.h>

#include <custodia/crypto/hash.hpp>
#include <custodia/crypto/secret_key.hpp>
#include <custodia/encode.hpp>

using custodia::crypto::raw_key;
using custodia::crypto::secret_key;

// RFC 8032, section 7.1, test 1. The raw value is the little endian reading of the seed.
const raw_key rfc8032_raw( "0x607fae1c03ac3b701969327b69c54944c42cec92f44a84ba605afdef9db1619d" );
constexpr auto rfc8032_public_key = "0xd75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

TEST( secret_key, known_public_key )
{
  secret_key skey( rfc8032_raw );

  EXPECT_EQ( custodia::encode::to_hex( skey.public_key().bytes() ), rfc8032_public_key );
  EXPECT_EQ( skey.raw(), rfc8032_raw );
}

TEST( secret_key, comparison )
{
  auto skey1 = secret_key::create( custodia::crypto::hash( "alice" ) );
  auto skey2 = secret_key::create( custodia::crypto::hash( "bob" ) );

  EXPECT_NE( skey1, skey2 );
  EXPECT_EQ( skey1, skey1 );
  EXPECT_EQ( skey1, secret_key( skey1.raw() ) );
  EXPECT_NE( skey1.raw(), skey2.raw() );
}

TEST( secret_key, determinism )
{
  auto skey1 = secret_key::create( custodia::crypto::hash( "alice" ) );
  auto skey2 = secret_key::create( custodia::crypto::hash( "alice" ) );
  auto skey3 = secret_key::create( custodia::crypto::hash( "bob" ) );

  EXPECT_EQ( skey1, skey2 );
  EXPECT_NE( skey1, skey3 );

  EXPECT_EQ( skey1.public_key(), skey2.public_key() );
  EXPECT_NE( skey1.public_key(), skey3.public_key() );

  EXPECT_EQ( secret_key( skey1.raw() ).public_key(), skey1.public_key() );
}

TEST( secret_key, nondeterminism )
{
  auto skey1 = secret_key::create();
  auto skey2 = secret_key::create();

  EXPECT_NE( skey1, skey2 );
  EXPECT_NE( skey1.public_key(), skey2.public_key() );
}

TEST( secret_key, out_of_range_raw_values )
{
  const raw_key modulus = raw_key( 1 ) << 256;

  secret_key small( raw_key( 42 ) );
  secret_key wrapped( raw_key( 42 ) + modulus );
  secret_key negative( raw_key( -1 ) );
  secret_key all_ones( modulus - 1 );

  EXPECT_NE( small, wrapped );
  EXPECT_EQ( small.public_key(), wrapped.public_key() );

  EXPECT_NE( negative, all_ones );
  EXPECT_EQ( negative.public_key(), all_ones.public_key() );
  EXPECT_EQ( negative.raw(), raw_key( -1 ) );

  secret_key zero( raw_key( 0 ) );
  EXPECT_NE( zero.public_key(), small.public_key() );
}

// NOLINTEND

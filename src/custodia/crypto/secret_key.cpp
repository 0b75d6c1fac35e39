#include <custodia/crypto/secret_key.hpp>
#include <custodia/memory/memory.hpp>

#include <cassert>
#include <utility>

#include <sodium.h>

namespace custodia::crypto {

static void initialize_crypto()
{
  [[maybe_unused]]
  static int retcode = sodium_init();
  assert( retcode >= 0 );
}

static seed_data to_seed( const raw_key& raw )
{
  static const raw_key modulus = raw_key( 1 ) << ( seed_length * 8 );

  raw_key residue = raw % modulus;
  if( residue < 0 )
    residue += modulus;

  seed_data seed{};
  boost::multiprecision::export_bits( residue, memory::pointer_cast< unsigned char* >( seed.data() ), 8, false );
  return seed;
}

static raw_key from_seed( const seed_data& seed )
{
  raw_key raw;
  const auto* begin = memory::pointer_cast< const unsigned char* >( seed.data() );
  boost::multiprecision::import_bits( raw, begin, begin + seed.size(), 8, false );
  return raw;
}

secret_key::secret_key( raw_key raw ):
    _raw( std::move( raw ) )
{
  initialize_crypto();

  auto seed = to_seed( _raw );
  std::array< unsigned char, crypto_sign_SECRETKEYBYTES > expanded{};

  [[maybe_unused]]
  int retcode = crypto_sign_seed_keypair( memory::pointer_cast< unsigned char* >( _public_bytes.data() ),
                                          expanded.data(),
                                          memory::pointer_cast< const unsigned char* >( seed.data() ) );
  assert( retcode >= 0 );

  sodium_memzero( expanded.data(), expanded.size() );
  sodium_memzero( seed.data(), seed.size() );
}

bool secret_key::operator==( const secret_key& rhs ) const noexcept
{
  return _raw == rhs._raw;
}

bool secret_key::operator!=( const secret_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

secret_key secret_key::create()
{
  initialize_crypto();

  seed_data seed;
  randombytes_buf( seed.data(), seed.size() );

  secret_key new_key( from_seed( seed ) );
  sodium_memzero( seed.data(), seed.size() );
  return new_key;
}

secret_key secret_key::create( const digest& seed )
{
  static_assert( digest_length == seed_length );
  return secret_key( from_seed( seed ) );
}

const raw_key& secret_key::raw() const noexcept
{
  return _raw;
}

public_key secret_key::public_key() const noexcept
{
  return crypto::public_key( _public_bytes );
}

} // namespace custodia::crypto

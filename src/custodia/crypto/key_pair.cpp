#include <custodia/crypto/key_pair.hpp>

#include <utility>

namespace custodia::crypto {

key_pair::key_pair( crypto::secret_key sk, crypto::public_key pk ) noexcept:
    _secret_key( std::move( sk ) ),
    _public_key( std::move( pk ) )
{}

key_pair key_pair::generate()
{
  return from_secret_key( crypto::secret_key::create() );
}

key_pair key_pair::from_secret_key( const crypto::secret_key& sk )
{
  return key_pair( sk, sk.public_key() );
}

const secret_key& key_pair::secret_key() const noexcept
{
  return _secret_key;
}

const public_key& key_pair::public_key() const noexcept
{
  return _public_key;
}

bool key_pair::operator==( const key_pair& rhs ) const noexcept
{
  return _secret_key == rhs._secret_key && _public_key == rhs._public_key;
}

bool key_pair::operator!=( const key_pair& rhs ) const noexcept
{
  return !( *this == rhs );
}

} // namespace custodia::crypto

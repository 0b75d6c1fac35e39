#pragma once

#include <custodia/crypto/public_key.hpp>
#include <custodia/crypto/secret_key.hpp>

namespace custodia::crypto {

class key_pair
{
public:
  key_pair() = delete;

  static key_pair generate();
  static key_pair from_secret_key( const crypto::secret_key& sk );

  const crypto::secret_key& secret_key() const noexcept;
  const crypto::public_key& public_key() const noexcept;

  bool operator==( const key_pair& rhs ) const noexcept;
  bool operator!=( const key_pair& rhs ) const noexcept;

private:
  key_pair( crypto::secret_key sk, crypto::public_key pk ) noexcept;

  crypto::secret_key _secret_key;
  crypto::public_key _public_key;
};

} // namespace custodia::crypto

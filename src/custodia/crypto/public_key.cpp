#include <custodia/crypto/public_key.hpp>

#include <algorithm>

namespace custodia::crypto {

public_key::public_key( const public_key_data& bytes ) noexcept:
    _bytes( bytes )
{}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return std::ranges::equal( _bytes, rhs._bytes );
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

public_key_span public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace custodia::crypto

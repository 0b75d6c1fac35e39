#pragma once

#include <array>

#include <boost/multiprecision/cpp_int.hpp>

#include <custodia/crypto/hash.hpp>
#include <custodia/crypto/public_key.hpp>

namespace custodia::crypto {

constexpr std::size_t seed_length = 32;

using seed_data = std::array< std::byte, seed_length >;

// The raw secret scalar as stored and serialized
using raw_key = boost::multiprecision::cpp_int;

/**
 * An Ed25519 secret key identified by its raw integer value.
 *
 * Any integer is accepted. The signing seed is the little endian encoding of the
 * value reduced modulo 2^256, so keys whose raw values differ by a multiple of
 * 2^256 share a public key while still comparing unequal.
 */
class secret_key
{
public:
  secret_key() = delete;
  explicit secret_key( raw_key raw );
  secret_key( const secret_key& sk )     = default;
  secret_key( secret_key&& sk ) noexcept = default;
  ~secret_key() noexcept                 = default;

  secret_key& operator=( const secret_key& sk )     = default;
  secret_key& operator=( secret_key&& sk ) noexcept = default;

  bool operator==( const secret_key& rhs ) const noexcept;
  bool operator!=( const secret_key& rhs ) const noexcept;

  static secret_key create();
  static secret_key create( const digest& seed );

  const raw_key& raw() const noexcept;
  crypto::public_key public_key() const noexcept;

private:
  raw_key _raw;
  public_key_data _public_bytes{};
};

} // namespace custodia::crypto

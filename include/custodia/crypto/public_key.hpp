#pragma once

#include <array>
#include <span>

namespace custodia::crypto {

constexpr std::size_t public_key_length = 32;

using public_key_data = std::array< std::byte, public_key_length >;
using public_key_span = std::span< const std::byte, public_key_length >;

class public_key
{
public:
  public_key() = delete;
  explicit public_key( const public_key_data& bytes ) noexcept;
  public_key( const public_key& pk ) noexcept = default;
  public_key( public_key&& pk ) noexcept      = default;
  ~public_key() noexcept                      = default;

  public_key& operator=( const public_key& pk ) noexcept = default;
  public_key& operator=( public_key&& pk ) noexcept      = default;

  bool operator==( const public_key& rhs ) const noexcept;
  bool operator!=( const public_key& rhs ) const noexcept;

  public_key_span bytes() const noexcept;

private:
  public_key_data _bytes;
};

} // namespace custodia::crypto

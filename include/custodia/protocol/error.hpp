#pragma once

#include <expected>
#include <system_error>

namespace custodia::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_encoding,
  invalid_length,
  invalid_version,
  invalid_checksum
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::protocol

template<>
struct std::is_error_code_enum< custodia::protocol::protocol_errc >: public std::true_type
{};

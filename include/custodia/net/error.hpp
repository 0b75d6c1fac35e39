#pragma once

#include <expected>
#include <system_error>

namespace custodia::net {

enum class net_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_endpoint,
  invalid_protocol,
  invalid_port
};

const std::error_category& net_category() noexcept;

std::error_code make_error_code( net_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::net

template<>
struct std::is_error_code_enum< custodia::net::net_errc >: public std::true_type
{};

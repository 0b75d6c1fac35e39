#pragma once

#include <expected>
#include <system_error>

namespace custodia::util {

enum class util_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  conflicting_options
};

const std::error_category& util_category() noexcept;

std::error_code make_error_code( util_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::util

template<>
struct std::is_error_code_enum< custodia::util::util_errc >: public std::true_type
{};

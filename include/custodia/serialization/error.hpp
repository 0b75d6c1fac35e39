#pragma once

#include <expected>
#include <system_error>

namespace custodia::serialization {

enum class serialization_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed
};

const std::error_category& serialization_category() noexcept;

std::error_code make_error_code( serialization_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::serialization

template<>
struct std::is_error_code_enum< custodia::serialization::serialization_errc >: public std::true_type
{};

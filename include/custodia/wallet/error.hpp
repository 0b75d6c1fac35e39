#pragma once

#include <expected>
#include <system_error>

namespace custodia::wallet {

enum class wallet_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_argument
};

const std::error_category& wallet_category() noexcept;

std::error_code make_error_code( wallet_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::wallet

template<>
struct std::is_error_code_enum< custodia::wallet::wallet_errc >: public std::true_type
{};

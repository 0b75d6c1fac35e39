#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <custodia/encode/error.hpp>

namespace custodia::encode {

std::string to_base58( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept;

} // namespace custodia::encode

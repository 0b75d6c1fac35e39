#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <custodia/encode/error.hpp>

namespace custodia::encode {

// Lower case, "0x" prefixed
std::string to_hex( std::span< const std::byte > s ) noexcept;

// Accepts input with or without the "0x" prefix
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace custodia::encode

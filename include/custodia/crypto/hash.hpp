#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace custodia::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

void hasher_reset() noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len = 0 ) noexcept;
void hasher_update( std::span< const std::byte > s ) noexcept;

digest hash( const void* ptr, std::size_t len = 0 ) noexcept;
digest hash( std::span< const std::byte > s ) noexcept;
digest hash( const char* s ) noexcept;
digest hash( const std::string& s ) noexcept;
digest hash( std::string_view sv ) noexcept;

} // namespace custodia::crypto

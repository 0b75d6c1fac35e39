#include <custodia/encode/base58.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace custodia::encode {

namespace {

constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::uint32_t radix = 58;

// Maps an ASCII character to its base58 digit, -1 when it is not part of the alphabet
constexpr std::array< std::int8_t, 128 > make_reverse_alphabet() noexcept
{
  std::array< std::int8_t, 128 > table{};
  table.fill( -1 );
  for( std::size_t i = 0; i < alphabet.size(); ++i )
    table.at( static_cast< std::size_t >( alphabet[ i ] ) ) = static_cast< std::int8_t >( i );
  return table;
}

constexpr auto reverse_alphabet = make_reverse_alphabet();

} // namespace

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  auto zeroes =
    static_cast< std::size_t >( std::ranges::find_if( s, []( std::byte b ) { return b != std::byte{ 0x00 }; } )
                                - s.begin() );

  // log(256) / log(58), rounded up
  std::vector< std::uint8_t > digits( ( s.size() - zeroes ) * 138 / 100 + 1 );
  std::size_t length = 0;

  for( auto b: s.subspan( zeroes ) )
  {
    auto carry    = static_cast< std::uint32_t >( std::to_integer< std::uint8_t >( b ) );
    std::size_t i = 0;
    for( auto it = digits.rbegin(); ( carry != 0 || i < length ) && it != digits.rend(); ++it, ++i )
    {
      carry += 256 * static_cast< std::uint32_t >( *it );
      *it    = static_cast< std::uint8_t >( carry % radix );
      carry /= radix;
    }
    length = i;
  }

  auto it = digits.begin() + static_cast< std::ptrdiff_t >( digits.size() - length );
  while( it != digits.end() && *it == 0 )
    ++it;

  std::string str( zeroes, alphabet.front() );
  str.reserve( zeroes + static_cast< std::size_t >( digits.end() - it ) );
  for( ; it != digits.end(); ++it )
    str.push_back( alphabet[ *it ] );

  return str;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  std::size_t zeroes = 0;
  while( zeroes < sv.size() && sv[ zeroes ] == alphabet.front() )
    ++zeroes;

  // log(58) / log(256), rounded up
  std::vector< std::uint8_t > bytes( ( sv.size() - zeroes ) * 733 / 1'000 + 1 );
  std::size_t length = 0;

  for( auto c: sv.substr( zeroes ) )
  {
    auto index = static_cast< std::uint8_t >( c );
    if( index >= reverse_alphabet.size() || reverse_alphabet.at( index ) < 0 )
      return std::unexpected( encode_errc::invalid_character );

    auto carry    = static_cast< std::uint32_t >( reverse_alphabet.at( index ) );
    std::size_t i = 0;
    for( auto it = bytes.rbegin(); ( carry != 0 || i < length ) && it != bytes.rend(); ++it, ++i )
    {
      carry += radix * static_cast< std::uint32_t >( *it );
      *it    = static_cast< std::uint8_t >( carry % 256 );
      carry /= 256;
    }
    length = i;
  }

  auto it = bytes.begin() + static_cast< std::ptrdiff_t >( bytes.size() - length );
  while( it != bytes.end() && *it == 0 )
    ++it;

  std::vector< std::byte > decoded( zeroes, std::byte{ 0x00 } );
  decoded.reserve( zeroes + static_cast< std::size_t >( bytes.end() - it ) );
  for( ; it != bytes.end(); ++it )
    decoded.push_back( static_cast< std::byte >( *it ) );

  return decoded;
}

} // namespace custodia::encode

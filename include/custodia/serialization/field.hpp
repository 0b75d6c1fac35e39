#pragma once

#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <utility>

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/string.hpp>

#include <custodia/serialization/error.hpp>

namespace custodia::serialization {

// Name under which the payload of a present optional scalar is written
constexpr auto optional_value_field = "value";

template< typename T, class Archive >
concept Decoder = requires( T t, Archive& ar ) {
  { std::invoke( t, ar ) };
};

template< class Archive, typename T >
void write_field( Archive& ar, const char* name, const T& value )
{
  ar << boost::serialization::make_nvp( name, value );
}

template< typename T, class Archive >
result< T > read_field( Archive& ar, const char* name )
{
  T value{};

  try
  {
    ar >> boost::serialization::make_nvp( name, value );
  }
  // Corrupt length prefixes surface as allocation failures rather than archive errors
  catch( const std::exception& )
  {
    return std::unexpected( serialization_errc::malformed );
  }

  return value;
}

// Presence flags are stored as 0 or 1
template< class Archive >
void write_flag( Archive& ar, const char* name, bool present )
{
  write_field( ar, name, static_cast< std::uint8_t >( present ? 1 : 0 ) );
}

template< class Archive >
result< bool > read_flag( Archive& ar, const char* name )
{
  auto flag = read_field< std::uint8_t >( ar, name );
  if( !flag )
    return std::unexpected( flag.error() );

  if( *flag > 1 )
    return std::unexpected( serialization_errc::malformed );

  return *flag == 1;
}

/**
 * Optional scalars are written as a presence flag under the field name, followed by
 * the value under "value" when present. An absent value writes only the flag.
 */
template< class Archive, typename T >
void write_optional( Archive& ar, const char* name, const std::optional< T >& value )
{
  const bool present = value.has_value();
  write_flag( ar, name, present );

  if( present )
    write_field( ar, optional_value_field, *value );
}

template< typename T, class Archive >
result< std::optional< T > > read_optional( Archive& ar, const char* name )
{
  auto present = read_flag( ar, name );
  if( !present )
    return std::unexpected( present.error() );

  if( !*present )
    return std::optional< T >();

  auto value = read_field< T >( ar, optional_value_field );
  if( !value )
    return std::unexpected( value.error() );

  return std::optional< T >( std::move( *value ) );
}

/**
 * Nested objects follow the same presence flag convention. The object writes its own
 * fields through `T::save( Archive& ) const`.
 */
template< class Archive, typename T >
void write_optional_object( Archive& ar, const char* name, const std::optional< T >& value )
{
  const bool present = value.has_value();
  write_flag( ar, name, present );

  if( present )
    value->save( ar );
}

/**
 * Reads a nested object through `decode`, which returns `result< T >`.
 *
 * A record that ends before the presence flag reads as absent. A flag other than 0 or 1
 * is malformed. Once the flag says the object is present, any decode failure is
 * returned to the caller.
 */
template< typename T, class Archive, Decoder< Archive > Decode >
result< std::optional< T > > read_optional_object( Archive& ar, const char* name, Decode&& decode )
{
  auto flag = read_field< std::uint8_t >( ar, name );
  if( !flag || *flag == 0 )
    return std::optional< T >();

  if( *flag > 1 )
    return std::unexpected( serialization_errc::malformed );

  result< T > value = std::invoke( std::forward< Decode >( decode ), ar );
  if( !value )
    return std::unexpected( value.error() );

  return std::optional< T >( std::move( *value ) );
}

} // namespace custodia::serialization

#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/xml_iarchive.hpp>
#include <boost/archive/xml_oarchive.hpp>

#include <custodia/memory/memory.hpp>
#include <custodia/serialization/error.hpp>

template< class T, class Archive >
concept Saveable = requires( const T& t, Archive& ar ) {
  { t.save( ar ) } -> std::same_as< void >;
};

template< class T, class Archive >
concept Loadable = requires( Archive& ar ) {
  { T::load( ar ) } -> std::same_as< custodia::serialization::result< T > >;
};

namespace custodia::serialization {

template< typename T >
  requires Saveable< T, boost::archive::binary_oarchive >
std::vector< std::byte > to_binary( const T& value )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, boost::archive::no_tracking );
    value.save( oa );
  }

  auto str   = ss.str();
  auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename T >
  requires Loadable< T, boost::archive::binary_iarchive >
result< T > from_binary( std::span< const std::byte > bytes )
{
  std::stringstream ss{ std::string( memory::as_string_view( bytes ) ) };

  try
  {
    boost::archive::binary_iarchive ia( ss, boost::archive::no_tracking );
    return T::load( ia );
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( serialization_errc::malformed );
  }
}

template< typename T >
  requires Saveable< T, boost::archive::xml_oarchive >
std::string to_xml( const T& value )
{
  std::stringstream ss;
  {
    boost::archive::xml_oarchive oa( ss, boost::archive::no_tracking );
    value.save( oa );
  }

  return ss.str();
}

template< typename T >
  requires Loadable< T, boost::archive::xml_iarchive >
result< T > from_xml( std::string_view sv )
{
  std::stringstream ss{ std::string( sv ) };

  try
  {
    boost::archive::xml_iarchive ia( ss, boost::archive::no_tracking );
    auto value = T::load( ia );

    // The archive destructor parses the closing tag and cannot report a failure.
    // A failed stream makes it skip that parse.
    ss.setstate( std::ios::failbit );
    return value;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( serialization_errc::malformed );
  }
}

} // namespace custodia::serialization

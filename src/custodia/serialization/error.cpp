#include <custodia/serialization/error.hpp>

#include <string>
#include <utility>

namespace custodia::serialization {

struct _serialization_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "serialization";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< serialization_errc >( condition ) )
    {
      case serialization_errc::ok:
        return "ok"s;
      case serialization_errc::malformed:
        return "malformed record"s;
    }
    std::unreachable();
  }
};

const std::error_category& serialization_category() noexcept
{
  static _serialization_category category;
  return category;
}

std::error_code make_error_code( serialization_errc e )
{
  return std::error_code( static_cast< int >( e ), serialization_category() );
}

} // namespace custodia::serialization

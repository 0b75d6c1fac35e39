#include <custodia/util/error.hpp>
#include <string>
#include <utility>

namespace custodia::util {

struct _util_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "util";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< util_errc >( condition ) )
    {
      case util_errc::ok:
        return "ok"s;
      case util_errc::conflicting_options:
        return "conflicting command line options"s;
    }
    std::unreachable();
  }
};

const std::error_category& util_category() noexcept
{
  static _util_category category;
  return category;
}

std::error_code make_error_code( util_errc e )
{
  return std::error_code( static_cast< int >( e ), util_category() );
}

} // namespace custodia::util

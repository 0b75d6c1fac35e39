#include <custodia/net/error.hpp>
#include <string>
#include <utility>

namespace custodia::net {

struct _net_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "net";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< net_errc >( condition ) )
    {
      case net_errc::ok:
        return "ok"s;
      case net_errc::invalid_endpoint:
        return "invalid endpoint, expected <protocol>://<host>:<port>"s;
      case net_errc::invalid_protocol:
        return "invalid endpoint protocol"s;
      case net_errc::invalid_port:
        return "invalid endpoint port"s;
    }
    std::unreachable();
  }
};

const std::error_category& net_category() noexcept
{
  static _net_category category;
  return category;
}

std::error_code make_error_code( net_errc e )
{
  return std::error_code( static_cast< int >( e ), net_category() );
}

} // namespace custodia::net

#include <custodia/protocol/error.hpp>

#include <string>
#include <utility>

namespace custodia::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::invalid_encoding:
        return "address is not valid base58"s;
      case protocol_errc::invalid_length:
        return "invalid address length"s;
      case protocol_errc::invalid_version:
        return "unknown address version"s;
      case protocol_errc::invalid_checksum:
        return "address checksum mismatch"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace custodia::protocol

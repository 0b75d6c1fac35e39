#include <custodia/wallet/error.hpp>
#include <string>
#include <utility>

namespace custodia::wallet {

struct _wallet_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "wallet";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< wallet_errc >( condition ) )
    {
      case wallet_errc::ok:
        return "ok"s;
      case wallet_errc::invalid_argument:
        return "account requires a primary private key"s;
    }
    std::unreachable();
  }
};

const std::error_category& wallet_category() noexcept
{
  static _wallet_category category;
  return category;
}

std::error_code make_error_code( wallet_errc e )
{
  return std::error_code( static_cast< int >( e ), wallet_category() );
}

} // namespace custodia::wallet

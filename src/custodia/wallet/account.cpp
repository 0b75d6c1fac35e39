#include <custodia/wallet/account.hpp>

#include <custodia/log/log.hpp>

namespace custodia::wallet {

namespace detail {

void log_unreadable_remote_key( const std::error_code& ec )
{
  LOG_WARNING( log::instance(), "Ignoring unreadable remote harvesting key: {}", ec.message() );
}

} // namespace detail

account::account( protocol::address addr,
                  crypto::secret_key primary_key,
                  std::optional< crypto::secret_key > remote_key,
                  std::optional< net::endpoint > remote_endpoint ):
    _address( std::move( addr ) ),
    _primary_key( std::move( primary_key ) ),
    _remote_key( std::move( remote_key ) ),
    _remote_endpoint( std::move( remote_endpoint ) )
{}

account account::create()
{
  auto kp = crypto::key_pair::generate();
  return create( kp.secret_key() ).value();
}

result< account > account::create( std::optional< crypto::secret_key > primary_key,
                                   std::optional< crypto::raw_key > remote_key,
                                   std::optional< net::endpoint > remote_endpoint )
{
  if( !primary_key )
    return std::unexpected( wallet_errc::invalid_argument );

  auto kp   = crypto::key_pair::from_secret_key( *primary_key );
  auto addr = protocol::address::from_public_key( kp.public_key() );

  std::optional< crypto::secret_key > remote;
  if( remote_key )
    remote.emplace( std::move( *remote_key ) );

  return account( addr, std::move( *primary_key ), std::move( remote ), std::move( remote_endpoint ) );
}

const protocol::address& account::address() const noexcept
{
  return _address;
}

const crypto::secret_key& account::primary_key() const noexcept
{
  return _primary_key;
}

const std::optional< crypto::secret_key >& account::remote_key() const noexcept
{
  return _remote_key;
}

const std::optional< net::endpoint >& account::remote_endpoint() const noexcept
{
  return _remote_endpoint;
}

const crypto::secret_key& account::ensure_remote_key()
{
  if( !_remote_key )
  {
    auto kp     = crypto::key_pair::generate();
    _remote_key = kp.secret_key();

    LOG_DEBUG( log::instance(),
               "Generated remote harvesting key for account {}, public key {}",
               _address.to_string(),
               log::hex{ kp.public_key().bytes().data(), kp.public_key().bytes().size() } );
  }

  return *_remote_key;
}

void account::set_remote_endpoint( std::optional< net::endpoint > ep )
{
  _remote_endpoint = std::move( ep );
}

std::string account::to_string() const
{
  return _address.to_string();
}

bool account::operator==( const account& rhs ) const noexcept
{
  return _address == rhs._address;
}

bool account::operator!=( const account& rhs ) const noexcept
{
  return !( *this == rhs );
}

std::ostream& operator<<( std::ostream& os, const account& acct )
{
  return os << acct.to_string();
}

} // namespace custodia::wallet

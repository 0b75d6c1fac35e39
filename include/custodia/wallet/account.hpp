#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include <custodia/crypto/key_pair.hpp>
#include <custodia/crypto/secret_key.hpp>
#include <custodia/net/endpoint.hpp>
#include <custodia/protocol/address.hpp>
#include <custodia/serialization/field.hpp>
#include <custodia/wallet/error.hpp>

namespace custodia::wallet {

constexpr auto private_key_field     = "private_key";
constexpr auto remote_key_field      = "remote_harvesting_private_key";
constexpr auto remote_endpoint_field = "remote_harvesting_endpoint";

namespace detail {

void log_unreadable_remote_key( const std::error_code& ec );

} // namespace detail

/**
 * A single wallet account.
 *
 * The address is derived from the primary key once, at construction. An account may
 * also carry a remote harvesting key and the endpoint of the node that harvests with
 * it. Equality and hashing only consider the address.
 */
class account
{
public:
  account() = delete;

  /**
   * Creates an account from a freshly generated key pair.
   */
  static account create();

  /**
   * Creates an account from an existing primary key.
   *
   * Fails with wallet_errc::invalid_argument when the primary key is absent. Raw remote
   * key material is wrapped as is, without validation.
   */
  static result< account > create( std::optional< crypto::secret_key > primary_key,
                                   std::optional< crypto::raw_key > remote_key     = std::nullopt,
                                   std::optional< net::endpoint > remote_endpoint = std::nullopt );

  const protocol::address& address() const noexcept;
  const crypto::secret_key& primary_key() const noexcept;
  const std::optional< crypto::secret_key >& remote_key() const noexcept;
  const std::optional< net::endpoint >& remote_endpoint() const noexcept;

  /**
   * Returns the remote harvesting key, generating and storing a random one first if
   * the account has none. The key never changes once present.
   */
  const crypto::secret_key& ensure_remote_key();

  void set_remote_endpoint( std::optional< net::endpoint > ep );

  std::string to_string() const;

  bool operator==( const account& rhs ) const noexcept;
  bool operator!=( const account& rhs ) const noexcept;

  template< class Archive >
  void save( Archive& ar ) const
  {
    serialization::write_field( ar, private_key_field, _primary_key.raw() );

    std::optional< crypto::raw_key > remote_raw;
    if( _remote_key )
      remote_raw = _remote_key->raw();

    serialization::write_optional( ar, remote_key_field, remote_raw );
    serialization::write_optional_object( ar, remote_endpoint_field, _remote_endpoint );
  }

  template< class Archive >
  static result< account > load( Archive& ar )
  {
    auto primary_raw = serialization::read_field< crypto::raw_key >( ar, private_key_field );
    if( !primary_raw )
      return std::unexpected( primary_raw.error() );

    auto remote_raw = serialization::read_optional< crypto::raw_key >( ar, remote_key_field );
    if( !remote_raw )
    {
      // Nothing past an unreadable field can be located reliably
      detail::log_unreadable_remote_key( remote_raw.error() );
      return create( crypto::secret_key( std::move( *primary_raw ) ) );
    }

    auto acct = create( crypto::secret_key( std::move( *primary_raw ) ), std::move( *remote_raw ) );
    if( !acct )
      return std::unexpected( acct.error() );

    auto remote_ep = serialization::read_optional_object< net::endpoint >( ar,
                                                                          remote_endpoint_field,
                                                                          []( Archive& a )
                                                                          {
                                                                            return net::endpoint::load( a );
                                                                          } );
    if( !remote_ep )
      return std::unexpected( remote_ep.error() );

    acct->set_remote_endpoint( std::move( *remote_ep ) );
    return acct;
  }

private:
  account( protocol::address addr,
           crypto::secret_key primary_key,
           std::optional< crypto::secret_key > remote_key,
           std::optional< net::endpoint > remote_endpoint );

  protocol::address _address;
  crypto::secret_key _primary_key;
  std::optional< crypto::secret_key > _remote_key;
  std::optional< net::endpoint > _remote_endpoint;
};

std::ostream& operator<<( std::ostream& os, const account& acct );

} // namespace custodia::wallet

template<>
struct std::hash< custodia::wallet::account >
{
  std::size_t operator()( const custodia::wallet::account& acct ) const noexcept
  {
    return std::hash< custodia::protocol::address >()( acct.address() );
  }
};

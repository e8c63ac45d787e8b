#include <tokenledger/protocol/account.hpp>

#include <algorithm>
#include <utility>

#include <tokenledger/encode/hex.hpp>

namespace tokenledger::protocol {

constexpr auto user_account_prefix    = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix = std::byte{ std::to_underlying( account_type::program ) };

static account_type account_prefix_to_type( std::byte prefix ) noexcept
{
  switch( std::to_integer< std::uint8_t >( prefix ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    default:
      return account_type::invalid;
  }
}

account_type account::type() const noexcept
{
  return account_prefix_to_type( front() );
}

bool account::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account::program() const noexcept
{
  return front() == program_account_prefix;
}

bool account::null() const noexcept
{
  return std::ranges::all_of( *this, []( std::byte b ) { return b == std::byte{ 0x00 }; } );
}

std::span< const std::byte, address_length > account::address() const noexcept
{
  return std::span< const std::byte, address_length >( data() + 1, address_length );
}

static account make_account( std::byte prefix, const address& addr ) noexcept
{
  account a{};
  a.front() = prefix;
  std::ranges::copy( addr, a.begin() + 1 );
  return a;
}

account user_account( const address& addr ) noexcept
{
  return make_account( user_account_prefix, addr );
}

account program_account( const address& addr ) noexcept
{
  return make_account( program_account_prefix, addr );
}

encode::result< account > account_from_hex( std::string_view sv ) noexcept
{
  auto bytes = encode::from_hex( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != account_length )
    return std::unexpected( encode::encode_errc::invalid_length );

  account a{};
  std::ranges::copy( *bytes, a.begin() );
  return a;
}

} // namespace tokenledger::protocol

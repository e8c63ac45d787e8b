#include <tokenledger/ledger/token_ledger.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <tokenledger/log.hpp>
#include <tokenledger/memory.hpp>

namespace tokenledger::ledger {

namespace space {

constexpr state_db::object_space owner{ 0 };
constexpr state_db::object_space balance{ 1 };
constexpr state_db::object_space token_approval{ 2 };
constexpr state_db::object_space operator_approval{ 3 };
constexpr state_db::object_space supply{ 4 };

} // namespace space

using token_key = std::array< std::byte, sizeof( token_id ) >;

// Big endian so the owner space is ordered by token id
static token_key make_token_key( token_id id )
{
  token_key key{};
  boost::endian::native_to_big_inplace( id );
  std::ranges::copy( memory::as_bytes( id ), key.begin() );
  return key;
}

static std::vector< std::byte > make_operator_key( const account& owner, const account& op )
{
  std::vector< std::byte > key;
  key.reserve( owner.size() + op.size() );
  key.insert( key.end(), owner.begin(), owner.end() );
  key.insert( key.end(), op.begin(), op.end() );
  return key;
}

static std::optional< account > read_account( const state_db::state_delta& state,
                                              const state_db::object_space& space,
                                              std::span< const std::byte > key )
{
  auto object = state.get( state_db::make_compound_key( space, key ) );
  if( !object )
    return {};

  if( object->size() != protocol::account_length )
    throw std::runtime_error( "malformed account object" );

  account a{};
  std::ranges::copy( *object, a.begin() );
  return a;
}

static std::uint64_t read_uint64( const state_db::state_delta& state,
                                  const state_db::object_space& space,
                                  std::span< const std::byte > key )
{
  auto object = state.get( state_db::make_compound_key( space, key ) );
  if( !object )
    return 0;

  if( object->size() != sizeof( std::uint64_t ) )
    throw std::runtime_error( "malformed integer object" );

  auto value = memory::bit_cast< std::uint64_t >( *object );
  boost::endian::little_to_native_inplace( value );
  return value;
}

static bool valid_target( const account& a ) noexcept
{
  return a.type() != protocol::account_type::invalid;
}

/**
 * Exposes a staged operation to queries for the lifetime of the scope.
 */
class receiver_check_scope final
{
public:
  receiver_check_scope( const state_db::state_delta*& slot, const state_db::state_delta& pending ) noexcept:
      _slot( slot )
  {
    _slot = &pending;
  }

  receiver_check_scope( const receiver_check_scope& )            = delete;
  receiver_check_scope( receiver_check_scope&& )                 = delete;
  receiver_check_scope& operator=( const receiver_check_scope& ) = delete;
  receiver_check_scope& operator=( receiver_check_scope&& )      = delete;

  ~receiver_check_scope()
  {
    _slot = nullptr;
  }

private:
  const state_db::state_delta*& _slot;
};

token_ledger::token_ledger( configuration config, std::shared_ptr< receiver_registry > receivers ):
    _config( std::move( config ) ),
    _receivers( receivers ? std::move( receivers ) : std::make_shared< receiver_registry >() ),
    _state( std::make_shared< state_db::state_delta >() )
{}

const state_db::state_delta& token_ledger::view() const
{
  return _pending ? *_pending : *_state;
}

std::optional< account > token_ledger::owner( const state_db::state_delta& state, token_id id ) const
{
  return read_account( state, space::owner, make_token_key( id ) );
}

std::optional< account > token_ledger::approval( const state_db::state_delta& state, token_id id ) const
{
  return read_account( state, space::token_approval, make_token_key( id ) );
}

std::uint64_t token_ledger::balance( const state_db::state_delta& state, const account& owner ) const
{
  return read_uint64( state, space::balance, owner );
}

std::uint64_t token_ledger::supply( const state_db::state_delta& state ) const
{
  return read_uint64( state, space::supply, {} );
}

bool token_ledger::is_operator( const state_db::state_delta& state, const account& owner, const account& op ) const
{
  return state.get( state_db::make_compound_key( space::operator_approval, make_operator_key( owner, op ) ) )
    .has_value();
}

void token_ledger::set_balance( state_db::state_delta& state, const account& owner, std::uint64_t value )
{
  if( !value )
  {
    state.remove( state_db::make_compound_key( space::balance, owner ) );
    return;
  }

  boost::endian::native_to_little_inplace( value );
  state.put( state_db::make_compound_key( space::balance, owner ), memory::as_bytes( value ) );
}

void token_ledger::set_supply( state_db::state_delta& state, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  state.put( state_db::make_compound_key( space::supply, {} ), memory::as_bytes( value ) );
}

std::error_code token_ledger::stage_mint( state_db::state_delta& state, const account& to, token_id id )
{
  if( !valid_target( to ) )
    return ledger_errc::invalid_target;

  if( owner( state, id ) )
    return ledger_errc::token_exists;

  state.put( state_db::make_compound_key( space::owner, make_token_key( id ) ), to );
  set_balance( state, to, balance( state, to ) + 1 );
  set_supply( state, supply( state ) + 1 );

  return ledger_errc::ok;
}

std::error_code token_ledger::stage_transfer( state_db::state_delta& state,
                                              const account& caller,
                                              const account& from,
                                              const account& to,
                                              token_id id )
{
  auto current_owner = owner( state, id );
  if( !current_owner )
    return ledger_errc::nonexistent_token;

  if( *current_owner != from )
    return ledger_errc::ownership_mismatch;

  if( !valid_target( to ) )
    return ledger_errc::invalid_target;

  if( caller != from && approval( state, id ) != caller && !is_operator( state, from, caller ) )
    return ledger_errc::not_authorized;

  state.remove( state_db::make_compound_key( space::token_approval, make_token_key( id ) ) );
  state.put( state_db::make_compound_key( space::owner, make_token_key( id ) ), to );

  // Balances are read after the first write so a self transfer nets to zero
  set_balance( state, from, balance( state, from ) - 1 );
  set_balance( state, to, balance( state, to ) + 1 );

  return ledger_errc::ok;
}

std::error_code token_ledger::check_receiver( const state_db::state_delta& pending,
                                              const account& op,
                                              const account& from,
                                              const account& to,
                                              token_id id,
                                              std::span< const std::byte > data )
{
  receiver_check_scope scope( _pending, pending );

  auto accepted = _receivers->check( to, op, from, id, data );
  if( accepted && *accepted )
    return ledger_errc::ok;

  LOG_WARNING( log::instance(),
               "Recipient {} rejected token {}{}",
               log::hex{ to.data(), to.size() },
               id,
               accepted ? "" : " (unreachable)" );

  return ledger_errc::transfer_rejected;
}

std::error_code token_ledger::mint( const account& to, token_id id )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending = _state->make_child();

  if( auto ec = stage_mint( *pending, to, id ); ec )
    return ec;

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(), "Minted token {} to {}", id, log::hex{ to.data(), to.size() } );
  return ledger_errc::ok;
}

std::error_code
token_ledger::safe_mint( const account& caller, const account& to, token_id id, std::span< const std::byte > data )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending = _state->make_child();

  if( auto ec = stage_mint( *pending, to, id ); ec )
    return ec;

  if( auto ec = check_receiver( *pending, caller, protocol::null_account, to, id, data ); ec )
    return ec;

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(), "Safely minted token {} to {}", id, log::hex{ to.data(), to.size() } );
  return ledger_errc::ok;
}

std::error_code token_ledger::burn( const account& caller, token_id id )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending       = _state->make_child();
  auto current_owner = owner( *pending, id );

  if( !current_owner )
    return ledger_errc::nonexistent_token;

  if( caller != *current_owner && approval( *pending, id ) != caller
      && !is_operator( *pending, *current_owner, caller ) )
    return ledger_errc::not_authorized;

  pending->remove( state_db::make_compound_key( space::token_approval, make_token_key( id ) ) );
  pending->remove( state_db::make_compound_key( space::owner, make_token_key( id ) ) );
  set_balance( *pending, *current_owner, balance( *pending, *current_owner ) - 1 );
  set_supply( *pending, supply( *pending ) - 1 );

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(), "Burned token {}", id );
  return ledger_errc::ok;
}

result< account > token_ledger::owner_of( token_id id ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( auto current_owner = owner( view(), id ); current_owner )
    return *current_owner;

  return std::unexpected( ledger_errc::nonexistent_token );
}

result< std::uint64_t > token_ledger::balance_of( const account& owner ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( owner.null() )
    return std::unexpected( ledger_errc::invalid_target );

  return balance( view(), owner );
}

std::error_code token_ledger::approve( const account& caller, const account& to, token_id id )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending       = _state->make_child();
  auto current_owner = owner( *pending, id );

  if( !current_owner )
    return ledger_errc::nonexistent_token;

  if( caller != *current_owner && !is_operator( *pending, *current_owner, caller ) )
    return ledger_errc::not_authorized;

  if( to.null() )
    pending->remove( state_db::make_compound_key( space::token_approval, make_token_key( id ) ) );
  else
    pending->put( state_db::make_compound_key( space::token_approval, make_token_key( id ) ), to );

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(), "Approved {} for token {}", log::hex{ to.data(), to.size() }, id );
  return ledger_errc::ok;
}

result< account > token_ledger::get_approved( token_id id ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( !owner( view(), id ) )
    return std::unexpected( ledger_errc::nonexistent_token );

  return approval( view(), id ).value_or( protocol::null_account );
}

std::error_code token_ledger::set_approval_for_all( const account& owner, const account& op, bool approved )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  if( owner == op )
    return ledger_errc::invalid_target;

  auto pending = _state->make_child();
  auto key     = state_db::make_compound_key( space::operator_approval, make_operator_key( owner, op ) );

  if( approved )
  {
    static constexpr std::array< std::byte, 1 > flag{ std::byte{ 0x01 } };
    pending->put( std::move( key ), flag );
  }
  else
    pending->remove( std::move( key ) );

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(),
             "Operator {} {} for {}",
             log::hex{ op.data(), op.size() },
             approved ? "approved" : "revoked",
             log::hex{ owner.data(), owner.size() } );
  return ledger_errc::ok;
}

bool token_ledger::is_approved_for_all( const account& owner, const account& op ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );
  return is_operator( view(), owner, op );
}

std::error_code
token_ledger::transfer_from( const account& caller, const account& from, const account& to, token_id id )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending = _state->make_child();

  if( auto ec = stage_transfer( *pending, caller, from, to, id ); ec )
    return ec;

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(),
             "Transferred token {} from {} to {}",
             id,
             log::hex{ from.data(), from.size() },
             log::hex{ to.data(), to.size() } );
  return ledger_errc::ok;
}

std::error_code token_ledger::safe_transfer_from( const account& caller,
                                                  const account& from,
                                                  const account& to,
                                                  token_id id,
                                                  std::span< const std::byte > data )
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( _pending )
    return ledger_errc::reentrant_call;

  auto pending = _state->make_child();

  if( auto ec = stage_transfer( *pending, caller, from, to, id ); ec )
    return ec;

  // Dropping pending on rejection discards the staged transfer
  if( auto ec = check_receiver( *pending, caller, from, to, id, data ); ec )
    return ec;

  if( auto ec = pending->squash(); ec )
    return ec;

  LOG_DEBUG( log::instance(),
             "Safely transferred token {} from {} to {}",
             id,
             log::hex{ from.data(), from.size() },
             log::hex{ to.data(), to.size() } );
  return ledger_errc::ok;
}

std::uint64_t token_ledger::total_supply() const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );
  return supply( view() );
}

const std::string& token_ledger::name() const noexcept
{
  return _config.name;
}

const std::string& token_ledger::symbol() const noexcept
{
  return _config.symbol;
}

result< std::string > token_ledger::token_uri( token_id id ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( !owner( view(), id ) )
    return std::unexpected( ledger_errc::nonexistent_token );

  if( _config.base_uri.empty() )
    return std::string{};

  return _config.base_uri + std::to_string( id );
}

result< std::uint64_t > token_ledger::recount_balance( const account& owner ) const
{
  std::lock_guard< std::recursive_mutex > lock( _mutex );

  if( owner.null() )
    return std::unexpected( ledger_errc::invalid_target );

  std::uint64_t count = 0;
  view().for_each( state_db::make_compound_key( space::owner, {} ),
                    [ & ]( std::span< const std::byte >, std::span< const std::byte > value )
                    {
                      if( std::ranges::equal( value, owner ) )
                        ++count;
                    } );

  return count;
}

bool token_ledger::supports_interface( interface_id id ) noexcept
{
  return ledger::supports_interface( id );
}

receiver_registry& token_ledger::receivers() noexcept
{
  return *_receivers;
}

} // namespace tokenledger::ledger

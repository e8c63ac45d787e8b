#pragma once

#include <tokenledger/ledger/configuration.hpp>
#include <tokenledger/ledger/error.hpp>
#include <tokenledger/ledger/interface.hpp>
#include <tokenledger/ledger/receiver.hpp>
#include <tokenledger/ledger/types.hpp>
#include <tokenledger/state_db/state_delta.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace tokenledger::ledger {

/**
 * Ownership ledger for non-fungible tokens.
 *
 * Every operation is atomic. Mutations are staged in a child of the
 * authoritative state and folded into it only when the whole operation
 * succeeds. Operations on one ledger are serialized.
 *
 * A receiver consulted during a safe transfer or safe mint may query the
 * ledger; it sees the staged state, with itself as the owner and the token
 * approval cleared. Mutating calls made from inside the check fail with
 * ledger_errc::reentrant_call.
 */
class token_ledger final
{
public:
  explicit token_ledger( configuration config                         = {},
                         std::shared_ptr< receiver_registry > receivers = {} );
  token_ledger( const token_ledger& ) = delete;
  token_ledger( token_ledger&& )      = delete;
  ~token_ledger()                     = default;

  token_ledger& operator=( const token_ledger& ) = delete;
  token_ledger& operator=( token_ledger&& )      = delete;

  std::error_code mint( const account& to, token_id id );
  std::error_code
  safe_mint( const account& caller, const account& to, token_id id, std::span< const std::byte > data = {} );
  std::error_code burn( const account& caller, token_id id );

  result< account > owner_of( token_id id ) const;
  result< std::uint64_t > balance_of( const account& owner ) const;

  std::error_code approve( const account& caller, const account& to, token_id id );
  result< account > get_approved( token_id id ) const;

  std::error_code set_approval_for_all( const account& owner, const account& op, bool approved );
  bool is_approved_for_all( const account& owner, const account& op ) const;

  std::error_code transfer_from( const account& caller, const account& from, const account& to, token_id id );
  std::error_code safe_transfer_from( const account& caller,
                                      const account& from,
                                      const account& to,
                                      token_id id,
                                      std::span< const std::byte > data = {} );

  std::uint64_t total_supply() const;
  const std::string& name() const noexcept;
  const std::string& symbol() const noexcept;
  result< std::string > token_uri( token_id id ) const;

  // Counts owned tokens by scanning every owner entry. Only meant for
  // verifying the incrementally maintained balance.
  result< std::uint64_t > recount_balance( const account& owner ) const;

  static bool supports_interface( interface_id id ) noexcept;

  receiver_registry& receivers() noexcept;

private:
  const state_db::state_delta& view() const;

  std::optional< account > owner( const state_db::state_delta& state, token_id id ) const;
  std::optional< account > approval( const state_db::state_delta& state, token_id id ) const;
  std::uint64_t balance( const state_db::state_delta& state, const account& owner ) const;
  std::uint64_t supply( const state_db::state_delta& state ) const;
  bool is_operator( const state_db::state_delta& state, const account& owner, const account& op ) const;

  void set_balance( state_db::state_delta& state, const account& owner, std::uint64_t value );
  void set_supply( state_db::state_delta& state, std::uint64_t value );

  std::error_code stage_mint( state_db::state_delta& state, const account& to, token_id id );
  std::error_code stage_transfer( state_db::state_delta& state,
                                  const account& caller,
                                  const account& from,
                                  const account& to,
                                  token_id id );
  std::error_code check_receiver( const state_db::state_delta& pending,
                                  const account& op,
                                  const account& from,
                                  const account& to,
                                  token_id id,
                                  std::span< const std::byte > data );

  configuration _config;
  std::shared_ptr< receiver_registry > _receivers;
  state_db::state_delta_ptr _state;

  mutable std::recursive_mutex _mutex;

  // Set while a receiver check runs against a staged operation
  const state_db::state_delta* _pending = nullptr;
};

} // namespace tokenledger::ledger

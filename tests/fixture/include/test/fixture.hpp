#pragma once

#include <tokenledger/ledger.hpp>
#include <tokenledger/protocol.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace test {

tokenledger::protocol::account make_user( std::uint8_t id );
tokenledger::protocol::account make_program( std::uint8_t id );

/**
 * A receiver whose answer is set by the test. Every call is recorded.
 */
struct scripted_receiver final: public tokenledger::ledger::receiver
{
  struct call
  {
    tokenledger::protocol::account op;
    tokenledger::protocol::account from;
    tokenledger::ledger::token_id id;
    std::vector< std::byte > data;
  };

  scripted_receiver() = default;
  explicit scripted_receiver( tokenledger::ledger::result< bool > answer );
  scripted_receiver( const scripted_receiver& )            = delete;
  scripted_receiver( scripted_receiver&& )                 = delete;
  scripted_receiver& operator=( const scripted_receiver& ) = delete;
  scripted_receiver& operator=( scripted_receiver&& )      = delete;
  ~scripted_receiver() override                            = default;

  tokenledger::ledger::result< bool > on_token_received( const tokenledger::protocol::account& op,
                                                         const tokenledger::protocol::account& from,
                                                         tokenledger::ledger::token_id id,
                                                         std::span< const std::byte > data ) override;

  tokenledger::ledger::result< bool > answer = true;
  std::function< void() > on_call;
  std::vector< call > calls;
};

struct fixture
{
  fixture();
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  ~fixture()                           = default;

  std::shared_ptr< scripted_receiver > add_receiver( const tokenledger::protocol::account& program,
                                                     tokenledger::ledger::result< bool > answer = true );

  // Captures everything observable about a token and its parties
  struct snapshot
  {
    tokenledger::ledger::result< tokenledger::protocol::account > owner;
    tokenledger::ledger::result< tokenledger::protocol::account > approved;
    std::vector< std::uint64_t > balances;
    std::uint64_t supply = 0;

    bool operator==( const snapshot& ) const = default;
  };

  snapshot take_snapshot( tokenledger::ledger::token_id id,
                          std::initializer_list< tokenledger::protocol::account > accounts ) const;

  bool balances_consistent( std::initializer_list< tokenledger::protocol::account > accounts ) const;

  tokenledger::protocol::account alice;
  tokenledger::protocol::account bob;
  tokenledger::protocol::account charlie;
  tokenledger::protocol::account vault;

  std::unique_ptr< tokenledger::ledger::token_ledger > _ledger;
};

} // namespace test

#pragma once

#include <tokenledger/ledger/error.hpp>
#include <tokenledger/ledger/types.hpp>

#include <map>
#include <memory>
#include <span>

namespace tokenledger::ledger {

/**
 * The acceptance check a recipient runs before it takes ownership of a token
 * through a safe transfer or safe mint.
 *
 * Returns true to accept and false to reject. An error means the recipient
 * could not be reached. Either outcome other than true rejects the transfer.
 */
struct receiver
{
  receiver()                  = default;
  receiver( const receiver& ) = delete;
  receiver( receiver&& )      = delete;
  virtual ~receiver()         = default;

  receiver& operator=( const receiver& ) = delete;
  receiver& operator=( receiver&& )      = delete;

  virtual result< bool > on_token_received( const account& op,
                                            const account& from,
                                            token_id id,
                                            std::span< const std::byte > data ) = 0;
};

/**
 * Plain accounts cannot run code and always accept.
 */
struct accepting_receiver final: public receiver
{
  accepting_receiver()                            = default;
  accepting_receiver( const accepting_receiver& ) = delete;
  accepting_receiver( accepting_receiver&& )      = delete;
  ~accepting_receiver() override                  = default;

  accepting_receiver& operator=( const accepting_receiver& ) = delete;
  accepting_receiver& operator=( accepting_receiver&& )      = delete;

  result< bool > on_token_received( const account& op,
                                    const account& from,
                                    token_id id,
                                    std::span< const std::byte > data ) override;
};

/**
 * Binds program accounts to the receiver that answers for them and selects
 * the acceptance check for a recipient.
 *
 * User accounts resolve to an accepting receiver. Program accounts resolve to
 * their registered receiver, or are unreachable when none is registered.
 * A receiver stays alive until its check returns, even if it is removed from
 * the registry while the check runs.
 * Registration is expected to happen while the ledger is idle; the registry
 * itself is not synchronized.
 */
class receiver_registry final
{
public:
  receiver_registry();
  receiver_registry( const receiver_registry& ) = delete;
  receiver_registry( receiver_registry&& )      = delete;
  ~receiver_registry()                          = default;

  receiver_registry& operator=( const receiver_registry& ) = delete;
  receiver_registry& operator=( receiver_registry&& )      = delete;

  std::error_code add( const account& program, std::shared_ptr< receiver > r );
  bool remove( const account& program );
  bool contains( const account& program ) const;

  result< std::shared_ptr< receiver > > resolve( const account& recipient ) const;

  result< bool > check( const account& recipient,
                        const account& op,
                        const account& from,
                        token_id id,
                        std::span< const std::byte > data ) const;

private:
  std::shared_ptr< receiver > _accepting;
  std::map< account, std::shared_ptr< receiver > > _receivers;
};

} // namespace tokenledger::ledger

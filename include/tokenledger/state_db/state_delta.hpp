#pragma once

#include <tokenledger/state_db/backends/backend.hpp>
#include <tokenledger/state_db/error.hpp>
#include <tokenledger/state_db/types.hpp>

#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

namespace tokenledger::state_db {

/**
 * A layer of key/value state.
 *
 * A root delta is authoritative. A child delta reads through to its parent
 * and records its own writes and removals locally. Squashing a child folds
 * those changes into the parent in one step. A child that is dropped
 * without being squashed leaves its parent untouched.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  using visitor = std::function< void( std::span< const std::byte >, std::span< const std::byte > ) >;

  state_delta() noexcept;
  explicit state_delta( std::shared_ptr< state_delta > parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Visits every live object whose key begins with prefix, in key order.
   */
  void for_each( std::span< const std::byte > prefix, const visitor& v ) const;

  std::shared_ptr< state_delta > make_child();
  std::error_code squash();
  void clear();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;

  const std::shared_ptr< state_delta >& parent() const;

private:
  void collect( std::span< const std::byte > prefix,
                std::map< std::vector< std::byte >, std::span< const std::byte > >& objects ) const;

  std::shared_ptr< state_delta > _parent;
  std::shared_ptr< backends::abstract_backend > _backend;
  std::set< std::vector< std::byte > > _removed_objects;
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _backend->put( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace tokenledger::state_db

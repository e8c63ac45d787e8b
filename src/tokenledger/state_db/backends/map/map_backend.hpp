#pragma once

#include <tokenledger/state_db/backends/backend.hpp>

#include "map_iterator.hpp"

namespace tokenledger::state_db::backends::map {

class map_backend final: public abstract_backend
{
public:
  map_backend()                                = default;
  map_backend( const map_backend& )            = default;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = default;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final                         = default;

  // Iterators
  iterator begin() noexcept final;
  iterator end() noexcept final;

  // Modifiers
  std::int64_t put( std::vector< std::byte >&& key, std::span< const std::byte > value ) final;
  std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const final;
  std::int64_t remove( const std::vector< std::byte >& key ) final;
  void clear() noexcept final;

  std::uint64_t size() const noexcept final;

  std::shared_ptr< abstract_backend > clone() const final;

private:
  map_type _map;
};

} // namespace tokenledger::state_db::backends::map

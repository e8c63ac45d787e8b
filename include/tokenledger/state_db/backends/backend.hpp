#pragma once

#include <tokenledger/state_db/backends/iterator.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace tokenledger::state_db::backends {

class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual iterator begin() = 0;
  virtual iterator end()   = 0;

  virtual std::int64_t put( std::vector< std::byte >&& key, std::span< const std::byte > value )         = 0;
  virtual std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )           = 0;
  virtual std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const = 0;
  virtual std::int64_t remove( const std::vector< std::byte >& key )                                     = 0;
  virtual void clear()                                                                                   = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  virtual std::shared_ptr< abstract_backend > clone() const = 0;
};

} // namespace tokenledger::state_db::backends

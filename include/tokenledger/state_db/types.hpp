#pragma once

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <span>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <tokenledger/memory.hpp>

namespace tokenledger::state_db {

class state_delta;

using state_delta_ptr = std::shared_ptr< state_delta >;

struct object_space
{
  std::uint32_t id = 0;
};

/**
 * Objects are keyed by their space followed by the object key. The space id
 * is stored big endian so that all objects of a space are contiguous and
 * ordered within the store.
 */
inline std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  auto id = boost::endian::native_to_big( space.id );

  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( id ) + key.size() );
  std::ranges::copy( memory::as_bytes( id ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

} // namespace tokenledger::state_db

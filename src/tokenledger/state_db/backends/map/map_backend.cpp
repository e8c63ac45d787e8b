#include "map_backend.hpp"

namespace tokenledger::state_db::backends::map {

iterator map_backend::begin() noexcept
{
  return iterator( std::make_unique< map_iterator >( std::make_unique< iterator_type >( _map.begin() ), _map ) );
}

iterator map_backend::end() noexcept
{
  return iterator( std::make_unique< map_iterator >( std::make_unique< iterator_type >( _map.end() ), _map ) );
}

std::int64_t map_backend::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  return put( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

std::int64_t map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  std::int64_t size = std::ssize( key ) + std::ssize( value );

  if( auto itr = _map.find( key ); itr != _map.end() )
  {
    size        -= std::ssize( itr->first ) + std::ssize( itr->second );
    itr->second  = std::move( value );
    return size;
  }

  _map.emplace( std::move( key ), std::move( value ) );
  return size;
}

std::optional< std::span< const std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

std::int64_t map_backend::remove( const std::vector< std::byte >& key )
{
  std::int64_t size = 0;

  if( auto itr = _map.find( key ); itr != _map.end() )
  {
    size -= std::ssize( itr->first ) + std::ssize( itr->second );
    _map.erase( itr );
  }

  return size;
}

void map_backend::clear() noexcept
{
  _map.clear();
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

std::shared_ptr< abstract_backend > map_backend::clone() const
{
  return std::make_shared< map_backend >( *this );
}

} // namespace tokenledger::state_db::backends::map

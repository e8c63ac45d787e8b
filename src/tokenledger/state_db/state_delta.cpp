#include <tokenledger/state_db/state_delta.hpp>

#include "backends/map/map_backend.hpp"

#include <algorithm>
#include <map>

namespace tokenledger::state_db {

state_delta::state_delta() noexcept:
    state_delta( std::shared_ptr< state_delta >{} )
{}

state_delta::state_delta( std::shared_ptr< state_delta > parent ) noexcept:
    _parent( std::move( parent ) ),
    _backend( std::make_shared< backends::map::map_backend >() )
{}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  std::int64_t size = 0;

  size += _backend->remove( key );

  if( root() )
    return size;

  if( size == 0 )
    if( auto current_value = get( key ); current_value )
      size -= std::ssize( key ) + std::ssize( *current_value );

  if( size )
    _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto value = node->_backend->get( key ); value )
      return value;
  }

  return {};
}

void state_delta::collect( std::span< const std::byte > prefix,
                           std::map< std::vector< std::byte >, std::span< const std::byte > >& objects ) const
{
  if( _parent )
    _parent->collect( prefix, objects );

  for( const auto& key: _removed_objects )
    objects.erase( key );

  for( auto itr = _backend->begin(); itr != _backend->end(); ++itr )
  {
    const auto& [ key, value ] = *itr;

    if( key.size() < prefix.size() || !std::ranges::equal( std::span( key ).first( prefix.size() ), prefix ) )
    {
      if( std::ranges::lexicographical_compare( prefix, key ) )
        break;

      continue;
    }

    objects.insert_or_assign( key, std::span< const std::byte >( value ) );
  }
}

void state_delta::for_each( std::span< const std::byte > prefix, const visitor& v ) const
{
  std::map< std::vector< std::byte >, std::span< const std::byte > > objects;
  collect( prefix, objects );

  for( const auto& [ key, value ]: objects )
    v( key, value );
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  return std::make_shared< state_delta >( shared_from_this() );
}

std::error_code state_delta::squash()
{
  if( root() )
    return state_db_errc::no_parent;

  auto& parent = *_parent;

  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._backend->remove( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  for( auto itr = _backend->begin(); itr != _backend->end(); itr = _backend->begin() )
  {
    auto key_value_pair = itr.release();
    parent._removed_objects.erase( key_value_pair.first );
    parent._backend->put( std::move( key_value_pair.first ), std::move( key_value_pair.second ) );
  }

  return state_db_errc::ok;
}

void state_delta::clear()
{
  _backend->clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.find( key ) != _removed_objects.end();
}

bool state_delta::root() const
{
  return !_parent;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

} // namespace tokenledger::state_db

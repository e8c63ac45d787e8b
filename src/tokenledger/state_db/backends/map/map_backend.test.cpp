// NOLINTBEGIN

#include <gtest/gtest.h>

#include "map_backend.hpp"

#include <algorithm>

using tokenledger::state_db::backends::map::map_backend;

TEST( map_backend, put_get_remove )
{
  map_backend backend;
  EXPECT_TRUE( backend.empty() );

  std::vector< std::byte > key{ std::byte{ 0x01 } }, value{ std::byte{ 0x10 }, std::byte{ 0x11 } };
  EXPECT_EQ( backend.put( std::vector< std::byte >( key ), std::vector< std::byte >( value ) ), 3 );
  EXPECT_EQ( backend.size(), 1 );
  EXPECT_FALSE( backend.empty() );

  if( auto v = backend.get( key ); v )
    EXPECT_TRUE( std::ranges::equal( *v, value ) );
  else
    ADD_FAILURE() << "backend did not return a value";

  std::vector< std::byte > shorter{ std::byte{ 0x20 } };
  EXPECT_EQ( backend.put( std::vector< std::byte >( key ), std::span< const std::byte >( shorter ) ), -1 );
  EXPECT_EQ( backend.size(), 1 );

  EXPECT_EQ( backend.remove( key ), -2 );
  EXPECT_EQ( backend.remove( key ), 0 );
  EXPECT_FALSE( backend.get( key ) );
  EXPECT_TRUE( backend.empty() );
}

TEST( map_backend, iteration )
{
  map_backend backend;

  for( std::uint8_t i = 3; i > 0; --i )
    backend.put( std::vector< std::byte >{ std::byte{ i } }, std::vector< std::byte >{ std::byte{ i } } );

  std::uint8_t expected = 1;
  for( auto itr = backend.begin(); itr != backend.end(); ++itr, ++expected )
    EXPECT_EQ( itr->first, std::vector< std::byte >{ std::byte{ expected } } );

  EXPECT_EQ( expected, 4 );

  auto copy = backend.clone();
  EXPECT_EQ( copy->size(), 3 );

  auto itr  = backend.begin();
  auto pair = itr.release();
  EXPECT_EQ( pair.first, std::vector< std::byte >{ std::byte{ 0x01 } } );
  EXPECT_EQ( backend.size(), 2 );
  EXPECT_EQ( copy->size(), 3 );

  backend.clear();
  EXPECT_TRUE( backend.begin() == backend.end() );
}

// NOLINTEND

#include <gtest/gtest.h>

#include <tokenledger/encode/hex.hpp>
#include <tokenledger/protocol/account.hpp>

#include <unordered_set>

using namespace std::string_view_literals;

static tokenledger::protocol::address make_address( std::uint8_t id )
{
  tokenledger::protocol::address addr{};
  addr.back() = std::byte{ id };
  return addr;
}

TEST( account, types )
{
  auto user    = tokenledger::protocol::user_account( make_address( 1 ) );
  auto program = tokenledger::protocol::program_account( make_address( 1 ) );

  EXPECT_TRUE( user.user() );
  EXPECT_FALSE( user.program() );
  EXPECT_FALSE( user.null() );
  EXPECT_EQ( user.type(), tokenledger::protocol::account_type::user );

  EXPECT_FALSE( program.user() );
  EXPECT_TRUE( program.program() );
  EXPECT_FALSE( program.null() );
  EXPECT_EQ( program.type(), tokenledger::protocol::account_type::program );

  EXPECT_NE( user, program );
  EXPECT_TRUE( std::ranges::equal( user.address(), program.address() ) );
}

TEST( account, null_sentinel )
{
  const auto& null = tokenledger::protocol::null_account;

  EXPECT_TRUE( null.null() );
  EXPECT_FALSE( null.user() );
  EXPECT_FALSE( null.program() );
  EXPECT_EQ( null.type(), tokenledger::protocol::account_type::invalid );

  // A zero address with a valid prefix is a real account
  EXPECT_FALSE( tokenledger::protocol::user_account( {} ).null() );
}

TEST( account, hex )
{
  auto user = tokenledger::protocol::user_account( make_address( 0x2a ) );
  auto str  = tokenledger::encode::to_hex( user );

  EXPECT_EQ( str, "0x01000000000000000000000000000000000000002a" );

  auto parsed = tokenledger::protocol::account_from_hex( str );
  ASSERT_TRUE( parsed );
  EXPECT_EQ( *parsed, user );

  auto short_account = tokenledger::protocol::account_from_hex( "0x0102"sv );
  ASSERT_FALSE( short_account );
  EXPECT_EQ( short_account.error(), tokenledger::encode::encode_errc::invalid_length );

  auto bad_account = tokenledger::protocol::account_from_hex( "0xzz"sv );
  ASSERT_FALSE( bad_account );
  EXPECT_EQ( bad_account.error(), tokenledger::encode::encode_errc::invalid_character );
}

TEST( account, hashing )
{
  std::unordered_set< tokenledger::protocol::account > accounts;
  accounts.insert( tokenledger::protocol::user_account( make_address( 1 ) ) );
  accounts.insert( tokenledger::protocol::user_account( make_address( 2 ) ) );
  accounts.insert( tokenledger::protocol::user_account( make_address( 1 ) ) );

  EXPECT_EQ( accounts.size(), 2 );
}

// NOLINTBEGIN

#include <test/fixture.hpp>

#include <tokenledger/log.hpp>

namespace test {

static tokenledger::protocol::address make_address( std::uint8_t id )
{
  tokenledger::protocol::address addr{};
  addr.back() = std::byte{ id };
  return addr;
}

tokenledger::protocol::account make_user( std::uint8_t id )
{
  return tokenledger::protocol::user_account( make_address( id ) );
}

tokenledger::protocol::account make_program( std::uint8_t id )
{
  return tokenledger::protocol::program_account( make_address( id ) );
}

scripted_receiver::scripted_receiver( tokenledger::ledger::result< bool > a ):
    answer( std::move( a ) )
{}

tokenledger::ledger::result< bool > scripted_receiver::on_token_received( const tokenledger::protocol::account& op,
                                                                          const tokenledger::protocol::account& from,
                                                                          tokenledger::ledger::token_id id,
                                                                          std::span< const std::byte > data )
{
  calls.push_back( call{ op, from, id, std::vector< std::byte >( data.begin(), data.end() ) } );

  if( on_call )
    on_call();

  return answer;
}

fixture::fixture():
    alice( make_user( 1 ) ),
    bob( make_user( 2 ) ),
    charlie( make_user( 3 ) ),
    vault( make_program( 4 ) )
{
  tokenledger::log::initialize();

  tokenledger::ledger::configuration config;
  config.name   = "MyContract";
  config.symbol = "MC";

  _ledger = std::make_unique< tokenledger::ledger::token_ledger >( config );

  LOG_INFO( tokenledger::log::instance(), "Created ledger {} ({})", _ledger->name(), _ledger->symbol() );
}

std::shared_ptr< scripted_receiver > fixture::add_receiver( const tokenledger::protocol::account& program,
                                                            tokenledger::ledger::result< bool > answer )
{
  auto r = std::make_shared< scripted_receiver >( std::move( answer ) );
  if( _ledger->receivers().add( program, r ) )
    return {};

  return r;
}

fixture::snapshot fixture::take_snapshot( tokenledger::ledger::token_id id,
                                          std::initializer_list< tokenledger::protocol::account > accounts ) const
{
  snapshot s{ _ledger->owner_of( id ), _ledger->get_approved( id ), {}, _ledger->total_supply() };

  for( const auto& acc: accounts )
    s.balances.push_back( _ledger->balance_of( acc ).value_or( 0 ) );

  return s;
}

bool fixture::balances_consistent( std::initializer_list< tokenledger::protocol::account > accounts ) const
{
  for( const auto& acc: accounts )
  {
    auto balance = _ledger->balance_of( acc );
    auto count   = _ledger->recount_balance( acc );

    if( !balance || !count || *balance != *count )
    {
      LOG_ERROR( tokenledger::log::instance(),
                 "Balance of {} does not match its owned token count",
                 tokenledger::log::hex{ acc.data(), acc.size() } );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND

#include <tokenledger/ledger/receiver.hpp>

#include <exception>

#include <tokenledger/log.hpp>

namespace tokenledger::ledger {

result< bool > accepting_receiver::on_token_received( const account&,
                                                      const account&,
                                                      token_id,
                                                      std::span< const std::byte > )
{
  return true;
}

receiver_registry::receiver_registry():
    _accepting( std::make_shared< accepting_receiver >() )
{}

std::error_code receiver_registry::add( const account& program, std::shared_ptr< receiver > r )
{
  if( !program.program() || !r )
    return ledger_errc::invalid_target;

  _receivers.insert_or_assign( program, std::move( r ) );
  return ledger_errc::ok;
}

bool receiver_registry::remove( const account& program )
{
  return _receivers.erase( program ) > 0;
}

bool receiver_registry::contains( const account& program ) const
{
  return _receivers.contains( program );
}

result< std::shared_ptr< receiver > > receiver_registry::resolve( const account& recipient ) const
{
  if( recipient.user() )
    return _accepting;

  if( auto itr = _receivers.find( recipient ); itr != _receivers.end() )
    return itr->second;

  return std::unexpected( ledger_errc::transfer_rejected );
}

result< bool > receiver_registry::check( const account& recipient,
                                         const account& op,
                                         const account& from,
                                         token_id id,
                                         std::span< const std::byte > data ) const
{
  auto r = resolve( recipient );
  if( !r )
  {
    LOG_WARNING( log::instance(),
                 "No receiver is registered for {}",
                 log::hex{ recipient.data(), recipient.size() } );
    return std::unexpected( r.error() );
  }

  try
  {
    return ( *r )->on_token_received( op, from, id, data );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( log::instance(),
                 "Receiver {} failed while checking token {}: {}",
                 log::hex{ recipient.data(), recipient.size() },
                 id,
                 e.what() );
  }

  return std::unexpected( ledger_errc::transfer_rejected );
}

} // namespace tokenledger::ledger

#include <tokenledger/ledger/error.hpp>

#include <string>

namespace tokenledger::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ledger";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< ledger_errc >( condition ) )
    {
      case ledger_errc::ok:
        return "ok"s;
      case ledger_errc::invalid_target:
        return "invalid target account"s;
      case ledger_errc::token_exists:
        return "token already minted"s;
      case ledger_errc::nonexistent_token:
        return "invalid token id"s;
      case ledger_errc::ownership_mismatch:
        return "transfer from incorrect owner"s;
      case ledger_errc::not_authorized:
        return "caller is not token owner or approved"s;
      case ledger_errc::transfer_rejected:
        return "transfer to non receiver implementer"s;
      case ledger_errc::reentrant_call:
        return "reentrant call during receiver check"s;
      case ledger_errc::invalid_configuration:
        return "invalid ledger configuration"s;
    }
    return "unknown error"s;
  }
};

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace tokenledger::ledger

#pragma once

#include <cstdint>

namespace tokenledger::ledger {

using interface_id = std::uint32_t;

constexpr interface_id introspection_interface_id = 0x01ffc9a7;
constexpr interface_id token_ledger_interface_id  = 0x80ac58cd;

constexpr bool supports_interface( interface_id id ) noexcept
{
  switch( id )
  {
    case introspection_interface_id:
    case token_ledger_interface_id:
      return true;
    default:
      return false;
  }
}

} // namespace tokenledger::ledger

#pragma once

#include <expected>
#include <system_error>
#include <type_traits>

namespace tokenledger::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_target,
  token_exists,
  nonexistent_token,
  ownership_mismatch,
  not_authorized,
  transfer_rejected,
  reentrant_call,
  invalid_configuration
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tokenledger::ledger

template<>
struct std::is_error_code_enum< tokenledger::ledger::ledger_errc >: public std::true_type
{};

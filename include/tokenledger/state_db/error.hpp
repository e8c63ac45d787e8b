#pragma once

#include <expected>
#include <system_error>
#include <type_traits>

namespace tokenledger::state_db {

enum class state_db_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  no_parent
};

const std::error_category& state_db_category() noexcept;

std::error_code make_error_code( state_db_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tokenledger::state_db

template<>
struct std::is_error_code_enum< tokenledger::state_db::state_db_errc >: public std::true_type
{};

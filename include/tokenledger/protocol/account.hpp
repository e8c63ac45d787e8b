#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>

#include <tokenledger/encode/error.hpp>

namespace tokenledger::protocol {

constexpr std::size_t address_length = 20;
constexpr std::size_t account_length = address_length + 1;

enum class account_type : std::uint8_t
{
  invalid = 0x00,
  user    = 0x01,
  program = 0x02
};

using address = std::array< std::byte, address_length >;

/**
 * An account is a one byte type prefix followed by its address.
 *
 * The all zero value is the null account. It has an invalid type and is
 * never a valid owner, recipient or operator target.
 */
struct account: std::array< std::byte, account_length >
{
  account_type type() const noexcept;

  bool user() const noexcept;
  bool program() const noexcept;
  bool null() const noexcept;

  std::span< const std::byte, address_length > address() const noexcept;
};

constexpr account null_account{};

account user_account( const address& ) noexcept;
account program_account( const address& ) noexcept;

encode::result< account > account_from_hex( std::string_view sv ) noexcept;

} // namespace tokenledger::protocol

template<>
struct std::hash< tokenledger::protocol::account >
{
  std::size_t operator()( const tokenledger::protocol::account& acc ) const noexcept
  {
    std::size_t seed = 0;
    for( const auto& value: acc )
      seed = seed * 31 + std::hash< std::byte >()( value );

    return seed;
  }
};

#pragma once

#include <cstdint>

#include <tokenledger/protocol/account.hpp>

namespace tokenledger::ledger {

using token_id = std::uint64_t;

using protocol::account;

} // namespace tokenledger::ledger

#pragma once

#include <quill/LogMacros.h>

#include <tokenledger/log/formatter.hpp>
#include <tokenledger/log/frontend.hpp>

namespace tokenledger::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace tokenledger::log

#pragma once

#include <tokenledger/ledger/configuration.hpp>
#include <tokenledger/ledger/error.hpp>
#include <tokenledger/ledger/interface.hpp>
#include <tokenledger/ledger/receiver.hpp>
#include <tokenledger/ledger/token_ledger.hpp>
#include <tokenledger/ledger/types.hpp>

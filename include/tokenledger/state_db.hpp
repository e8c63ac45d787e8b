#pragma once

#include <tokenledger/state_db/error.hpp>
#include <tokenledger/state_db/state_delta.hpp>
#include <tokenledger/state_db/types.hpp>

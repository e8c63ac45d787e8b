#pragma once

#include <tokenledger/encode/error.hpp>
#include <tokenledger/encode/hex.hpp>

#pragma once

#include <tokenledger/protocol/account.hpp>

#pragma once

#include <tokenledger/memory/memory.hpp>

#pragma once

#include <tokenledger/log/log.hpp>

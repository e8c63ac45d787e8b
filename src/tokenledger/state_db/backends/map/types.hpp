#pragma once

#include <cstddef>
#include <map>
#include <vector>

namespace tokenledger::state_db::backends::map {

using map_type      = std::map< std::vector< std::byte >, std::vector< std::byte > >;
using iterator_type = map_type::iterator;

} // namespace tokenledger::state_db::backends::map

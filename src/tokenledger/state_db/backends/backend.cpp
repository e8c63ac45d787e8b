#include <tokenledger/state_db/backends/backend.hpp>

namespace tokenledger::state_db::backends {

bool abstract_backend::empty() const
{
  return size() == 0;
}

} // namespace tokenledger::state_db::backends

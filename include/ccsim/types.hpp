#pragma once
#include <cstddef>
#include <cstdint>

namespace ccsim {

using Step      = int64_t;   // discrete time, 1 step = 1 second
using Duration  = int32_t;   // service time in steps
using AgentIdx  = std::size_t;

} // namespace ccsim

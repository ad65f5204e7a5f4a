#pragma once
#include "ccsim/types.hpp"

namespace ccsim {

struct Call {
  Step arrival{};
};

inline constexpr Step wait_of(const Call& c, Step assigned_at) noexcept {
  return assigned_at - c.arrival;
}

} // namespace ccsim

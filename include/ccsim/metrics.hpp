#pragma once
#include <cstdint>
#include <span>

#include "ccsim/types.hpp"

namespace ccsim {

struct RunSummary {
  double   avg_wait{0.0};      // seconds
  uint32_t max_queue{0};
  uint64_t throughput{0};
  double   utilization{0.0};   // fraction in [0,1]
};

// Reductions define the empty case as 0
double mean_wait(std::span<const Step> waits) noexcept;
uint32_t max_length(std::span<const uint32_t> series) noexcept;
double utilization(uint64_t busy_steps_total, int32_t num_agents, Step sim_steps) noexcept;

inline double to_percent(double fraction) noexcept { return fraction * 100.0; }

// (baseline - value) / baseline * 100, or 0 when baseline is 0
double improvement_pct(double baseline, double value) noexcept;

} // namespace ccsim

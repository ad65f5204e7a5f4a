#include "ccsim/metrics.hpp"

#include <algorithm>
#include <numeric>

namespace ccsim {

double mean_wait(std::span<const Step> waits) noexcept {
  if (waits.empty()) return 0.0;
  const double total = std::accumulate(waits.begin(), waits.end(), 0.0);
  return total / static_cast<double>(waits.size());
}

uint32_t max_length(std::span<const uint32_t> series) noexcept {
  if (series.empty()) return 0;
  return *std::max_element(series.begin(), series.end());
}

double utilization(uint64_t busy_steps_total, int32_t num_agents, Step sim_steps) noexcept {
  if (num_agents <= 0 || sim_steps <= 0) return 0.0;
  const double capacity = static_cast<double>(num_agents) * static_cast<double>(sim_steps);
  return static_cast<double>(busy_steps_total) / capacity;
}

double improvement_pct(double baseline, double value) noexcept {
  if (baseline == 0.0) return 0.0;
  return (baseline - value) / baseline * 100.0;
}

} // namespace ccsim

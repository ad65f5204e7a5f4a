#pragma once
#include <cstdint>
#include <vector>

#include "ccsim/metrics.hpp"
#include "ccsim/rng.hpp"
#include "ccsim/scenario.hpp"
#include "ccsim/types.hpp"

namespace ccsim {

struct RunResult {
  std::vector<Step>     wait_times;           // in assignment order
  std::vector<uint32_t> queue_length_series;  // residual backlog after each step
  uint64_t busy_steps_total{0};
  uint64_t calls_served{0};
  uint64_t calls_arrived{0};

  RunSummary summary{};                        // filled once the last step ran
};

// Time-stepped multi-server queue. Each step runs, in order:
//   advance busy servers -> admit at most one arrival -> assign FIFO to idle servers -> record
// A server that finishes in step t can take a waiting call in step t.
class Simulator {
public:
  // Throws InvalidConfiguration
  explicit Simulator(ScenarioConfig cfg);

  const ScenarioConfig& config() const noexcept { return cfg_; }

  // Each call starts from fresh servers and an empty queue
  RunResult run(RandomSource& rng) const;
  RunResult run(uint64_t seed) const;

private:
  ScenarioConfig cfg_;
};

inline RunResult run_simulation(const ScenarioConfig& cfg, uint64_t seed) {
  return Simulator(cfg).run(seed);
}

} // namespace ccsim

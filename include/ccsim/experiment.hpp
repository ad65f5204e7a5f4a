#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "ccsim/scenario.hpp"
#include "ccsim/simulator.hpp"

namespace ccsim {

struct ExperimentOptions {
  uint64_t seed{42};
  std::size_t threads{1};

  // true: every scenario draws from the same seed, so differences come from the config.
  // false: scenario i uses seed + i.
  bool common_random_numbers{true};
};

struct ScenarioOutcome {
  ScenarioConfig config{};
  uint64_t seed{0};
  RunResult result{};
};

uint64_t seed_for(const ExperimentOptions& opts, std::size_t scenario_index) noexcept;

// Validates every scenario before running any of them (throws InvalidConfiguration).
// Outcomes come back in input order regardless of opts.threads.
std::vector<ScenarioOutcome> run_experiment(const std::vector<ScenarioConfig>& scenarios,
                                            const ExperimentOptions& opts = {});

// Average-wait improvement of every outcome against outcomes.front(), in percent
std::vector<double> wait_improvements(const std::vector<ScenarioOutcome>& outcomes);

} // namespace ccsim

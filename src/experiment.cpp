#include "ccsim/experiment.hpp"

#include <algorithm>
#include <exception>

#include "ccsim/metrics.hpp"
#include "ccsim/worker_group.hpp"

namespace ccsim {

uint64_t seed_for(const ExperimentOptions& opts, std::size_t scenario_index) noexcept {
  if (opts.common_random_numbers) return opts.seed;
  return opts.seed + static_cast<uint64_t>(scenario_index);
}

std::vector<ScenarioOutcome> run_experiment(const std::vector<ScenarioConfig>& scenarios,
                                            const ExperimentOptions& opts) {
  // Fail fast: nothing runs if any scenario is invalid
  std::vector<Simulator> sims;
  sims.reserve(scenarios.size());
  for (const auto& s : scenarios) sims.emplace_back(s);

  std::vector<ScenarioOutcome> out(scenarios.size());
  if (scenarios.empty()) return out;

  auto run_one = [&](std::size_t i) {
    const uint64_t seed = seed_for(opts, i);
    out[i].config = sims[i].config();
    out[i].seed = seed;
    out[i].result = sims[i].run(seed);
  };

  const std::size_t n = scenarios.size();
  // Clamp: never spawn more threads than scenarios, and at least 1.
  const std::size_t n_threads = std::max<std::size_t>(1, std::min(opts.threads, n));

  if (n_threads == 1) {
    for (std::size_t i = 0; i < n; ++i) run_one(i);
    return out;
  }

  std::vector<std::exception_ptr> errors(n_threads);
  {
    WorkerGroup workers;
    workers.reserve(n_threads);

    // Strided partition: worker t runs scenarios t, t + n_threads, ...
    for (std::size_t t = 0; t < n_threads; ++t) {
      workers.spawn([&, t]() {
        try {
          for (std::size_t i = t; i < n; i += n_threads) run_one(i);
        } catch (...) {
          errors[t] = std::current_exception();
        }
      });
    }
  } // joins, also when a spawn throws

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return out;
}

std::vector<double> wait_improvements(const std::vector<ScenarioOutcome>& outcomes) {
  std::vector<double> out;
  if (outcomes.empty()) return out;

  out.reserve(outcomes.size());
  const double base = outcomes.front().result.summary.avg_wait;
  for (const auto& o : outcomes) out.push_back(improvement_pct(base, o.result.summary.avg_wait));
  return out;
}

} // namespace ccsim

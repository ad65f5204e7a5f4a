#include "ccsim/simulator.hpp"
#include "ccsim/call.hpp"
#include "ccsim/server_pool.hpp"

#include <deque>
#include <stdexcept>
#include <string>
#include <utility>

namespace ccsim {

Simulator::Simulator(ScenarioConfig cfg) : cfg_(std::move(cfg)) {
  require_valid(cfg_);
}

RunResult Simulator::run(uint64_t seed) const {
  Rng rng(seed);
  return run(rng);
}

RunResult Simulator::run(RandomSource& rng) const {
  RunResult out{};
  out.queue_length_series.reserve(static_cast<std::size_t>(cfg_.sim_steps));

  ServerPool servers(static_cast<std::size_t>(cfg_.num_agents));
  std::deque<Call> queue;

  for (Step t = 0; t < cfg_.sim_steps; ++t) {
    servers.advance();

    // one draw per step, whatever the outcome
    if (rng.uniform01() < cfg_.arrival_prob_per_step) {
      queue.push_back(Call{t});
      out.calls_arrived++;
    }

    while (!queue.empty()) {
      const auto idle = servers.lowest_idle();
      if (!idle) break;

      const Call c = queue.front();
      queue.pop_front();

      const Duration service = rng.uniform_int(cfg_.service_time.min, cfg_.service_time.max);
      if (service < cfg_.service_time.min || service > cfg_.service_time.max ||
          !servers.assign(*idle, service)) {
        throw std::out_of_range("service time " + std::to_string(service) +
                                " outside configured range");
      }

      out.wait_times.push_back(wait_of(c, t));
      out.calls_served++;
    }

    out.queue_length_series.push_back(static_cast<uint32_t>(queue.size()));
    out.busy_steps_total += servers.busy_count();
  }

  out.summary.avg_wait = mean_wait(out.wait_times);
  out.summary.max_queue = max_length(out.queue_length_series);
  out.summary.throughput = out.calls_served;
  out.summary.utilization = utilization(out.busy_steps_total, cfg_.num_agents, cfg_.sim_steps);
  return out;
}

} // namespace ccsim

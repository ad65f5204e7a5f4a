#include "ccsim/scenario.hpp"

namespace ccsim {

std::string_view to_string(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::None:                   return "NONE";
    case ConfigError::NonPositiveAgents:      return "NON_POSITIVE_AGENTS";
    case ConfigError::NonPositiveSteps:       return "NON_POSITIVE_STEPS";
    case ConfigError::NonPositiveServiceTime: return "NON_POSITIVE_SERVICE_TIME";
    case ConfigError::ServiceRangeInverted:   return "SERVICE_RANGE_INVERTED";
    case ConfigError::ArrivalProbOutOfRange:  return "ARRIVAL_PROB_OUT_OF_RANGE";
  }
  return "UNKNOWN";
}

ConfigDecision validate(const ScenarioConfig& cfg) noexcept {
  ConfigDecision d{};

  if (cfg.num_agents <= 0) {
    d.accept = false;
    d.reason = ConfigError::NonPositiveAgents;
    return d;
  }

  if (cfg.sim_steps <= 0) {
    d.accept = false;
    d.reason = ConfigError::NonPositiveSteps;
    return d;
  }

  if (cfg.service_time.min <= 0) {
    d.accept = false;
    d.reason = ConfigError::NonPositiveServiceTime;
    return d;
  }
  if (cfg.service_time.min > cfg.service_time.max) {
    d.accept = false;
    d.reason = ConfigError::ServiceRangeInverted;
    return d;
  }

  // NaN fails both comparisons, so test for the accepted interval
  if (!(cfg.arrival_prob_per_step >= 0.0 && cfg.arrival_prob_per_step <= 1.0)) {
    d.accept = false;
    d.reason = ConfigError::ArrivalProbOutOfRange;
    return d;
  }

  return d;
}

InvalidConfiguration::InvalidConfiguration(ConfigError reason, const std::string& label)
  : std::invalid_argument("invalid scenario '" + label + "': " + std::string(to_string(reason))),
    reason_(reason) {}

void require_valid(const ScenarioConfig& cfg) {
  const auto d = validate(cfg);
  if (!d.accept) throw InvalidConfiguration(d.reason, cfg.label);
}

ScenarioConfig make_scenario(int32_t num_agents, double arrival_prob,
                             ServiceTimeRange service, Step sim_steps) {
  ScenarioConfig c{};
  c.num_agents = num_agents;
  c.arrival_prob_per_step = arrival_prob;
  c.service_time = service;
  c.sim_steps = sim_steps;
  c.label = std::to_string(num_agents) + "_agents";
  return c;
}

std::vector<ScenarioConfig> default_scenarios() {
  const ServiceTimeRange service{3, 7};
  return {
    make_scenario(3, 0.5, service, 2000),
    make_scenario(4, 0.5, service, 2000),
    make_scenario(5, 0.5, service, 2000),
  };
}

} // namespace ccsim

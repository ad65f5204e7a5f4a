#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ccsim/types.hpp"

namespace ccsim {

struct ServiceTimeRange {
  Duration min{3};
  Duration max{7};
};

struct ScenarioConfig {
  int32_t num_agents{3};
  double  arrival_prob_per_step{0.5};
  ServiceTimeRange service_time{};
  Step    sim_steps{2000};
  std::string label{};
};

enum class ConfigError : uint8_t {
  None = 0,
  NonPositiveAgents,
  NonPositiveSteps,
  NonPositiveServiceTime,
  ServiceRangeInverted,
  ArrivalProbOutOfRange
};

struct ConfigDecision {
  bool accept{true};
  ConfigError reason{ConfigError::None};
};

std::string_view to_string(ConfigError e) noexcept;

ConfigDecision validate(const ScenarioConfig& cfg) noexcept;

class InvalidConfiguration : public std::invalid_argument {
public:
  InvalidConfiguration(ConfigError reason, const std::string& label);

  ConfigError reason() const noexcept { return reason_; }

private:
  ConfigError reason_;
};

// Throws InvalidConfiguration if validate() rejects cfg
void require_valid(const ScenarioConfig& cfg);

// 3, 4 and 5 agents at 0.5 arrivals/step, 3..7 s service, 2000 steps
std::vector<ScenarioConfig> default_scenarios();

ScenarioConfig make_scenario(int32_t num_agents, double arrival_prob,
                             ServiceTimeRange service, Step sim_steps);

} // namespace ccsim

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "ccsim/scenario.hpp"

TEST(Scenario, DefaultsAreAccepted) {
  ccsim::ScenarioConfig cfg{};
  auto d = ccsim::validate(cfg);
  EXPECT_TRUE(d.accept);
  EXPECT_EQ(d.reason, ccsim::ConfigError::None);
}

TEST(Scenario, RejectInvalidConfigsWithReason) {
  ccsim::ScenarioConfig cfg{};
  cfg.num_agents = 0;
  EXPECT_EQ(ccsim::validate(cfg).reason, ccsim::ConfigError::NonPositiveAgents);

  cfg = {};
  cfg.sim_steps = -5;
  EXPECT_EQ(ccsim::validate(cfg).reason, ccsim::ConfigError::NonPositiveSteps);

  cfg = {};
  cfg.service_time = {0, 4};
  EXPECT_EQ(ccsim::validate(cfg).reason, ccsim::ConfigError::NonPositiveServiceTime);

  cfg = {};
  cfg.service_time = {7, 3};
  auto d = ccsim::validate(cfg);
  EXPECT_FALSE(d.accept);
  EXPECT_EQ(d.reason, ccsim::ConfigError::ServiceRangeInverted);

  cfg = {};
  cfg.arrival_prob_per_step = 1.5;
  EXPECT_EQ(ccsim::validate(cfg).reason, ccsim::ConfigError::ArrivalProbOutOfRange);

  cfg.arrival_prob_per_step = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(ccsim::validate(cfg).reason, ccsim::ConfigError::ArrivalProbOutOfRange);
}

TEST(Scenario, BoundaryValuesAreAccepted) {
  ccsim::ScenarioConfig cfg{};
  cfg.num_agents = 1;
  cfg.sim_steps = 1;
  cfg.service_time = {1, 1};
  cfg.arrival_prob_per_step = 0.0;
  EXPECT_TRUE(ccsim::validate(cfg).accept);

  cfg.arrival_prob_per_step = 1.0;
  EXPECT_TRUE(ccsim::validate(cfg).accept);
}

TEST(Scenario, RequireValidThrowsWithReasonAndLabel) {
  ccsim::ScenarioConfig cfg{};
  cfg.num_agents = -1;
  cfg.label = "broken";

  try {
    ccsim::require_valid(cfg);
    FAIL() << "expected InvalidConfiguration";
  } catch (const ccsim::InvalidConfiguration& e) {
    EXPECT_EQ(e.reason(), ccsim::ConfigError::NonPositiveAgents);
    EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("NON_POSITIVE_AGENTS"), std::string::npos);
  }
}

TEST(Scenario, DefaultExperimentHasThreeFourFiveAgents) {
  auto s = ccsim::default_scenarios();
  ASSERT_EQ(s.size(), 3u);

  EXPECT_EQ(s[0].num_agents, 3);
  EXPECT_EQ(s[1].num_agents, 4);
  EXPECT_EQ(s[2].num_agents, 5);
  EXPECT_EQ(s[0].label, "3_agents");
  EXPECT_EQ(s[2].label, "5_agents");

  for (const auto& c : s) {
    EXPECT_DOUBLE_EQ(c.arrival_prob_per_step, 0.5);
    EXPECT_EQ(c.service_time.min, 3);
    EXPECT_EQ(c.service_time.max, 7);
    EXPECT_EQ(c.sim_steps, 2000);
    EXPECT_TRUE(ccsim::validate(c).accept);
  }
}

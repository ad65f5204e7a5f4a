#include <gtest/gtest.h>

#include <vector>

#include "ccsim/metrics.hpp"

TEST(Metrics, EmptyReductionsAreZero) {
  std::vector<ccsim::Step> waits;
  std::vector<uint32_t> series;

  EXPECT_DOUBLE_EQ(ccsim::mean_wait(waits), 0.0);
  EXPECT_EQ(ccsim::max_length(series), 0u);
  EXPECT_DOUBLE_EQ(ccsim::utilization(0, 3, 100), 0.0);
}

TEST(Metrics, Reductions) {
  std::vector<ccsim::Step> waits{0, 1, 2, 5};
  std::vector<uint32_t> series{0, 3, 1, 2};

  EXPECT_DOUBLE_EQ(ccsim::mean_wait(waits), 2.0);
  EXPECT_EQ(ccsim::max_length(series), 3u);
  EXPECT_DOUBLE_EQ(ccsim::utilization(150, 3, 100), 0.5);
  EXPECT_DOUBLE_EQ(ccsim::to_percent(0.25), 25.0);
}

TEST(Metrics, ImprovementAgainstBaseline) {
  EXPECT_DOUBLE_EQ(ccsim::improvement_pct(2.0, 1.0), 50.0);
  EXPECT_DOUBLE_EQ(ccsim::improvement_pct(2.0, 2.0), 0.0);
  EXPECT_DOUBLE_EQ(ccsim::improvement_pct(1.0, 1.5), -50.0);
  EXPECT_DOUBLE_EQ(ccsim::improvement_pct(0.0, 1.0), 0.0);
}

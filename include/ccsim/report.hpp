#pragma once
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "ccsim/experiment.hpp"

namespace ccsim {

// "  avg_wait=0.42s, max_queue=7, throughput=998, utilization=83.1%"
void print_outcome(std::ostream& os, const ScenarioOutcome& o);

// Average wait per scenario with improvement against the first one
void print_comparison(std::ostream& os, const std::vector<ScenarioOutcome>& outcomes);

// Quotes s per RFC 4180 when it holds a comma, quote or line break
std::string csv_field(std::string_view s);

// Bar-chart data: label,num_agents,avg_wait,max_queue,throughput,utilization
void write_summary_csv(const std::filesystem::path& path,
                       const std::vector<ScenarioOutcome>& outcomes);

// Line-chart data: step,<label>... one row per step
void write_queue_series_csv(const std::filesystem::path& path,
                            const std::vector<ScenarioOutcome>& outcomes);

struct ChartFiles {
  std::filesystem::path summary;
  std::filesystem::path queue_series;
};

// Writes summary.csv and queue_series.csv under dir (created if missing).
// Throws std::runtime_error when a file cannot be written.
ChartFiles export_chart_data(const std::filesystem::path& dir,
                             const std::vector<ScenarioOutcome>& outcomes);

} // namespace ccsim

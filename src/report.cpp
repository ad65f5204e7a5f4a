#include "ccsim/report.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

#include "ccsim/metrics.hpp"

namespace ccsim {

namespace {

std::ofstream open_csv(const std::filesystem::path& path) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("open " + path.string() + " failed");
  return f;
}

void finish_csv(std::ofstream& f, const std::filesystem::path& path) {
  f.flush();
  if (!f) throw std::runtime_error("write " + path.string() + " failed");
}

} // namespace

std::string csv_field(std::string_view s) {
  if (s.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(s);
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void print_outcome(std::ostream& os, const ScenarioOutcome& o) {
  const auto& s = o.result.summary;
  const auto flags = os.flags();
  const auto prec = os.precision();

  os << "Running " << o.config.label << "...\n";
  os << std::fixed
     << "  avg_wait=" << std::setprecision(2) << s.avg_wait << "s"
     << ", max_queue=" << s.max_queue
     << ", throughput=" << s.throughput
     << ", utilization=" << std::setprecision(1) << to_percent(s.utilization) << "%\n\n";

  os.flags(flags);
  os.precision(prec);
}

void print_comparison(std::ostream& os, const std::vector<ScenarioOutcome>& outcomes) {
  if (outcomes.empty()) return;

  const auto flags = os.flags();
  const auto prec = os.precision();
  const auto gains = wait_improvements(outcomes);

  os << "Simple comparison:\n" << std::fixed;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const auto& o = outcomes[i];
    os << "  " << o.config.num_agents << " agents avg wait = "
       << std::setprecision(2) << o.result.summary.avg_wait << "s";
    if (i > 0) os << " (" << std::setprecision(1) << gains[i] << "% improvement)";
    os << "\n";
  }

  os.flags(flags);
  os.precision(prec);
}

void write_summary_csv(const std::filesystem::path& path,
                       const std::vector<ScenarioOutcome>& outcomes) {
  auto f = open_csv(path);
  f << "label,num_agents,avg_wait,max_queue,throughput,utilization\n";
  f << std::setprecision(6);
  for (const auto& o : outcomes) {
    const auto& s = o.result.summary;
    f << csv_field(o.config.label) << "," << o.config.num_agents << ","
      << s.avg_wait << "," << s.max_queue << ","
      << s.throughput << "," << s.utilization << "\n";
  }
  finish_csv(f, path);
}

void write_queue_series_csv(const std::filesystem::path& path,
                            const std::vector<ScenarioOutcome>& outcomes) {
  auto f = open_csv(path);

  f << "step";
  std::size_t rows = 0;
  for (const auto& o : outcomes) {
    f << "," << csv_field(o.config.label);
    rows = std::max(rows, o.result.queue_length_series.size());
  }
  f << "\n";

  for (std::size_t t = 0; t < rows; ++t) {
    f << t;
    for (const auto& o : outcomes) {
      f << ",";
      const auto& q = o.result.queue_length_series;
      if (t < q.size()) f << q[t];
    }
    f << "\n";
  }
  finish_csv(f, path);
}

ChartFiles export_chart_data(const std::filesystem::path& dir,
                             const std::vector<ScenarioOutcome>& outcomes) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());

  ChartFiles files{dir / "summary.csv", dir / "queue_series.csv"};
  write_summary_csv(files.summary, outcomes);
  write_queue_series_csv(files.queue_series, outcomes);
  return files;
}

} // namespace ccsim

#include "ccsim/cli.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>

#include "ccsim/report.hpp"

namespace ccsim {

namespace {

// Whole-token unsigned parse: rejects signs, blanks, trailing junk and overflow
template <typename T>
std::optional<T> parse_unsigned(std::string_view s) {
  if (s.empty() || s.front() == '-' || s.front() == '+') return std::nullopt;
  T v{};
  const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<double> parse_probability(std::string_view s) {
  if (s.empty()) return std::nullopt;
  double v{};
  const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<std::vector<int32_t>> parse_agents(std::string_view s) {
  std::vector<int32_t> out;
  while (!s.empty()) {
    const auto comma = s.find(',');
    const auto item = s.substr(0, comma);
    if (!item.empty()) {
      auto n = parse_unsigned<uint32_t>(item);
      if (!n || *n > static_cast<uint32_t>(INT32_MAX)) return std::nullopt;
      out.push_back(static_cast<int32_t>(*n));
    }
    if (comma == std::string_view::npos) break;
    s.remove_prefix(comma + 1);
  }
  return out;
}

CliParse fail(std::string msg) {
  CliParse r{};
  r.ok = false;
  r.error = std::move(msg);
  return r;
}

std::string bad_value(std::string_view flag, std::string_view value, std::string_view want) {
  return "invalid value '" + std::string(value) + "' for " + std::string(flag) +
         " (expected " + std::string(want) + ")";
}

} // namespace

CliParse parse_cli(std::span<const std::string_view> args) {
  CliParse r{};
  auto& o = r.options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view a = args[i];

    if (a == "--independent-seeds") { o.experiment.common_random_numbers = false; continue; }
    if (a == "--no-export") { o.do_export = false; continue; }
    if (a == "--help" || a == "-h") { o.show_help = true; continue; }

    const bool takes_value =
        a == "--agents" || a == "--arrival" || a == "--service-min" || a == "--service-max" ||
        a == "--steps" || a == "--seed" || a == "--threads" || a == "--out";
    if (!takes_value) return fail("unknown option: " + std::string(a));
    if (i + 1 >= args.size()) return fail("missing value for " + std::string(a));

    const std::string_view v = args[++i];

    if (a == "--agents") {
      auto list = parse_agents(v);
      if (!list) return fail(bad_value(a, v, "comma-separated non-negative integers"));
      if (list->empty()) return fail("empty agent list for --agents");
      auto sorted = *list;
      std::sort(sorted.begin(), sorted.end());
      if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
        return fail("duplicate agent count in --agents " + std::string(v));
      o.agents = std::move(*list);
    } else if (a == "--arrival") {
      auto p = parse_probability(v);
      if (!p) return fail(bad_value(a, v, "a number"));
      o.arrival = *p;
    } else if (a == "--service-min" || a == "--service-max") {
      auto n = parse_unsigned<uint32_t>(v);
      if (!n || *n > static_cast<uint32_t>(INT32_MAX)) return fail(bad_value(a, v, "a non-negative integer"));
      (a == "--service-min" ? o.service.min : o.service.max) = static_cast<Duration>(*n);
    } else if (a == "--steps") {
      auto n = parse_unsigned<uint64_t>(v);
      if (!n || *n > static_cast<uint64_t>(INT64_MAX)) return fail(bad_value(a, v, "a non-negative integer"));
      o.steps = static_cast<Step>(*n);
    } else if (a == "--seed") {
      auto n = parse_unsigned<uint64_t>(v);
      if (!n) return fail(bad_value(a, v, "a non-negative integer"));
      o.experiment.seed = *n;
    } else if (a == "--threads") {
      auto n = parse_unsigned<std::size_t>(v);
      if (!n || *n == 0) return fail(bad_value(a, v, "a positive integer"));
      o.experiment.threads = *n;
    } else {
      if (v.empty()) return fail("empty path for --out");
      o.out_dir = std::filesystem::path(std::string(v));
    }
  }

  return r;
}

std::vector<ScenarioConfig> make_scenarios(const CliOptions& opts) {
  std::vector<ScenarioConfig> out;
  out.reserve(opts.agents.size());
  for (auto n : opts.agents) out.push_back(make_scenario(n, opts.arrival, opts.service, opts.steps));
  return out;
}

void print_usage(std::ostream& os) {
  os << "Usage: ccsim_cli [options]\n"
     << "  --agents CSV         Agent count per scenario (default 3,4,5)\n"
     << "  --arrival P          Arrival probability per step (default 0.5)\n"
     << "  --service-min N      Shortest call in steps (default 3)\n"
     << "  --service-max N      Longest call in steps (default 7)\n"
     << "  --steps N            Simulated steps, 1 step = 1s (default 2000)\n"
     << "  --seed S             RNG seed (default 42)\n"
     << "  --threads N          Worker threads across scenarios (default 1)\n"
     << "  --independent-seeds  Scenario i uses seed + i instead of a shared seed\n"
     << "  --out DIR            Chart data directory (default .)\n"
     << "  --no-export          Skip writing chart data\n";
}

int run_cli(std::span<const std::string_view> args, std::ostream& out, std::ostream& err) {
  const auto parsed = parse_cli(args);
  if (!parsed.ok) {
    err << "Error: " << parsed.error << "\n";
    print_usage(err);
    return 1;
  }

  const auto& opts = parsed.options;
  if (opts.show_help) {
    print_usage(out);
    return 0;
  }

  try {
    auto outcomes = run_experiment(make_scenarios(opts), opts.experiment);

    for (const auto& o : outcomes) print_outcome(out, o);
    print_comparison(out, outcomes);

    if (opts.do_export) {
      auto files = export_chart_data(opts.out_dir, outcomes);
      out << "Saved " << files.summary.string() << "\n"
          << "Saved " << files.queue_series.string() << "\n";
    }
  } catch (const std::exception& ex) {
    err << "Error: " << ex.what() << "\n";
    return 1;
  }

  return 0;
}

} // namespace ccsim

#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ccsim/experiment.hpp"
#include "ccsim/scenario.hpp"

namespace ccsim {

struct CliOptions {
  std::vector<int32_t> agents{3, 4, 5};
  double arrival{0.5};
  ServiceTimeRange service{3, 7};
  Step steps{2000};
  ExperimentOptions experiment{};
  std::filesystem::path out_dir{"."};
  bool do_export{true};
  bool show_help{false};
};

struct CliParse {
  bool ok{true};
  CliOptions options{};
  std::string error{};   // set when !ok
};

// args excludes the program name
CliParse parse_cli(std::span<const std::string_view> args);

// One scenario per agent count
std::vector<ScenarioConfig> make_scenarios(const CliOptions& opts);

void print_usage(std::ostream& os);

// Parse, run, report and export. Returns the process exit code (0 ok, 1 error).
int run_cli(std::span<const std::string_view> args, std::ostream& out, std::ostream& err);

} // namespace ccsim

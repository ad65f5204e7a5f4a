#include <iostream>
#include <string_view>
#include <vector>

#include "ccsim/cli.hpp"

int main(int argc, char** argv) {
  std::vector<std::string_view> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

  return ccsim::run_cli(args, std::cout, std::cerr);
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "ccsim/rng.hpp"

namespace ccsim::testing {

// Replays a fixed arrival pattern and fixed service times.
// Past the end of the script: no arrivals, service = lo.
class ScriptedSource final : public RandomSource {
public:
  ScriptedSource(std::vector<bool> arrivals, std::vector<int32_t> services)
    : arrivals_(std::move(arrivals)), services_(std::move(services)) {}

  double uniform01() override {
    const std::size_t i = uniform_draws_++;
    return (i < arrivals_.size() && arrivals_[i]) ? 0.0 : 0.999999;
  }

  int32_t uniform_int(int32_t lo, int32_t /*hi*/) override {
    const std::size_t i = int_draws_++;
    return i < services_.size() ? services_[i] : lo;
  }

  std::size_t uniform_draws() const noexcept { return uniform_draws_; }
  std::size_t int_draws() const noexcept { return int_draws_; }

private:
  std::vector<bool> arrivals_;
  std::vector<int32_t> services_;
  std::size_t uniform_draws_{0};
  std::size_t int_draws_{0};
};

} // namespace ccsim::testing

#pragma once
#include <cstdint>
#include <random>

#include "ccsim/types.hpp"

namespace ccsim {

// Source of randomness for a single run. Injected so tests can script draws.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform [0,1)
  virtual double uniform01() = 0;

  // Uniform integer in [lo, hi]
  virtual int32_t uniform_int(int32_t lo, int32_t hi) = 0;
};

// Reproducible RNG (Mersenne Twister 64), one instance per run
class Rng final : public RandomSource {
public:
  explicit Rng(uint64_t seed) : eng_(seed) {}

  double uniform01() override { return uni_(eng_); }

  int32_t uniform_int(int32_t lo, int32_t hi) override {
    std::uniform_int_distribution<int32_t> d(lo, hi);
    return d(eng_);
  }

private:
  std::mt19937_64 eng_;
  std::uniform_real_distribution<double> uni_{0.0, 1.0};
};

} // namespace ccsim

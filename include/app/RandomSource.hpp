#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

namespace ssample::app {

// Randomness used by the reservoir. Swappable so tests can force
// admission and eviction decisions.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform real in [0, 1).
  [[nodiscard]] virtual double uniform01() = 0;

  // Uniform integer in [0, n). n > 0.
  [[nodiscard]] virtual size_t pick(size_t n) = 0;
};

// Default source: mt19937_64 seeded from random_device mixed with the clock,
// so two runs never share a seed in practice.
class MersenneSource final : public RandomSource {
public:
  MersenneSource();
  explicit MersenneSource(uint64_t seed) : gen_(seed) {}

  [[nodiscard]] double uniform01() override;
  [[nodiscard]] size_t pick(size_t n) override;

private:
  std::mt19937_64 gen_;
};

} // namespace ssample::app

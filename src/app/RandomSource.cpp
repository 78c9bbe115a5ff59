#include "app/RandomSource.hpp"
#include <chrono>

namespace ssample::app {

static uint64_t entropy_seed() {
  std::random_device rd;
  uint64_t hi = static_cast<uint64_t>(rd()) << 32;
  uint64_t lo = static_cast<uint64_t>(rd());
  auto ticks = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return (hi | lo) ^ (ticks * 0x9E3779B97F4A7C15ULL);
}

MersenneSource::MersenneSource() : gen_(entropy_seed()) {}

double MersenneSource::uniform01() {
  return std::uniform_real_distribution<double>(0.0, 1.0)(gen_);
}

size_t MersenneSource::pick(size_t n) {
  return std::uniform_int_distribution<size_t>(0, n - 1)(gen_);
}

} // namespace ssample::app

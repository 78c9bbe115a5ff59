#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "app/RandomSource.hpp"
#include "model/Sample.hpp"

namespace ssample::app {

// Fixed-capacity uniform sample over a stream of lines (Algorithm R).
// One writer calls admit(); any number of readers may call snapshot()
// concurrently. Every access goes through the same mutex, held for a
// single operation only.
class Reservoir {
public:
  // Throws std::invalid_argument if capacity is 0.
  explicit Reservoir(size_t capacity,
                     std::unique_ptr<RandomSource> rng = std::make_unique<MersenneSource>());
  Reservoir(const Reservoir&) = delete;
  Reservoir& operator=(const Reservoir&) = delete;

  // Offer one line. Fills the reservoir until capacity, then keeps the
  // line with probability capacity/(seen+1), evicting a uniform slot.
  void admit(std::string line);

  [[nodiscard]] uint64_t seen() const;
  [[nodiscard]] size_t capacity() const { return capacity_; }

  // Entries and seen count captured under one lock, sorted by line number
  // after the lock is released.
  [[nodiscard]] model::SampleSnapshot snapshot() const;

private:
  static constexpr size_t kInitialReserve = 4096;

  const size_t capacity_;
  mutable std::mutex mu_;
  std::vector<model::SampleEntry> entries_;
  uint64_t seen_{0};
  std::unique_ptr<RandomSource> rng_;
};

} // namespace ssample::app

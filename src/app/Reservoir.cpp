#include "app/Reservoir.hpp"
#include <algorithm>
#include <stdexcept>

namespace ssample::app {

Reservoir::Reservoir(size_t capacity, std::unique_ptr<RandomSource> rng)
    : capacity_(capacity), rng_(std::move(rng)) {
  if (capacity_ == 0) throw std::invalid_argument("reservoir capacity must be positive");
  if (!rng_) throw std::invalid_argument("reservoir needs a random source");
  entries_.reserve(std::min(capacity_, kInitialReserve));
}

void Reservoir::admit(std::string line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (entries_.size() < capacity_) {
    entries_.push_back(model::SampleEntry{std::move(line), seen_});
  } else {
    // seen_ is the index of this line; it is the (seen_+1)-th line observed.
    double keep_p = static_cast<double>(capacity_) / static_cast<double>(seen_ + 1);
    if (rng_->uniform01() < keep_p) {
      auto& slot = entries_[rng_->pick(capacity_)];
      slot.line = std::move(line);
      slot.line_number = seen_;
    }
  }
  ++seen_;
}

uint64_t Reservoir::seen() const {
  std::lock_guard<std::mutex> lk(mu_);
  return seen_;
}

model::SampleSnapshot Reservoir::snapshot() const {
  model::SampleSnapshot out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    out.entries = entries_;
    out.seen = seen_;
  }
  std::sort(out.entries.begin(), out.entries.end(),
            [](const model::SampleEntry& a, const model::SampleEntry& b) {
              return a.line_number < b.line_number;
            });
  return out;
}

} // namespace ssample::app

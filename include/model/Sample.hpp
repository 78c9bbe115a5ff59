#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ssample::model {

struct SampleEntry {
  std::string line;
  uint64_t line_number{}; // 0-based position in the input stream
};

// Point-in-time copy of the reservoir, ascending by line_number.
struct SampleSnapshot {
  std::vector<SampleEntry> entries;
  uint64_t seen{};
};

} // namespace ssample::model

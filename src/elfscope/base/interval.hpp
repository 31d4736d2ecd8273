#pragma once

#include <cstdint>
#include <limits>

namespace elfscope::base {

constexpr bool range_contains(uint64_t start, uint64_t end, uint64_t address) {
  return address >= start && address < end;
}

inline uint64_t range_end_saturating(uint64_t start, uint64_t size) {
  const uint64_t end = start + size;
  if (end < start) {
    return std::numeric_limits<uint64_t>::max();
  }
  return end;
}

// true when [offset, offset + size) lies inside a buffer of `total` bytes
constexpr bool span_fits(uint64_t offset, uint64_t size, uint64_t total) {
  return offset <= total && size <= total - offset;
}

} // namespace elfscope::base

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <type_traits>

#include "elfscope/base/interval.hpp"

namespace elfscope::elf {

// bounds-checked read-only window over file bytes or live process memory
class byte_view {
public:
  byte_view() = default;
  byte_view(const uint8_t* data, size_t size) : data_(data), size_(data ? size : 0) {}

  // wraps already-mapped memory without copying
  static byte_view from_memory(uintptr_t address, size_t size) {
    return byte_view(reinterpret_cast<const uint8_t*>(address), size);
  }

  const uint8_t* data() const noexcept { return data_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  uintptr_t address() const noexcept { return reinterpret_cast<uintptr_t>(data_); }

  bool contains(uint64_t offset, uint64_t length) const noexcept {
    return base::span_fits(offset, length, size_);
  }

  template <typename T> std::optional<T> read(uint64_t offset) const {
    static_assert(std::is_trivially_copyable_v<T>, "byte_view::read needs a trivially copyable type");
    if (!contains(offset, sizeof(T))) {
      return std::nullopt;
    }
    T value;
    std::memcpy(&value, data_ + offset, sizeof(T));
    return value;
  }

  byte_view sub(uint64_t offset, uint64_t length) const {
    if (!contains(offset, length)) {
      return {};
    }
    return byte_view(data_ + offset, static_cast<size_t>(length));
  }

  // nul-terminated string starting at offset; nullopt when unterminated inside the view
  std::optional<std::string_view> c_string(uint64_t offset) const {
    if (offset >= size_) {
      return std::nullopt;
    }
    const auto* start = reinterpret_cast<const char*>(data_ + offset);
    const size_t remaining = size_ - static_cast<size_t>(offset);
    const void* terminator = std::memchr(start, '\0', remaining);
    if (!terminator) {
      return std::nullopt;
    }
    return std::string_view(start, static_cast<size_t>(static_cast<const char*>(terminator) - start));
  }

private:
  const uint8_t* data_ = nullptr;
  size_t size_ = 0;
};

} // namespace elfscope::elf

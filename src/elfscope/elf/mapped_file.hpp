#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <redlog.hpp>

#include "elfscope/base/error.hpp"
#include "elfscope/elf/byte_view.hpp"

namespace elfscope::elf {

// read-only private mapping of a whole file; the view starts at `offset`
class mapped_file {
public:
  mapped_file() = default;
  ~mapped_file();

  mapped_file(const mapped_file&) = delete;
  mapped_file& operator=(const mapped_file&) = delete;
  mapped_file(mapped_file&& other) noexcept;
  mapped_file& operator=(mapped_file&& other) noexcept;

  static base::result<mapped_file> open(const std::string& path, uint64_t offset = 0);

  bool is_open() const noexcept { return mapping_ != nullptr; }
  const std::string& path() const noexcept { return path_; }
  uint64_t offset() const noexcept { return offset_; }
  size_t file_size() const noexcept { return mapping_size_; }

  byte_view view() const noexcept { return view_; }

  void reset() noexcept;

private:
  void* mapping_ = nullptr;
  size_t mapping_size_ = 0;
  uint64_t offset_ = 0;
  std::string path_;
  byte_view view_{};
};

} // namespace elfscope::elf

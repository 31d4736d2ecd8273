#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "elfscope/base/error.hpp"
#include "elfscope/elf/byte_view.hpp"
#include "elfscope/elf/elf_image.hpp"

namespace elfscope::elf {

constexpr const char* debug_data_section_name = ".gnu_debugdata";

// decompressed mini elf recovered from .gnu_debugdata; owns the bytes its image points into
class debug_image {
public:
  debug_image() = default;
  debug_image(const debug_image&) = delete;
  debug_image& operator=(const debug_image&) = delete;
  debug_image(debug_image&&) noexcept = default;
  debug_image& operator=(debug_image&&) noexcept = default;

  const elf_image& image() const noexcept { return image_; }
  size_t size() const noexcept { return bytes_.size(); }

  // the inner .symtab
  symbol_source symbols() const { return image_.regular_symbols(); }

private:
  friend base::result<debug_image> extract_debug_data(const elf_image& image, size_t max_output_size);

  std::vector<uint8_t> bytes_;
  elf_image image_;
};

// xz stream (concatenated streams allowed) into memory, failing once output exceeds max_output_size
base::result<std::vector<uint8_t>> decompress_xz(byte_view compressed, size_t max_output_size);

// no_debug_data when the section is absent; corrupt_debug_data when it cannot be decoded or parsed
base::result<debug_image> extract_debug_data(const elf_image& image, size_t max_output_size);

// same, bounded by the configured ELFSCOPE_MAX_DEBUG_DATA_SIZE
base::result<debug_image> extract_debug_data(const elf_image& image);

} // namespace elfscope::elf

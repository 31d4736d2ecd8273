#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "elfscope/base/error.hpp"
#include "elfscope/elf/byte_view.hpp"
#include "elfscope/elf/elf_types.hpp"

namespace elfscope::elf {

/**
 * @brief class-independent view of one elf image
 *
 * The image does not own its bytes. Section names and symbol names returned by it point into
 * the parsed view, so the view must outlive the image and everything read from it.
 */
class elf_image {
public:
  elf_image() = default;

  // an image laid out as in its file
  static base::result<elf_image> parse(byte_view view);
  // a mapped image; the view starts at the lowest loaded page and vaddr = address - load_bias
  static base::result<elf_image> parse_loaded(byte_view view, uint64_t load_bias);

  elf_class cls() const noexcept { return cls_; }
  uint16_t machine() const noexcept { return machine_; }
  uint16_t type() const noexcept { return type_; }
  layout kind() const noexcept { return layout_; }
  byte_view view() const noexcept { return view_; }

  const std::vector<segment>& segments() const noexcept { return segments_; }
  const dynamic_info& dynamic() const noexcept { return dynamic_; }
  bool has_section_headers() const noexcept { return !sections_.empty(); }

  const section* section_by_name(std::string_view name) const;
  const section* section_by_type(uint32_t type) const;
  byte_view section_data(const section& sec) const;

  // view offset for a virtual address covered by a load segment
  std::optional<uint64_t> vaddr_to_offset(uint64_t vaddr) const;
  byte_view vaddr_view(uint64_t vaddr, uint64_t size) const;
  // from vaddr to the end of its load segment
  byte_view vaddr_tail(uint64_t vaddr) const;

  // virtual address of file offset 0, which is where a memory view starts
  uint64_t image_vaddr() const noexcept { return image_vaddr_; }

  std::vector<uint8_t> build_id() const;
  std::vector<std::string> needed() const;
  std::string soname() const;

  symbol_source dynamic_symbols() const;
  symbol_source regular_symbols() const;

private:
  static base::result<elf_image> parse_view(byte_view view, layout kind, uint64_t image_vaddr);

  base::status parse_segments(uint64_t phoff, uint16_t phnum, uint16_t phentsize);
  base::status parse_sections(uint64_t shoff, uint16_t shnum, uint16_t shentsize, uint16_t shstrndx);
  void parse_dynamic();

  base::error_code range_error() const noexcept;
  const segment* load_segment_for(uint64_t vaddr) const;
  uint64_t normalize_dynamic_pointer(uint64_t pointer) const;
  byte_view dynamic_strings() const;
  std::optional<size_t> dynamic_symbol_count() const;
  symbol_source section_symbols(uint32_t type) const;

  byte_view view_{};
  layout layout_ = layout::file;
  elf_class cls_ = elf_class::elf64;
  uint16_t machine_ = EM_NONE;
  uint16_t type_ = ET_NONE;
  uint64_t image_vaddr_ = 0;
  std::vector<segment> segments_;
  std::vector<section> sections_;
  dynamic_info dynamic_{};
};

} // namespace elfscope::elf

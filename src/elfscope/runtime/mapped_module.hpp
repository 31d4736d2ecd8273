#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <link.h>

#include "elfscope/elf/elf_types.hpp"

namespace elfscope::runtime {

struct load_segment {
  uint64_t vaddr = 0;
  uint64_t offset = 0;
  uint64_t file_size = 0;
  uint64_t mem_size = 0;
  uint32_t flags = 0;
};

// one loaded elf image as seen at snapshot time; a changed process produces a new value
struct mapped_module {
  std::string path;
  uintptr_t base = 0;
  uintptr_t load_bias = 0;
  size_t size = 0;
  elf::elf_class cls = elf::elf_class::elf64;
  std::vector<load_segment> segments;
  const ElfW(Phdr)* phdr = nullptr;
  size_t phnum = 0;
  std::vector<uint8_t> build_id;
  uint64_t generation = 0;
  bool is_main_image = false;
  bool is_linker = false;

  uintptr_t end() const noexcept { return base + size; }
  std::string_view name() const;

  // true when address falls inside one of the load segments
  bool contains(uintptr_t address) const noexcept;
};

// builds the record from a loader entry; path is taken from dlpi_name as given
bool describe_module(const dl_phdr_info& info, mapped_module& out);

} // namespace elfscope::runtime

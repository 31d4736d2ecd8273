#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <elf.h>

#include "elfscope/elf/byte_view.hpp"

namespace elfscope::elf {

// gnu extensions, spelled out because not every libc elf.h carries them
constexpr uint8_t symbol_type_gnu_ifunc = 10;
constexpr int64_t dynamic_tag_gnu_hash = 0x6ffffef5;
constexpr uint32_t note_type_gnu_build_id = 3;

enum class elf_class : uint8_t { elf32 = ELFCLASS32, elf64 = ELFCLASS64 };

// file: offsets index the view; memory: virtual addresses index the view relative to the load bias
enum class layout { file, memory };

struct segment {
  uint32_t type = 0;
  uint32_t flags = 0;
  uint64_t offset = 0;
  uint64_t vaddr = 0;
  uint64_t file_size = 0;
  uint64_t mem_size = 0;
  uint64_t align = 0;

  bool is_load() const noexcept { return type == PT_LOAD; }
  bool readable() const noexcept { return (flags & PF_R) != 0; }
  bool executable() const noexcept { return (flags & PF_X) != 0; }
};

struct section {
  std::string_view name;
  uint32_t type = 0;
  uint64_t flags = 0;
  uint64_t addr = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  uint64_t entry_size = 0;
  uint32_t link = 0;
  uint32_t info = 0;
};

struct dynamic_info {
  bool present = false;
  uint64_t symtab = 0;
  uint64_t strtab = 0;
  uint64_t strsz = 0;
  uint64_t syment = 0;
  uint64_t hash = 0;
  uint64_t gnu_hash = 0;
  std::optional<uint64_t> soname;
  std::vector<uint64_t> needed;
};

struct symbol_record {
  std::string_view name;
  uint64_t value = 0;
  uint64_t size = 0;
  uint8_t type = STT_NOTYPE;
  uint8_t binding = STB_LOCAL;
  uint8_t other = 0;
  uint16_t section_index = SHN_UNDEF;

  bool defined() const noexcept { return section_index != SHN_UNDEF; }
};

// one raw symbol array plus its string table
struct symbol_source {
  byte_view symbols;
  byte_view strings;
  size_t count = 0;
  size_t entry_size = 0;
  elf_class cls = elf_class::elf64;
  uint16_t machine = EM_NONE;

  bool valid() const noexcept { return count > 0 && entry_size > 0 && !symbols.empty(); }

  std::optional<symbol_record> at(size_t index) const {
    if (index >= count) {
      return std::nullopt;
    }

    const uint64_t offset = static_cast<uint64_t>(index) * entry_size;
    symbol_record record;
    uint32_t name_offset = 0;
    if (cls == elf_class::elf64) {
      auto raw = symbols.read<Elf64_Sym>(offset);
      if (!raw) {
        return std::nullopt;
      }
      name_offset = raw->st_name;
      record.value = raw->st_value;
      record.size = raw->st_size;
      record.type = static_cast<uint8_t>(ELF64_ST_TYPE(raw->st_info));
      record.binding = static_cast<uint8_t>(ELF64_ST_BIND(raw->st_info));
      record.other = raw->st_other;
      record.section_index = raw->st_shndx;
    } else {
      auto raw = symbols.read<Elf32_Sym>(offset);
      if (!raw) {
        return std::nullopt;
      }
      name_offset = raw->st_name;
      record.value = raw->st_value;
      record.size = raw->st_size;
      record.type = static_cast<uint8_t>(ELF32_ST_TYPE(raw->st_info));
      record.binding = static_cast<uint8_t>(ELF32_ST_BIND(raw->st_info));
      record.other = raw->st_other;
      record.section_index = raw->st_shndx;
    }

    if (name_offset != 0) {
      record.name = strings.c_string(name_offset).value_or(std::string_view{});
    }
    return record;
  }
};

const char* to_string(elf_class cls);
const char* machine_name(uint16_t machine);

} // namespace elfscope::elf

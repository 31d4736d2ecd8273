#pragma once

#include <cstddef>
#include <cstdint>

#include <elf.h>

#include "elfscope/elf/elf_types.hpp"

namespace elfscope::symbols {

// search order is dynamic, regular, debug_recovered
enum class table_kind { dynamic, regular, debug_recovered };

const char* to_string(table_kind kind);

// dynamic: exported symbols only; debug: .symtab and the recovered debug table; all: every table in order
enum class lookup_scope { dynamic, debug, all };

const char* to_string(lookup_scope scope);

struct symbol_entry {
  uint32_t name_offset = 0;
  uint32_t name_size = 0;
  uint32_t position = 0;
  uint64_t value = 0;
  // value with the thumb bit cleared, used for address ordering
  uint64_t address_value = 0;
  uint64_t size = 0;
  uint8_t type = STT_NOTYPE;
  uint8_t binding = STB_LOCAL;
  uint16_t section_index = SHN_UNDEF;

  bool defined() const noexcept { return section_index != SHN_UNDEF; }

  bool address_candidate() const noexcept {
    if (!defined() || value == 0) {
      return false;
    }
    return type == STT_NOTYPE || type == STT_FUNC || type == STT_OBJECT || type == elf::symbol_type_gnu_ifunc;
  }

  bool is_thumb() const noexcept { return address_value != value; }
};

// absolute runtime address of a resolved name
struct symbol_address {
  uintptr_t address = 0;
  size_t size = 0;
  table_kind table = table_kind::dynamic;
};

} // namespace elfscope::symbols

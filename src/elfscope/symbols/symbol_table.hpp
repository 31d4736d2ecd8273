#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "elfscope/elf/elf_types.hpp"
#include "elfscope/symbols/symbol_entry.hpp"

namespace elfscope::symbols {

/**
 * @brief owned copy of one elf symbol table with name and address indexes
 *
 * Entries keep their original order; duplicate names are legal and the first positional
 * defined match wins. Nameless entries are dropped.
 */
class symbol_table {
public:
  symbol_table() = default;

  static symbol_table build(table_kind kind, const elf::symbol_source& source);

  table_kind kind() const noexcept { return kind_; }
  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  const std::vector<symbol_entry>& entries() const noexcept { return entries_; }

  std::string_view name_of(const symbol_entry& entry) const {
    return std::string_view(names_.data() + entry.name_offset, entry.name_size);
  }

  // first defined entry matching name (exact, version-tagged, or lto-renamed outside .dynsym)
  const symbol_entry* find_by_name(std::string_view name) const;

  // address candidate with the greatest address value <= value; earliest position on ties
  const symbol_entry* find_nearest(uint64_t value) const;

private:
  table_kind kind_ = table_kind::dynamic;
  bool allow_lto_suffix_ = false;
  std::string names_;
  std::vector<symbol_entry> entries_;
  std::vector<uint32_t> by_value_;
  std::vector<uint32_t> by_name_;
};

} // namespace elfscope::symbols

#include "elfscope/symbols/symbol_table.hpp"

#include <algorithm>

#include "elfscope/symbols/symbol_match.hpp"

namespace elfscope::symbols {

const char* to_string(table_kind kind) {
  switch (kind) {
    case table_kind::dynamic:
      return "dynamic";
    case table_kind::regular:
      return "regular";
    case table_kind::debug_recovered:
      return "debug_recovered";
  }
  return "unknown";
}

const char* to_string(lookup_scope scope) {
  switch (scope) {
    case lookup_scope::dynamic:
      return "dynamic";
    case lookup_scope::debug:
      return "debug";
    case lookup_scope::all:
      return "all";
  }
  return "unknown";
}

symbol_table symbol_table::build(table_kind kind, const elf::symbol_source& source) {
  symbol_table table;
  table.kind_ = kind;
  table.allow_lto_suffix_ = kind != table_kind::dynamic;
  if (!source.valid()) {
    return table;
  }

  const bool arm32 = source.cls == elf::elf_class::elf32 && source.machine == EM_ARM;
  table.entries_.reserve(source.count);

  for (size_t i = 0; i < source.count; ++i) {
    const auto record = source.at(i);
    if (!record || record->name.empty()) {
      continue;
    }

    symbol_entry entry;
    entry.name_offset = static_cast<uint32_t>(table.names_.size());
    entry.name_size = static_cast<uint32_t>(record->name.size());
    entry.position = static_cast<uint32_t>(table.entries_.size());
    entry.value = record->value;
    entry.address_value = record->value;
    if (arm32 && record->type == STT_FUNC) {
      entry.address_value &= ~uint64_t(1);
    }
    entry.size = record->size;
    entry.type = record->type;
    entry.binding = record->binding;
    entry.section_index = record->section_index;

    table.names_.append(record->name.data(), record->name.size());
    table.entries_.push_back(entry);
  }

  for (const auto& entry : table.entries_) {
    if (entry.address_candidate()) {
      table.by_value_.push_back(entry.position);
    }
  }
  std::stable_sort(table.by_value_.begin(), table.by_value_.end(), [&table](uint32_t lhs, uint32_t rhs) {
    return table.entries_[lhs].address_value < table.entries_[rhs].address_value;
  });

  table.by_name_.resize(table.entries_.size());
  for (uint32_t i = 0; i < table.by_name_.size(); ++i) {
    table.by_name_[i] = i;
  }
  const bool lto = table.allow_lto_suffix_;
  std::stable_sort(table.by_name_.begin(), table.by_name_.end(), [&table, lto](uint32_t lhs, uint32_t rhs) {
    return symbol_key(table.name_of(table.entries_[lhs]), lto) < symbol_key(table.name_of(table.entries_[rhs]), lto);
  });

  return table;
}

const symbol_entry* symbol_table::find_by_name(std::string_view name) const {
  if (name.empty() || entries_.empty()) {
    return nullptr;
  }

  const std::string_view key = symbol_key(name, allow_lto_suffix_);
  auto it = std::lower_bound(by_name_.begin(), by_name_.end(), key, [this](uint32_t index, std::string_view value) {
    return symbol_key(name_of(entries_[index]), allow_lto_suffix_) < value;
  });

  // positions inside one key run are ascending, so the first hit is the first positional match
  for (; it != by_name_.end(); ++it) {
    const symbol_entry& entry = entries_[*it];
    const std::string_view candidate = name_of(entry);
    if (symbol_key(candidate, allow_lto_suffix_) != key) {
      break;
    }
    if (entry.defined() && symbol_name_matches(candidate, name, allow_lto_suffix_)) {
      return &entry;
    }
  }
  return nullptr;
}

const symbol_entry* symbol_table::find_nearest(uint64_t value) const {
  auto it = std::upper_bound(by_value_.begin(), by_value_.end(), value, [this](uint64_t target, uint32_t index) {
    return target < entries_[index].address_value;
  });
  if (it == by_value_.begin()) {
    return nullptr;
  }
  --it;

  const uint64_t best = entries_[*it].address_value;
  while (it != by_value_.begin() && entries_[*(it - 1)].address_value == best) {
    --it;
  }
  return &entries_[*it];
}

} // namespace elfscope::symbols

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "elfscope/base/error.hpp"
#include "elfscope/symbols/module_symbols.hpp"
#include "elfscope/symbols/symbol_entry.hpp"

namespace elfscope::symbols {

// nearest preceding symbol for an address
struct address_match {
  std::string name;
  uintptr_t symbol_address = 0;
  size_t size = 0;
  uintptr_t offset = 0;
  table_kind table = table_kind::dynamic;
};

/**
 * @brief name and address resolution across a module's ordered tables
 *
 * Tables are searched dynamic, regular, then debug_recovered. A name lookup decodes the debug
 * table only when the earlier tables could not answer; an address lookup consults every table.
 * A corrupt debug blob only removes that table.
 */
class symbol_index {
public:
  symbol_index();

  base::result<symbol_address> resolve_by_name(module_symbols& module, std::string_view name, lookup_scope scope) const;

  base::result<address_match> resolve_by_address(module_symbols& module, uintptr_t address) const;

private:
  redlog::logger log_;
};

} // namespace elfscope::symbols

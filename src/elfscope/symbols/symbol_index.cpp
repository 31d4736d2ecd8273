#include "elfscope/symbols/symbol_index.hpp"

#include <string>

namespace elfscope::symbols {
namespace {

symbol_address to_symbol_address(const runtime::mapped_module& module, const symbol_entry& entry, table_kind kind) {
  symbol_address out;
  out.address = module.load_bias + static_cast<uintptr_t>(entry.value);
  out.size = static_cast<size_t>(entry.size);
  out.table = kind;
  return out;
}

} // namespace

symbol_index::symbol_index() : log_(redlog::get_logger("elfscope.symbols.index")) {}

base::result<symbol_address> symbol_index::resolve_by_name(
    module_symbols& module, std::string_view name, lookup_scope scope
) const {
  if (name.empty()) {
    return base::error_result<symbol_address>(base::error_code::invalid_argument, "empty symbol name");
  }

  const bool search_dynamic = scope == lookup_scope::dynamic || scope == lookup_scope::all;
  const bool search_debug = scope == lookup_scope::debug || scope == lookup_scope::all;

  auto try_table = [&](const symbol_table* table) -> const symbol_entry* {
    return table ? table->find_by_name(name) : nullptr;
  };

  const symbol_table* table = nullptr;
  const symbol_entry* entry = nullptr;
  if (search_dynamic) {
    table = module.dynamic_table();
    entry = try_table(table);
  }
  if (!entry && search_debug) {
    table = module.regular_table();
    entry = try_table(table);
  }
  if (!entry && search_debug) {
    table = module.debug_table();
    entry = try_table(table);
  }

  if (!entry) {
    log_.dbg(
        "symbol not found", redlog::field("symbol", std::string(name)), redlog::field("module", module.module().path),
        redlog::field("scope", to_string(scope))
    );
    return base::error_result<symbol_address>(
        base::error_code::not_found, "symbol " + std::string(name) + " not found in " + module.module().path
    );
  }

  auto out = to_symbol_address(module.module(), *entry, table->kind());
  log_.trc(
      "resolved symbol", redlog::field("symbol", std::string(name)),
      redlog::field("address", "0x%llx", static_cast<unsigned long long>(out.address)),
      redlog::field("table", to_string(out.table))
  );
  return base::ok_result(out);
}

base::result<address_match> symbol_index::resolve_by_address(module_symbols& module, uintptr_t address) const {
  const runtime::mapped_module& info = module.module();
  if (!info.contains(address)) {
    return base::error_result<address_match>(base::error_code::not_mapped, "address is outside " + info.path);
  }

  const uint64_t value = static_cast<uint64_t>(address - info.load_bias);
  const symbol_table* best_table = nullptr;
  const symbol_entry* best = nullptr;

  // strictly greater keeps the earlier table on equal values
  for (const symbol_table* table : module.tables(lookup_scope::all)) {
    const symbol_entry* candidate = table->find_nearest(value);
    if (candidate && (!best || candidate->address_value > best->address_value)) {
      best = candidate;
      best_table = table;
    }
  }

  if (!best) {
    return base::error_result<address_match>(base::error_code::not_found, "no symbol precedes address in " + info.path);
  }

  address_match out;
  out.name = std::string(best_table->name_of(*best));
  out.symbol_address = info.load_bias + static_cast<uintptr_t>(best->address_value);
  out.size = static_cast<size_t>(best->size);
  out.table = best_table->kind();
  // a thumb function's callable address (bit 0 set) is still offset 0
  const uintptr_t effective = best->is_thumb() ? (address & ~uintptr_t(1)) : address;
  out.offset = effective - out.symbol_address;
  return base::ok_result(std::move(out));
}

} // namespace elfscope::symbols

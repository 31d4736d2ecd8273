#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <redlog.hpp>

#include "elfscope/base/error.hpp"
#include "elfscope/elf/debug_data.hpp"
#include "elfscope/elf/elf_image.hpp"
#include "elfscope/elf/mapped_file.hpp"
#include "elfscope/runtime/mapped_module.hpp"
#include "elfscope/symbols/symbol_entry.hpp"
#include "elfscope/symbols/symbol_table.hpp"

namespace elfscope::symbols {

struct symbol_options {
  bool debug_data = true;
  size_t max_debug_data_size = size_t(64) * 1024 * 1024;

  static symbol_options from_config();
};

/**
 * @brief per-module cache entry for lazily built symbol tables
 *
 * Keyed by (path, base, generation). Each table is built at most once under the entry's
 * mutex; once built it is immutable, so returned pointers stay valid for the entry's lifetime.
 * A failed debug-data decode is remembered and not retried.
 */
class module_symbols {
public:
  explicit module_symbols(runtime::mapped_module module, symbol_options options = symbol_options::from_config());

  module_symbols(const module_symbols&) = delete;
  module_symbols& operator=(const module_symbols&) = delete;

  const runtime::mapped_module& module() const noexcept { return module_; }

  // nullptr when the table is absent or unreadable
  const symbol_table* dynamic_table();
  const symbol_table* regular_table();
  const symbol_table* debug_table();

  // tables for a scope, in search order, skipping unavailable ones
  std::vector<const symbol_table*> tables(lookup_scope scope);

  // outcome of opening the module file and of decoding its debug data
  base::status file_status();
  base::status debug_status();

private:
  const elf::elf_image* file_image_locked();
  void load_dynamic_locked();
  void load_debug_locked();

  std::mutex mutex_;
  runtime::mapped_module module_;
  symbol_options options_;
  redlog::logger log_;

  bool dynamic_loaded_ = false;
  bool regular_loaded_ = false;
  bool debug_loaded_ = false;
  bool file_loaded_ = false;

  std::unique_ptr<symbol_table> dynamic_;
  std::unique_ptr<symbol_table> regular_;
  std::unique_ptr<symbol_table> debug_;

  elf::mapped_file file_;
  std::optional<elf::elf_image> file_image_;
  std::unique_ptr<elf::debug_image> debug_image_;
  base::status file_status_{};
  base::status debug_status_{};
};

// opens the file behind a module; "<apk>!/<entry>" maps the archive at the module's file offset
base::result<elf::mapped_file> open_module_file(const runtime::mapped_module& module);

} // namespace elfscope::symbols

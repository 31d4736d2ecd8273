#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <link.h>

#include "elfscope/base/error.hpp"
#include "elfscope/locate/locator.hpp"
#include "elfscope/runtime/mapped_module.hpp"
#include "elfscope/runtime/phdr_iterator.hpp"
#include "elfscope/runtime/platform_profile.hpp"
#include "elfscope/symbols/module_symbols.hpp"
#include "elfscope/symbols/symbol_cache.hpp"
#include "elfscope/symbols/symbol_entry.hpp"

namespace elfscope {

using base::error_code;
using base::status;
template <typename T> using result = base::result<T>;

using locate::open_mode;
using runtime::iterate_flags;
using runtime::phdr_callback;
using symbols::address_cache;
using symbols::lookup_scope;
using symbols::symbol_address;
using symbols::table_kind;

enum class address_flags : uint32_t {
  none = 0,
  // fill module fields only
  no_symbol = 1u << 0,
};

inline address_flags operator|(address_flags lhs, address_flags rhs) {
  return static_cast<address_flags>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

inline bool has_flag(address_flags flags, address_flags flag) {
  return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// dlinfo-style description of an opened module
struct module_info {
  std::string path;
  uintptr_t base = 0;
  uintptr_t load_bias = 0;
  size_t size = 0;
  const ElfW(Phdr)* phdr = nullptr;
  size_t phnum = 0;
};

struct address_record {
  std::string module_path;
  uintptr_t module_base = 0;
  bool has_symbol = false;
  std::string symbol_name;
  uintptr_t symbol_address = 0;
  size_t symbol_size = 0;
  // from the symbol start, or from the module base when no symbol was found
  uintptr_t offset = 0;
  table_kind table = table_kind::dynamic;
  const ElfW(Phdr)* phdr = nullptr;
  size_t phnum = 0;
};

/**
 * @brief handle to one loaded module
 *
 * A library that had to call the platform loader owns that handle and closes it on
 * destruction; release() hands it to the caller instead.
 */
class library {
public:
  library() = default;
  ~library();

  library(const library&) = delete;
  library& operator=(const library&) = delete;
  library(library&& other) noexcept;
  library& operator=(library&& other) noexcept;

  static result<library> open(std::string_view name, open_mode mode = open_mode::use_loaded);
  static result<library> from_phdr(const dl_phdr_info& info);

  // exported symbols only (.dynsym)
  result<symbol_address> symbol(std::string_view name) const;
  // .symtab, then the table recovered from .gnu_debugdata
  result<symbol_address> debug_symbol(std::string_view name) const;
  result<symbol_address> find(std::string_view name, lookup_scope scope = lookup_scope::all) const;

  result<module_info> info() const;

  // returns the loader handle without closing it and leaves this library empty
  void* release();

  bool valid() const noexcept { return symbols_ != nullptr; }
  const runtime::mapped_module& module() const;
  void* loader_handle() const noexcept { return loader_handle_; }

private:
  library(std::shared_ptr<symbols::module_symbols> symbols, void* loader_handle);

  void close() noexcept;

  std::shared_ptr<symbols::module_symbols> symbols_;
  void* loader_handle_ = nullptr;
};

result<address_record> address_info(
    const void* address, address_flags flags = address_flags::none, address_cache* cache = nullptr
);

int iterate_phdr(phdr_callback callback, void* data, iterate_flags flags = iterate_flags::none);

// stops when the visitor returns false
void iterate_modules(const std::function<bool(const runtime::mapped_module&)>& visitor);

const runtime::platform_profile& platform();

} // namespace elfscope

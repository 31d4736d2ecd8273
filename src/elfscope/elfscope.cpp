#include "elfscope/elfscope.hpp"

#include <dlfcn.h>

#include <utility>

#include <redlog.hpp>

#include "elfscope/runtime/module_enumerator.hpp"
#include "elfscope/symbols/symbol_index.hpp"

namespace elfscope {
namespace {

redlog::logger& api_log() {
  static redlog::logger log = redlog::get_logger("elfscope.api");
  return log;
}

const runtime::mapped_module& empty_module() {
  static const runtime::mapped_module module{};
  return module;
}

template <typename T> result<T> invalid_library() {
  return base::error_result<T>(error_code::invalid_argument, "library is empty");
}

} // namespace

library::library(std::shared_ptr<symbols::module_symbols> symbols, void* loader_handle)
    : symbols_(std::move(symbols)), loader_handle_(loader_handle) {}

library::~library() { close(); }

library::library(library&& other) noexcept
    : symbols_(std::move(other.symbols_)), loader_handle_(std::exchange(other.loader_handle_, nullptr)) {}

library& library::operator=(library&& other) noexcept {
  if (this != &other) {
    close();
    symbols_ = std::move(other.symbols_);
    loader_handle_ = std::exchange(other.loader_handle_, nullptr);
  }
  return *this;
}

void library::close() noexcept {
  if (loader_handle_) {
    dlclose(loader_handle_);
    loader_handle_ = nullptr;
  }
  symbols_.reset();
}

result<library> library::open(std::string_view name, open_mode mode) {
  const locate::locator locator;
  auto located = locator.locate(name, mode);
  if (!located.ok()) {
    api_log().dbg(
        "open failed", redlog::field("name", std::string(name)),
        redlog::field("error", base::to_string(located.code()))
    );
    return base::error_result<library>(std::move(located.status_info));
  }

  auto symbols = symbols::symbol_cache::instance().acquire(located.value.module);
  return base::ok_result(library(std::move(symbols), located.value.loader_handle));
}

result<library> library::from_phdr(const dl_phdr_info& info) {
  if (!info.dlpi_phdr || info.dlpi_phnum == 0) {
    return base::error_result<library>(error_code::invalid_argument, "phdr info without program headers");
  }

  const runtime::module_enumerator enumerator;
  auto module = enumerator.describe(info);
  if (!module) {
    return base::error_result<library>(error_code::malformed_elf, "phdr info has no load segments");
  }

  auto symbols = symbols::symbol_cache::instance().acquire(*module);
  return base::ok_result(library(std::move(symbols), nullptr));
}

result<symbol_address> library::symbol(std::string_view name) const { return find(name, lookup_scope::dynamic); }

result<symbol_address> library::debug_symbol(std::string_view name) const { return find(name, lookup_scope::debug); }

result<symbol_address> library::find(std::string_view name, lookup_scope scope) const {
  if (!symbols_) {
    return invalid_library<symbol_address>();
  }
  const symbols::symbol_index index;
  return index.resolve_by_name(*symbols_, name, scope);
}

result<module_info> library::info() const {
  if (!symbols_) {
    return invalid_library<module_info>();
  }

  const auto& module = symbols_->module();
  module_info out;
  out.path = module.path;
  out.base = module.base;
  out.load_bias = module.load_bias;
  out.size = module.size;
  out.phdr = module.phdr;
  out.phnum = module.phnum;
  return base::ok_result(std::move(out));
}

void* library::release() {
  void* handle = std::exchange(loader_handle_, nullptr);
  symbols_.reset();
  return handle;
}

const runtime::mapped_module& library::module() const { return symbols_ ? symbols_->module() : empty_module(); }

result<address_record> address_info(const void* address, address_flags flags, address_cache* cache) {
  if (!address) {
    return base::error_result<address_record>(error_code::invalid_argument, "null address");
  }

  const auto value = reinterpret_cast<uintptr_t>(address);
  const runtime::module_enumerator enumerator;
  auto module = enumerator.find_containing(value);
  if (!module) {
    return base::error_result<address_record>(error_code::not_mapped, "address is not inside any loaded module");
  }

  address_record out;
  out.module_path = module->path;
  out.module_base = module->base;
  out.phdr = module->phdr;
  out.phnum = module->phnum;
  out.offset = value - module->base;

  if (has_flag(flags, address_flags::no_symbol)) {
    return base::ok_result(std::move(out));
  }

  auto symbols = cache ? cache->acquire(*module) : symbols::symbol_cache::instance().acquire(*module);
  const symbols::symbol_index index;
  auto match = index.resolve_by_address(*symbols, value);
  if (!match.ok()) {
    if (match.code() != error_code::not_found) {
      api_log().err(
          "address lookup failed", redlog::field("module", out.module_path),
          redlog::field("error", base::to_string(match.code()))
      );
      return base::error_result<address_record>(std::move(match.status_info));
    }
    api_log().trc("no symbol precedes address", redlog::field("module", out.module_path));
    return base::ok_result(std::move(out));
  }

  out.has_symbol = true;
  out.symbol_name = std::move(match.value.name);
  out.symbol_address = match.value.symbol_address;
  out.symbol_size = match.value.size;
  out.offset = match.value.offset;
  out.table = match.value.table;
  return base::ok_result(std::move(out));
}

int iterate_phdr(phdr_callback callback, void* data, iterate_flags flags) {
  return runtime::iterate_phdr(runtime::platform_profile::current(), callback, data, flags);
}

void iterate_modules(const std::function<bool(const runtime::mapped_module&)>& visitor) {
  const runtime::module_enumerator enumerator;
  enumerator.for_each(visitor);
}

const runtime::platform_profile& platform() { return runtime::platform_profile::current(); }

} // namespace elfscope

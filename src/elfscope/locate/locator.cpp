#include "elfscope/locate/locator.hpp"

#include <dlfcn.h>
#include <pthread.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "elfscope/base/path_utils.hpp"
#include "elfscope/symbols/symbol_cache.hpp"
#include "elfscope/symbols/symbol_index.hpp"

namespace elfscope::locate {
namespace {

constexpr int api_nougat = 24;
constexpr int api_oreo = 26;

constexpr const char* linker_dlopen_ext = "__dl__ZL10dlopen_extPKciPK17android_dlextinfoPv";
constexpr const char* linker_do_dlopen = "__dl__Z9do_dlopenPKciPK17android_dlextinfoPv";
constexpr const char* linker_dl_mutex = "__dl__ZL10g_dl_mutex";

using loader_dlopen_fn = void* (*)(const char* filename, int flags, const void* caller);
using linker_dlopen_fn = void* (*)(const char* filename, int flags, const void* extinfo, const void* caller);

// the loader picks the namespace from the caller; libc lives in the default one
const void* system_caller() { return dlsym(RTLD_DEFAULT, "getpid"); }

std::optional<std::string> canonical_path(std::string_view name) {
  if (!base::is_absolute_path(name)) {
    return std::nullopt;
  }
  std::error_code error;
  auto canonical = std::filesystem::canonical(std::filesystem::path(std::string(name)), error);
  if (error) {
    return std::nullopt;
  }
  std::string out = canonical.string();
  if (out == name) {
    return std::nullopt;
  }
  return out;
}

} // namespace

const char* to_string(open_mode mode) {
  switch (mode) {
    case open_mode::use_loaded:
      return "use_loaded";
    case open_mode::try_force_load:
      return "try_force_load";
    case open_mode::always_force_load:
      return "always_force_load";
  }
  return "unknown";
}

const char* to_string(load_route route) {
  switch (route) {
    case load_route::dlopen:
      return "dlopen";
    case load_route::linker_internal:
      return "linker_internal";
    case load_route::loader_dlopen:
      return "loader_dlopen";
  }
  return "unknown";
}

load_route select_load_route(const runtime::platform_profile& profile) {
  if (!profile.is_android() || profile.api_level() < api_nougat) {
    return load_route::dlopen;
  }
  return profile.api_level() < api_oreo ? load_route::linker_internal : load_route::loader_dlopen;
}

locator::locator(const runtime::platform_profile& profile, runtime::module_registry& registry)
    : profile_(profile), enumerator_(profile, registry), log_(redlog::get_logger("elfscope.locate")) {}

std::vector<std::string> locator::qualified_names(std::string_view name) const {
  std::vector<std::string> out;
  if (!is_bare_name(name)) {
    return out;
  }
  for (const auto& directory : profile_.library_directories()) {
    out.push_back(base::join_path(directory, name));
  }
  return out;
}

std::optional<locator::match_result> locator::find_loaded(
    const std::vector<runtime::mapped_module>& snapshot, std::string_view name
) const {
  auto path_of = [](const runtime::mapped_module& module) -> std::string_view { return module.path; };

  std::vector<std::string> requests;
  requests.emplace_back(name);
  if (auto canonical = canonical_path(name)) {
    requests.push_back(std::move(*canonical));
  }

  std::optional<match_result> best;
  for (const auto& request : requests) {
    auto index = best_match(request, snapshot, path_of);
    if (!index) {
      continue;
    }
    const match_kind kind = match_module(request, snapshot[*index].path);
    if (!best || kind > best->kind) {
      best = match_result{*index, kind};
    }
  }
  if (best) {
    return best;
  }

  // one fallback pass with fully-qualified paths
  for (const auto& qualified : qualified_names(name)) {
    std::vector<std::string> variants{qualified};
    if (auto canonical = canonical_path(qualified)) {
      variants.push_back(std::move(*canonical));
    }
    for (const auto& variant : variants) {
      if (auto index = best_match(variant, snapshot, path_of)) {
        log_.dbg(
            "matched by qualified path", redlog::field("request", std::string(name)), redlog::field("path", variant)
        );
        return match_result{*index, match_module(variant, snapshot[*index].path)};
      }
    }
  }
  return std::nullopt;
}

std::optional<void*> locator::linker_internal_open(const std::string& path) const {
  const auto snapshot = enumerator_.snapshot();
  auto linker = std::find_if(snapshot.begin(), snapshot.end(), [](const runtime::mapped_module& module) {
    return module.is_linker;
  });
  if (linker == snapshot.end()) {
    return std::nullopt;
  }

  auto linker_symbols = symbols::symbol_cache::instance().acquire(*linker);
  const symbols::symbol_index index;

  auto dlopen_ext = index.resolve_by_name(*linker_symbols, linker_dlopen_ext, symbols::lookup_scope::all);
  if (dlopen_ext.ok()) {
    auto load = reinterpret_cast<linker_dlopen_fn>(dlopen_ext.value.address);
    return load(path.c_str(), RTLD_NOW, nullptr, system_caller());
  }

  // older builds keep dlopen_ext inlined; do_dlopen expects the loader lock held
  auto do_dlopen = index.resolve_by_name(*linker_symbols, linker_do_dlopen, symbols::lookup_scope::all);
  auto dl_mutex = index.resolve_by_name(*linker_symbols, linker_dl_mutex, symbols::lookup_scope::all);
  if (!do_dlopen.ok() || !dl_mutex.ok()) {
    log_.dbg("linker load entry points not found", redlog::field("linker", linker->path));
    return std::nullopt;
  }

  auto load = reinterpret_cast<linker_dlopen_fn>(do_dlopen.value.address);
  auto* lock = reinterpret_cast<pthread_mutex_t*>(dl_mutex.value.address);
  pthread_mutex_lock(lock);
  void* handle = load(path.c_str(), RTLD_NOW, nullptr, system_caller());
  pthread_mutex_unlock(lock);
  return handle;
}

void* locator::loader_open(const std::string& path) const {
  const load_route route = select_load_route(profile_);
  if (route == load_route::loader_dlopen) {
    if (auto load = reinterpret_cast<loader_dlopen_fn>(dlsym(RTLD_DEFAULT, "__loader_dlopen"))) {
      return load(path.c_str(), RTLD_NOW, system_caller());
    }
  } else if (route == load_route::linker_internal) {
    if (auto handle = linker_internal_open(path)) {
      return *handle;
    }
  }

  if (route != load_route::dlopen) {
    log_.dbg("loader entry point unavailable, using dlopen", redlog::field("route", to_string(route)));
  }
  return dlopen(path.c_str(), RTLD_NOW);
}

void* locator::platform_load(std::string_view name) const {
  const std::string request(name);
  void* handle = loader_open(request);
  if (handle) {
    return handle;
  }

  const char* error = dlerror();
  log_.dbg(
      "platform load failed", redlog::field("name", request),
      redlog::field("route", to_string(select_load_route(profile_))), redlog::field("error", error ? error : "unknown")
  );

  for (const auto& qualified : qualified_names(name)) {
    handle = loader_open(qualified);
    if (handle) {
      log_.dbg("platform load succeeded with qualified path", redlog::field("path", qualified));
      return handle;
    }
    dlerror();
  }
  return nullptr;
}

base::result<located_module> locator::locate(std::string_view name, open_mode mode) const {
  if (name.empty()) {
    return base::error_result<located_module>(base::error_code::invalid_argument, "empty module name");
  }

  void* handle = nullptr;
  if (mode == open_mode::always_force_load) {
    handle = platform_load(name);
    if (!handle) {
      return base::error_result<located_module>(
          base::error_code::not_found, "platform loader could not load " + std::string(name)
      );
    }
  }

  auto snapshot = enumerator_.snapshot();
  auto match = find_loaded(snapshot, name);

  if (!match && mode == open_mode::try_force_load) {
    handle = platform_load(name);
    if (handle) {
      snapshot = enumerator_.snapshot();
      match = find_loaded(snapshot, name);
    }
  }

  if (!match) {
    if (handle) {
      dlclose(handle);
    }
    log_.dbg("module not located", redlog::field("name", std::string(name)), redlog::field("mode", to_string(mode)));
    return base::error_result<located_module>(base::error_code::not_found, "module not found: " + std::string(name));
  }

  located_module out;
  out.module = std::move(snapshot[match->index]);
  out.loader_handle = handle;
  out.match = match->kind;

  log_.dbg(
      "located module", redlog::field("name", std::string(name)), redlog::field("path", out.module.path),
      redlog::field("base", "0x%llx", static_cast<unsigned long long>(out.module.base)),
      redlog::field("match", to_string(out.match)), redlog::field("loaded", handle != nullptr)
  );
  return base::ok_result(std::move(out));
}

} // namespace elfscope::locate

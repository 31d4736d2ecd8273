#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <redlog.hpp>

#include "elfscope/base/error.hpp"
#include "elfscope/locate/module_match.hpp"
#include "elfscope/runtime/mapped_module.hpp"
#include "elfscope/runtime/module_enumerator.hpp"
#include "elfscope/runtime/platform_profile.hpp"

namespace elfscope::locate {

enum class open_mode {
  // only modules already mapped in the process; never calls the loader
  use_loaded,
  // load with the platform loader when nothing is mapped yet
  try_force_load,
  // always load first, which pins the module until the handle is closed
  always_force_load,
};

const char* to_string(open_mode mode);

// how a forced load reaches the platform loader
enum class load_route {
  // dlopen from this library's own namespace
  dlopen,
  // the linker's internal dlopen_ext or do_dlopen with a caller inside libc (api 24 and 25)
  linker_internal,
  // libdl's __loader_dlopen with a caller inside libc (api 26 and later)
  loader_dlopen,
};

const char* to_string(load_route route);

load_route select_load_route(const runtime::platform_profile& profile);

struct located_module {
  runtime::mapped_module module;
  // dlopen handle owned by the caller, or nullptr when nothing was loaded
  void* loader_handle = nullptr;
  match_kind match = match_kind::none;
};

/**
 * @brief finds a module's live image without relying on loader namespace visibility
 *
 * Matching runs against a full-path enumeration snapshot, so libraries hidden from dlopen
 * by linker namespaces are still found once mapped. A bare name that matches nothing gets one
 * more pass with the profile's library directories. Forced loads on android go through the
 * loader with a libc caller address, so the system namespace decides visibility.
 */
class locator {
public:
  explicit locator(
      const runtime::platform_profile& profile = runtime::platform_profile::current(),
      runtime::module_registry& registry = runtime::module_registry::instance()
  );

  base::result<located_module> locate(std::string_view name, open_mode mode = open_mode::use_loaded) const;

  // fully-qualified retries for a bare name, in directory order
  std::vector<std::string> qualified_names(std::string_view name) const;

private:
  struct match_result {
    size_t index = 0;
    match_kind kind = match_kind::none;
  };

  std::optional<match_result> find_loaded(const std::vector<runtime::mapped_module>& snapshot, std::string_view name)
      const;
  void* platform_load(std::string_view name) const;
  // nullptr when the loader refused; falls back to dlopen when the route's entry points are missing
  void* loader_open(const std::string& path) const;
  std::optional<void*> linker_internal_open(const std::string& path) const;

  const runtime::platform_profile& profile_;
  runtime::module_enumerator enumerator_;
  redlog::logger log_;
};

} // namespace elfscope::locate

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include <redlog.hpp>

#include "elfscope/runtime/mapped_module.hpp"
#include "elfscope/runtime/module_registry.hpp"
#include "elfscope/runtime/phdr_iterator.hpp"
#include "elfscope/runtime/platform_profile.hpp"

namespace elfscope::runtime {

/**
 * @brief builds mapped_module values on top of the raw phdr walk
 *
 * Every value carries a full path and a load generation from the registry. Modules without
 * load segments are skipped; a missing build id leaves that field empty.
 */
class module_enumerator {
public:
  explicit module_enumerator(
      const platform_profile& profile = platform_profile::current(),
      module_registry& registry = module_registry::instance()
  );

  // point-in-time list of every loaded image
  std::vector<mapped_module> snapshot() const;

  // visits a fresh snapshot; stops when the visitor returns false
  void for_each(const std::function<bool(const mapped_module&)>& visitor) const;

  // module whose load segments cover address
  std::optional<mapped_module> find_containing(uintptr_t address) const;

  // normalized record for an entry handed out by a phdr walk
  std::optional<mapped_module> describe(const dl_phdr_info& info) const;

  const platform_profile& profile() const noexcept { return profile_; }

private:
  const platform_profile& profile_;
  module_registry& registry_;
  redlog::logger log_;
};

} // namespace elfscope::runtime

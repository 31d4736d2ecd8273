#include "elfscope/runtime/module_registry.hpp"

#include <mutex>
#include <unordered_set>

#include <redlog.hpp>

namespace elfscope::runtime {
namespace {

redlog::logger& registry_log() {
  static redlog::logger log = redlog::get_logger("elfscope.runtime.registry");
  return log;
}

} // namespace

module_fingerprint module_fingerprint::of(const mapped_module& module) {
  module_fingerprint fingerprint;
  fingerprint.path = module.path;
  fingerprint.base = module.base;
  fingerprint.phdr = module.phdr;
  fingerprint.phnum = module.phnum;
  fingerprint.build_id = module.build_id;
  return fingerprint;
}

bool module_fingerprint::operator==(const module_fingerprint& other) const {
  return base == other.base && phdr == other.phdr && phnum == other.phnum && path == other.path &&
         build_id == other.build_id;
}

module_registry& module_registry::instance() {
  static module_registry registry;
  return registry;
}

uint64_t module_registry::stamp_locked(const mapped_module& module) {
  module_fingerprint fingerprint = module_fingerprint::of(module);

  auto it = by_base_.find(module.base);
  if (it != by_base_.end() && it->second.fingerprint == fingerprint) {
    return it->second.generation;
  }

  const uint64_t generation = next_generation_++;
  if (it != by_base_.end()) {
    registry_log().dbg(
        "image replaced at reused base", redlog::field("base", "0x%llx", static_cast<unsigned long long>(module.base)),
        redlog::field("old_path", it->second.fingerprint.path), redlog::field("new_path", module.path),
        redlog::field("generation", generation)
    );
    it->second = entry{std::move(fingerprint), generation};
  } else {
    by_base_.emplace(module.base, entry{std::move(fingerprint), generation});
  }
  version_.fetch_add(1, std::memory_order_acq_rel);
  return generation;
}

void module_registry::refresh(std::vector<mapped_module>& modules) {
  std::unique_lock lock(mutex_);

  std::unordered_set<uintptr_t> seen;
  seen.reserve(modules.size());
  for (auto& module : modules) {
    module.generation = stamp_locked(module);
    seen.insert(module.base);
  }

  size_t forgotten = 0;
  for (auto it = by_base_.begin(); it != by_base_.end();) {
    if (seen.count(it->first) == 0) {
      it = by_base_.erase(it);
      ++forgotten;
    } else {
      ++it;
    }
  }
  if (forgotten > 0) {
    version_.fetch_add(1, std::memory_order_acq_rel);
  }

  registry_log().trc(
      "registry refreshed", redlog::field("modules", modules.size()), redlog::field("forgotten", forgotten)
  );
}

uint64_t module_registry::observe(mapped_module& module) {
  std::unique_lock lock(mutex_);
  module.generation = stamp_locked(module);
  return module.generation;
}

size_t module_registry::size() const {
  std::shared_lock lock(mutex_);
  return by_base_.size();
}

} // namespace elfscope::runtime

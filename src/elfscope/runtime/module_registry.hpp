#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "elfscope/runtime/mapped_module.hpp"

namespace elfscope::runtime {

// what must stay equal for two sightings at one base to count as the same load
struct module_fingerprint {
  std::string path;
  uintptr_t base = 0;
  const void* phdr = nullptr;
  size_t phnum = 0;
  std::vector<uint8_t> build_id;

  static module_fingerprint of(const mapped_module& module);
  bool operator==(const module_fingerprint& other) const;
};

/**
 * @brief assigns load generations to modules
 *
 * A module keeps its generation while its fingerprint is unchanged. A different image at a
 * reused base, or an image seen again after a full snapshot missed it, gets a fresh one.
 */
class module_registry {
public:
  static module_registry& instance();

  // full snapshot: stamps every module and forgets bases that were not reported
  void refresh(std::vector<mapped_module>& modules);
  // single sighting: stamps one module and leaves the others alone
  uint64_t observe(mapped_module& module);

  size_t size() const;
  uint64_t version() const { return version_.load(std::memory_order_acquire); }

private:
  struct entry {
    module_fingerprint fingerprint;
    uint64_t generation = 0;
  };

  uint64_t stamp_locked(const mapped_module& module);

  mutable std::shared_mutex mutex_{};
  std::unordered_map<uintptr_t, entry> by_base_;
  uint64_t next_generation_ = 1;
  std::atomic<uint64_t> version_{0};
};

} // namespace elfscope::runtime

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include <redlog.hpp>

#include "elfscope/runtime/mapped_module.hpp"
#include "elfscope/symbols/module_symbols.hpp"

namespace elfscope::symbols {

struct module_key {
  std::string path;
  uintptr_t base = 0;
  uint64_t generation = 0;

  static module_key of(const runtime::mapped_module& module) {
    return module_key{module.path, module.base, module.generation};
  }

  bool operator==(const module_key& other) const {
    return base == other.base && generation == other.generation && path == other.path;
  }
};

struct module_key_hash {
  size_t operator()(const module_key& key) const noexcept {
    size_t hash = std::hash<std::string>{}(key.path);
    hash ^= std::hash<uintptr_t>{}(key.base) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
    hash ^= std::hash<uint64_t>{}(key.generation) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
    return hash;
  }
};

// process-wide entries, least recently used evicted beyond capacity
class symbol_cache {
public:
  explicit symbol_cache(size_t capacity);

  // capacity from ELFSCOPE_CACHE_CAPACITY
  static symbol_cache& instance();

  std::shared_ptr<module_symbols> acquire(const runtime::mapped_module& module);

  void clear();
  size_t size() const;
  size_t capacity() const;

private:
  using entry = std::pair<module_key, std::shared_ptr<module_symbols>>;

  void drop_stale_locked(const module_key& key);

  mutable std::mutex mutex_;
  size_t capacity_;
  std::list<entry> lru_;
  std::unordered_map<module_key, std::list<entry>::iterator, module_key_hash> index_;
  redlog::logger log_;
};

// caller-owned entries kept between address lookups until cleared
class address_cache {
public:
  std::shared_ptr<module_symbols> acquire(const runtime::mapped_module& module);

  void clear();
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<module_key, std::shared_ptr<module_symbols>, module_key_hash> entries_;
};

} // namespace elfscope::symbols

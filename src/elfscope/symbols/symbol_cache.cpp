#include "elfscope/symbols/symbol_cache.hpp"

#include "elfscope/base/config.hpp"

namespace elfscope::symbols {

symbol_cache::symbol_cache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), log_(redlog::get_logger("elfscope.symbols.cache")) {}

symbol_cache& symbol_cache::instance() {
  static symbol_cache cache(base::current_config().cache_capacity);
  return cache;
}

// a newer load at the same base makes older entries unreachable
void symbol_cache::drop_stale_locked(const module_key& key) {
  for (auto it = lru_.begin(); it != lru_.end();) {
    if (it->first.base == key.base && !(it->first == key)) {
      log_.dbg(
          "dropping stale entry", redlog::field("path", it->first.path),
          redlog::field("generation", it->first.generation)
      );
      index_.erase(it->first);
      it = lru_.erase(it);
    } else {
      ++it;
    }
  }
}

std::shared_ptr<module_symbols> symbol_cache::acquire(const runtime::mapped_module& module) {
  module_key key = module_key::of(module);
  std::lock_guard<std::mutex> lock(mutex_);

  auto found = index_.find(key);
  if (found != index_.end()) {
    lru_.splice(lru_.begin(), lru_, found->second);
    return found->second->second;
  }

  drop_stale_locked(key);

  auto symbols = std::make_shared<module_symbols>(module);
  lru_.emplace_front(key, symbols);
  index_.emplace(std::move(key), lru_.begin());

  while (lru_.size() > capacity_) {
    auto& victim = lru_.back();
    log_.trc("evicting entry", redlog::field("path", victim.first.path));
    index_.erase(victim.first);
    lru_.pop_back();
  }

  log_.trc("cached module symbols", redlog::field("path", module.path), redlog::field("entries", lru_.size()));
  return symbols;
}

void symbol_cache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.clear();
  lru_.clear();
}

size_t symbol_cache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

size_t symbol_cache::capacity() const { return capacity_; }

std::shared_ptr<module_symbols> address_cache::acquire(const runtime::mapped_module& module) {
  module_key key = module_key::of(module);
  std::lock_guard<std::mutex> lock(mutex_);

  auto found = entries_.find(key);
  if (found != entries_.end()) {
    return found->second;
  }

  auto symbols = std::make_shared<module_symbols>(module);
  entries_.emplace(std::move(key), symbols);
  return symbols;
}

void address_cache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

size_t address_cache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace elfscope::symbols

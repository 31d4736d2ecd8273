#include "elfscope/base/config.hpp"

#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>

#include "elfscope/base/env_config.hpp"
#include "elfscope/base/logging.hpp"

namespace elfscope::base {
namespace {

std::mutex config_mutex;
std::optional<config> cached_config;

size_t clamp_size(uint64_t value) {
  if (value > std::numeric_limits<size_t>::max()) {
    return std::numeric_limits<size_t>::max();
  }
  return static_cast<size_t>(value);
}

} // namespace

config config::from_environment() {
  env_config env("ELFSCOPE");
  config cfg;

  cfg.log_level = parse_log_level(env.get<std::string>("LOG_LEVEL", ""), cfg.log_level);
  cfg.api_level = env.get<int>("API_LEVEL", 0);
  if (cfg.api_level < 0) {
    cfg.api_level = 0;
  }
  cfg.force_maps = env.get<bool>("FORCE_MAPS", false);
  cfg.debug_data = env.get<bool>("DEBUG_DATA", true);
  cfg.cache_capacity = clamp_size(env.get<uint64_t>("CACHE_CAPACITY", cfg.cache_capacity));
  if (cfg.cache_capacity == 0) {
    cfg.cache_capacity = 1;
  }
  cfg.max_debug_data_size = clamp_size(env.get<uint64_t>("MAX_DEBUG_DATA_SIZE", cfg.max_debug_data_size));

  return cfg;
}

config current_config() {
  bool loaded = false;
  config cfg;
  {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (!cached_config) {
      cached_config = config::from_environment();
      loaded = true;
    }
    cfg = *cached_config;
  }

  if (loaded) {
    configure_logging(cfg);
  }
  return cfg;
}

void set_config(const config& cfg) {
  {
    std::lock_guard<std::mutex> lock(config_mutex);
    cached_config = cfg;
  }
  configure_logging(cfg);
}

} // namespace elfscope::base

#pragma once

#include <cstddef>

#include <redlog.hpp>

namespace elfscope::base {

// process-wide engine settings, read from ELFSCOPE_* variables
struct config {
  redlog::level log_level = redlog::level::info;
  // 0 means detect from the running system
  int api_level = 0;
  bool force_maps = false;
  bool debug_data = true;
  size_t cache_capacity = 64;
  size_t max_debug_data_size = size_t(64) * 1024 * 1024;

  static config from_environment();
};

// loaded from the environment on first use
config current_config();

// replaces the cached settings and reapplies the log level
void set_config(const config& cfg);

} // namespace elfscope::base

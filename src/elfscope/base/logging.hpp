#pragma once

#include <string>

#include <redlog.hpp>

#include "elfscope/base/config.hpp"

namespace elfscope::base {

// maps trace|debug|info|warn|warning|error (any case) to a redlog level
redlog::level parse_log_level(const std::string& value, redlog::level default_level = redlog::level::info);

const char* log_level_name(redlog::level level);

void configure_logging(const config& cfg);

} // namespace elfscope::base

#include "elfscope/base/logging.hpp"

#include <algorithm>
#include <cctype>

namespace elfscope::base {

redlog::level parse_log_level(const std::string& value, redlog::level default_level) {
  std::string level_str = value;
  std::transform(level_str.begin(), level_str.end(), level_str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (level_str == "trace") return redlog::level::trace;
  if (level_str == "debug") return redlog::level::debug;
  if (level_str == "info") return redlog::level::info;
  if (level_str == "warn" || level_str == "warning") return redlog::level::warn;
  if (level_str == "error") return redlog::level::error;

  return default_level;
}

const char* log_level_name(redlog::level level) {
  switch (level) {
    case redlog::level::trace:
      return "trace";
    case redlog::level::debug:
      return "debug";
    case redlog::level::info:
      return "info";
    case redlog::level::warn:
      return "warn";
    case redlog::level::error:
      return "error";
    default:
      return "other";
  }
}

void configure_logging(const config& cfg) {
  redlog::set_level(cfg.log_level);

  auto log = redlog::get_logger("elfscope.config");
  log.dbg("logging configured", redlog::field("level", log_level_name(cfg.log_level)));
}

} // namespace elfscope::base

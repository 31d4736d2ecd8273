#include "elfscope/base/env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace elfscope::base {

env_config::env_config(const std::string& prefix) : prefix_(prefix), log_(redlog::get_logger("elfscope.config")) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }


std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

std::string env_config::to_lower(const std::string& value) {
  std::string result = value;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string env_config::trim(const std::string& value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  log_.wrn(
      "failed to parse boolean, using default", redlog::field("name", build_env_name(name)),
      redlog::field("value", value)
  );
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed, 0);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse int, using default", redlog::field("name", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }

  log_.wrn("trailing characters in int, using default", redlog::field("name", build_env_name(name)));
  return default_value;
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }
  if (value.front() == '-') {
    log_.wrn("negative value for unsigned setting, using default", redlog::field("name", build_env_name(name)));
    return default_value;
  }

  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed, 0);
    if (consumed == value.size()) {
      return static_cast<uint64_t>(parsed);
    }
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse uint64_t, using default", redlog::field("name", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }

  log_.wrn("trailing characters in uint64_t, using default", redlog::field("name", build_env_name(name)));
  return default_value;
}

} // namespace elfscope::base

#pragma once

#include <string_view>

namespace elfscope::symbols {

// "name@VER" and "name@@VER" carry a version tag after the first '@'
inline std::string_view strip_version(std::string_view name) {
  const size_t at = name.find('@');
  return at == std::string_view::npos ? name : name.substr(0, at);
}

// LTO renames local functions to "name.llvm.<digits>"
inline std::string_view strip_lto_suffix(std::string_view name) {
  constexpr std::string_view marker = ".llvm.";
  const size_t pos = name.rfind(marker);
  if (pos == std::string_view::npos || pos == 0) {
    return name;
  }
  const std::string_view digits = name.substr(pos + marker.size());
  if (digits.empty()) {
    return name;
  }
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return name;
    }
  }
  return name.substr(0, pos);
}

// index key: every candidate that can match a query shares the query's key
inline std::string_view symbol_key(std::string_view name, bool allow_lto_suffix) {
  std::string_view key = strip_version(name);
  return allow_lto_suffix ? strip_lto_suffix(key) : key;
}

inline bool symbol_name_matches(std::string_view candidate, std::string_view query, bool allow_lto_suffix) {
  if (query.empty()) {
    return false;
  }
  if (candidate == query) {
    return true;
  }
  if (candidate.size() > query.size() && candidate.substr(0, query.size()) == query) {
    const std::string_view rest = candidate.substr(query.size());
    if (rest.front() == '@') {
      return true;
    }
    if (allow_lto_suffix && strip_lto_suffix(candidate) == query) {
      return true;
    }
  }
  return false;
}

} // namespace elfscope::symbols

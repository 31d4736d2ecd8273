#pragma once

#include <string>
#include <string_view>

namespace elfscope::base {

inline std::string_view basename_view(std::string_view path) {
  const size_t pos = path.find_last_of('/');
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

inline bool is_absolute_path(std::string_view path) { return !path.empty() && path.front() == '/'; }

inline bool has_separator(std::string_view path) { return path.find('/') != std::string_view::npos; }

inline bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

inline std::string join_path(std::string_view directory, std::string_view name) {
  std::string out(directory);
  if (!out.empty() && out.back() != '/') {
    out.push_back('/');
  }
  out.append(name);
  return out;
}

// "<archive>!/<entry>" names a library mapped straight out of an apk
struct archive_path {
  std::string_view archive;
  std::string_view entry;
};

inline bool split_archive_path(std::string_view path, archive_path& out) {
  const size_t pos = path.find("!/");
  if (pos == std::string_view::npos || pos == 0) {
    return false;
  }
  out.archive = path.substr(0, pos);
  out.entry = path.substr(pos + 2);
  return !out.entry.empty();
}

} // namespace elfscope::base

#pragma once

#include <string>
#include <utility>

namespace elfscope::base {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  not_found,
  access_denied,
  malformed_elf,
  unsupported_arch,
  truncated,
  no_debug_data,
  corrupt_debug_data,
  not_mapped,
  io_error
};

const char* to_string(error_code code);

// errno from open/stat/mmap to the closest engine code
error_code error_from_errno(int error);

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
  error_code code() const noexcept { return status_info.code; }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status info) { return result<T>{T{}, std::move(info)}; }

} // namespace elfscope::base

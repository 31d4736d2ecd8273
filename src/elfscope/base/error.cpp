#include "elfscope/base/error.hpp"

#include <cerrno>

namespace elfscope::base {

const char* to_string(error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::invalid_argument:
      return "invalid_argument";
    case error_code::not_found:
      return "not_found";
    case error_code::access_denied:
      return "access_denied";
    case error_code::malformed_elf:
      return "malformed_elf";
    case error_code::unsupported_arch:
      return "unsupported_arch";
    case error_code::truncated:
      return "truncated";
    case error_code::no_debug_data:
      return "no_debug_data";
    case error_code::corrupt_debug_data:
      return "corrupt_debug_data";
    case error_code::not_mapped:
      return "not_mapped";
    case error_code::io_error:
      return "io_error";
  }
  return "unknown";
}

error_code error_from_errno(int error) {
  switch (error) {
    case ENOENT:
    case ENOTDIR:
    case ELOOP:
    case ENAMETOOLONG:
      return error_code::not_found;
    case EACCES:
    case EPERM:
      return error_code::access_denied;
    default:
      return error_code::io_error;
  }
}

} // namespace elfscope::base

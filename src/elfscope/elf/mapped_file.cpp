#include "elfscope/elf/mapped_file.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <elf.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace elfscope::elf {
namespace {

redlog::logger& mapper_log() {
  static redlog::logger log = redlog::get_logger("elfscope.elf.mapper");
  return log;
}

// closes the descriptor on every exit path
class scoped_fd {
public:
  explicit scoped_fd(int fd) : fd_(fd) {}
  ~scoped_fd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  scoped_fd(const scoped_fd&) = delete;
  scoped_fd& operator=(const scoped_fd&) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

base::status errno_status(const char* operation, const std::string& path, int error) {
  std::string message = operation;
  message += " failed for ";
  message += path;
  message += ": ";
  message += std::strerror(error);
  return base::make_status(base::error_from_errno(error), std::move(message));
}

} // namespace

mapped_file::~mapped_file() { reset(); }

mapped_file::mapped_file(mapped_file&& other) noexcept
    : mapping_(std::exchange(other.mapping_, nullptr)), mapping_size_(std::exchange(other.mapping_size_, 0)),
      offset_(std::exchange(other.offset_, 0)), path_(std::move(other.path_)),
      view_(std::exchange(other.view_, byte_view{})) {}

mapped_file& mapped_file::operator=(mapped_file&& other) noexcept {
  if (this != &other) {
    reset();
    mapping_ = std::exchange(other.mapping_, nullptr);
    mapping_size_ = std::exchange(other.mapping_size_, 0);
    offset_ = std::exchange(other.offset_, 0);
    path_ = std::move(other.path_);
    view_ = std::exchange(other.view_, byte_view{});
  }
  return *this;
}

void mapped_file::reset() noexcept {
  if (mapping_) {
    ::munmap(mapping_, mapping_size_);
  }
  mapping_ = nullptr;
  mapping_size_ = 0;
  offset_ = 0;
  view_ = byte_view{};
}

base::result<mapped_file> mapped_file::open(const std::string& path, uint64_t offset) {
  if (path.empty()) {
    return base::error_result<mapped_file>(base::error_code::invalid_argument, "empty path");
  }

  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    const int error = errno;
    mapper_log().dbg("open failed", redlog::field("path", path), redlog::field("errno", error));
    return base::error_result<mapped_file>(errno_status("open", path, error));
  }
  scoped_fd guard(fd);

  struct stat info {};
  if (::fstat(guard.get(), &info) != 0) {
    const int error = errno;
    return base::error_result<mapped_file>(errno_status("fstat", path, error));
  }
  if (!S_ISREG(info.st_mode)) {
    return base::error_result<mapped_file>(base::error_code::io_error, "not a regular file: " + path);
  }

  const uint64_t file_size = static_cast<uint64_t>(info.st_size);
  const uint64_t header_size = sizeof(Elf32_Ehdr);
  if (!base::span_fits(offset, header_size, file_size)) {
    mapper_log().dbg(
        "file shorter than elf header", redlog::field("path", path), redlog::field("size", file_size),
        redlog::field("offset", offset)
    );
    return base::error_result<mapped_file>(base::error_code::truncated, "file too short: " + path);
  }

  void* mapping = ::mmap(nullptr, static_cast<size_t>(file_size), PROT_READ, MAP_PRIVATE, guard.get(), 0);
  if (mapping == MAP_FAILED) {
    const int error = errno;
    return base::error_result<mapped_file>(errno_status("mmap", path, error));
  }

  mapped_file file;
  file.mapping_ = mapping;
  file.mapping_size_ = static_cast<size_t>(file_size);
  file.offset_ = offset;
  file.path_ = path;
  file.view_ = byte_view(static_cast<const uint8_t*>(mapping) + offset, static_cast<size_t>(file_size - offset));

  mapper_log().trc(
      "mapped file", redlog::field("path", path), redlog::field("size", file_size), redlog::field("offset", offset)
  );
  return base::ok_result(std::move(file));
}

} // namespace elfscope::elf

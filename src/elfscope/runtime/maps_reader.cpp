#include "elfscope/runtime/maps_reader.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace elfscope::runtime {
namespace {

bool is_space(char c) { return c == ' ' || c == '\t'; }

int hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool parse_hex(std::string_view line, size_t& pos, uint64_t& value) {
  value = 0;
  const size_t begin = pos;
  while (pos < line.size()) {
    const int digit = hex_digit(line[pos]);
    if (digit < 0) {
      break;
    }
    value = (value << 4) | static_cast<uint64_t>(digit);
    ++pos;
  }
  return pos > begin;
}

bool parse_decimal(std::string_view line, size_t& pos, uint64_t& value) {
  value = 0;
  const size_t begin = pos;
  while (pos < line.size() && line[pos] >= '0' && line[pos] <= '9') {
    value = value * 10 + static_cast<uint64_t>(line[pos] - '0');
    ++pos;
  }
  return pos > begin;
}

void skip_spaces(std::string_view line, size_t& pos) {
  while (pos < line.size() && is_space(line[pos])) {
    ++pos;
  }
}

bool skip_field(std::string_view line, size_t& pos) {
  const size_t begin = pos;
  while (pos < line.size() && !is_space(line[pos])) {
    ++pos;
  }
  return pos > begin;
}

} // namespace

bool parse_maps_line(std::string_view line, maps_record& out) {
  out = maps_record{};
  size_t pos = 0;
  uint64_t start = 0;
  uint64_t end = 0;

  if (!parse_hex(line, pos, start) || pos >= line.size() || line[pos] != '-') {
    return false;
  }
  ++pos;
  if (!parse_hex(line, pos, end) || end < start) {
    return false;
  }
  skip_spaces(line, pos);

  if (pos + 4 > line.size()) {
    return false;
  }
  std::memcpy(out.perms, line.data() + pos, 4);
  out.perms[4] = '\0';
  pos += 4;
  skip_spaces(line, pos);

  if (!parse_hex(line, pos, out.offset)) {
    return false;
  }
  skip_spaces(line, pos);

  // device major:minor
  if (!skip_field(line, pos)) {
    return false;
  }
  skip_spaces(line, pos);

  if (!parse_decimal(line, pos, out.inode)) {
    return false;
  }
  skip_spaces(line, pos);

  out.start = static_cast<uintptr_t>(start);
  out.end = static_cast<uintptr_t>(end);
  out.path = line.substr(pos);
  while (!out.path.empty() && (out.path.back() == '\n' || is_space(out.path.back()))) {
    out.path.remove_suffix(1);
  }
  return true;
}

maps_reader::~maps_reader() { close(); }

bool maps_reader::open(const char* path) {
  close();
  do {
    fd_ = ::open(path, O_RDONLY | O_CLOEXEC);
  } while (fd_ < 0 && errno == EINTR);
  eof_ = false;
  buffer_pos_ = 0;
  buffer_len_ = 0;
  return fd_ >= 0;
}

void maps_reader::close() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
}

bool maps_reader::fill() {
  if (eof_ || fd_ < 0) {
    return false;
  }

  ssize_t count = 0;
  do {
    count = ::read(fd_, buffer_, sizeof(buffer_));
  } while (count < 0 && errno == EINTR);

  if (count <= 0) {
    eof_ = true;
    return false;
  }
  buffer_pos_ = 0;
  buffer_len_ = static_cast<size_t>(count);
  return true;
}

bool maps_reader::read_line(std::string_view& line) {
  size_t length = 0;
  bool saw_any = false;

  for (;;) {
    if (buffer_pos_ >= buffer_len_ && !fill()) {
      break;
    }
    saw_any = true;

    const char c = buffer_[buffer_pos_++];
    if (c == '\n') {
      line = std::string_view(line_, length);
      return true;
    }
    // overlong lines are cut; the fields we need come first
    if (length < sizeof(line_)) {
      line_[length++] = c;
    }
  }

  if (saw_any && length > 0) {
    line = std::string_view(line_, length);
    return true;
  }
  return false;
}

bool maps_reader::next(maps_record& out) {
  std::string_view line;
  while (read_line(line)) {
    if (parse_maps_line(line, out)) {
      return true;
    }
  }
  return false;
}

void region_correlator::start(const maps_record& record) {
  pending_.start = record.start;
  pending_.end = record.end;
  pending_.first_end = record.end;
  pending_.offset = record.offset;
  pending_.last_offset = record.offset;
  pending_.inode = record.inode;
  pending_.first_readable = record.readable();
  pending_.executable = record.executable();
  pending_.path_length = record.path.size() < sizeof(pending_.path) ? record.path.size() : sizeof(pending_.path) - 1;
  std::memcpy(pending_.path, record.path.data(), pending_.path_length);
  pending_.path[pending_.path_length] = '\0';
  has_pending_ = true;
}

bool region_correlator::feed(const maps_record& record, mapped_region& completed) {
  if (record.path.empty()) {
    return false;
  }

  if (has_pending_ && record.inode == pending_.inode && record.path == pending_.path_view() &&
      record.start >= pending_.end && record.offset > pending_.last_offset) {
    pending_.end = record.end;
    pending_.last_offset = record.offset;
    pending_.executable = pending_.executable || record.executable();
    return false;
  }

  const bool closed = has_pending_;
  if (closed) {
    completed = pending_;
  }
  start(record);
  return closed;
}

bool region_correlator::finish(mapped_region& completed) {
  if (!has_pending_) {
    return false;
  }
  completed = pending_;
  has_pending_ = false;
  return true;
}

std::vector<mapped_region> correlate_regions(const std::vector<maps_record>& records) {
  std::vector<mapped_region> regions;
  region_correlator correlator;
  mapped_region completed;
  for (const auto& record : records) {
    if (correlator.feed(record, completed)) {
      regions.push_back(completed);
    }
  }
  if (correlator.finish(completed)) {
    regions.push_back(completed);
  }
  return regions;
}

bool find_mapping(uintptr_t address, maps_record& out, char* path_buffer, size_t path_buffer_size) {
  maps_reader reader;
  if (!reader.open()) {
    return false;
  }

  maps_record record;
  while (reader.next(record)) {
    if (!record.contains(address)) {
      continue;
    }
    out = record;
    if (path_buffer && path_buffer_size > 0) {
      const size_t length = record.path.size() < path_buffer_size ? record.path.size() : path_buffer_size - 1;
      std::memcpy(path_buffer, record.path.data(), length);
      path_buffer[length] = '\0';
      out.path = std::string_view(path_buffer, length);
    } else {
      out.path = {};
    }
    return true;
  }
  return false;
}

} // namespace elfscope::runtime

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <limits.h>

namespace elfscope::runtime {

// one /proc/<pid>/maps line; path points into the reader's line buffer until the next read
struct maps_record {
  uintptr_t start = 0;
  uintptr_t end = 0;
  uint64_t offset = 0;
  uint64_t inode = 0;
  char perms[5] = {};
  std::string_view path;

  bool readable() const noexcept { return perms[0] == 'r'; }
  bool executable() const noexcept { return perms[2] == 'x'; }
  bool contains(uintptr_t address) const noexcept { return address >= start && address < end; }
};

// parses "start-end perms offset dev inode   path"; allocation-free
bool parse_maps_line(std::string_view line, maps_record& out);

// streams maps records through fixed buffers with read(2), usable where malloc is not
class maps_reader {
public:
  maps_reader() = default;
  ~maps_reader();

  maps_reader(const maps_reader&) = delete;
  maps_reader& operator=(const maps_reader&) = delete;

  bool open(const char* path = "/proc/self/maps");
  void close();
  bool is_open() const noexcept { return fd_ >= 0; }

  // false at end of file or on a read error
  bool next(maps_record& out);

private:
  bool read_line(std::string_view& line);
  bool fill();

  int fd_ = -1;
  bool eof_ = false;
  size_t buffer_pos_ = 0;
  size_t buffer_len_ = 0;
  char buffer_[4096] = {};
  char line_[PATH_MAX + 128] = {};
};

// contiguous mappings of one file, as the loader places a module's segments
struct mapped_region {
  uintptr_t start = 0;
  uintptr_t end = 0;
  uintptr_t first_end = 0;
  uint64_t offset = 0;
  uint64_t last_offset = 0;
  uint64_t inode = 0;
  bool first_readable = false;
  bool executable = false;
  size_t path_length = 0;
  char path[PATH_MAX] = {};

  std::string_view path_view() const noexcept { return std::string_view(path, path_length); }
};

// groups consecutive same-file records; anonymous records in between do not break a group
class region_correlator {
public:
  // true when `record` closed the pending region, which is copied to `completed`
  bool feed(const maps_record& record, mapped_region& completed);
  // flushes the last pending region
  bool finish(mapped_region& completed);

private:
  void start(const maps_record& record);

  mapped_region pending_{};
  bool has_pending_ = false;
};

std::vector<mapped_region> correlate_regions(const std::vector<maps_record>& records);

// record of the /proc/self/maps entry covering address; its path is copied into path_buffer
bool find_mapping(uintptr_t address, maps_record& out, char* path_buffer, size_t path_buffer_size);

} // namespace elfscope::runtime

#include "elfscope/runtime/phdr_iterator.hpp"

#include <cerrno>
#include <cstring>

#include <dlfcn.h>
#include <elf.h>
#include <fcntl.h>
#include <limits.h>
#include <sys/auxv.h>
#include <unistd.h>

#include "elfscope/runtime/maps_reader.hpp"

namespace elfscope::runtime {
namespace {

#if defined(__LP64__) || defined(_LP64)
constexpr unsigned char native_class = ELFCLASS64;
#else
constexpr unsigned char native_class = ELFCLASS32;
#endif

struct auxv_table {
  ElfW(auxv_t) entries[128];
  size_t count = 0;
};

auxv_table load_auxv_table() {
  auxv_table table{};
  int fd = -1;
  do {
    fd = ::open("/proc/self/auxv", O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    return table;
  }

  auto* bytes = reinterpret_cast<char*>(table.entries);
  const size_t capacity = sizeof(table.entries);
  size_t filled = 0;
  while (filled < capacity) {
    const ssize_t count = ::read(fd, bytes + filled, capacity - filled);
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (count == 0) {
      break;
    }
    filled += static_cast<size_t>(count);
  }
  ::close(fd);

  table.count = filled / sizeof(ElfW(auxv_t));
  for (size_t i = 0; i < table.count; ++i) {
    if (table.entries[i].a_type == AT_NULL) {
      table.count = i;
      break;
    }
  }
  return table;
}

unsigned long auxv_value(unsigned long type) {
#if defined(__ANDROID__) && __ANDROID_API__ < 18
  // getauxval arrived with api 18
  return read_proc_auxv(type);
#else
  return getauxval(type);
#endif
}

uintptr_t page_start(uintptr_t value) { return value & ~(static_cast<uintptr_t>(page_size()) - 1); }

bool lowest_load_vaddr(const ElfW(Phdr)* phdr, size_t phnum, uintptr_t& lowest) {
  bool found = false;
  for (size_t i = 0; i < phnum; ++i) {
    if (phdr[i].p_type != PT_LOAD) {
      continue;
    }
    const uintptr_t vaddr = static_cast<uintptr_t>(phdr[i].p_vaddr);
    if (!found || vaddr < lowest) {
      lowest = vaddr;
      found = true;
    }
  }
  return found;
}

size_t copy_path(char* out, size_t out_size, const char* in, size_t length) {
  if (length >= out_size) {
    length = out_size - 1;
  }
  std::memcpy(out, in, length);
  out[length] = '\0';
  return length;
}

bool read_main_executable_path(char* out, size_t out_size) {
  const ssize_t length = readlink("/proc/self/exe", out, out_size - 1);
  if (length <= 0) {
    return false;
  }
  out[length] = '\0';
  return true;
}

bool same_basename(const char* path, size_t path_length, const char* name) {
  const size_t name_length = std::strlen(name);
  if (name_length == 0 || name_length > path_length) {
    return false;
  }
  const char* tail = path + (path_length - name_length);
  if (std::memcmp(tail, name, name_length) != 0) {
    return false;
  }
  return name_length == path_length || tail[-1] == '/';
}

struct walk_context {
  const platform_profile* profile = nullptr;
  phdr_callback callback = nullptr;
  void* data = nullptr;
  loader_iterator loader = nullptr;
  iterate_flags flags = iterate_flags::none;
  uintptr_t linker_base = 0;
  bool linker_seen = false;
  bool stopped = false;
  int result = 0;
  char path[PATH_MAX] = {};
};

const char* resolve_name(walk_context& ctx, const dl_phdr_info& info) {
  const char* name = info.dlpi_name ? info.dlpi_name : "";

  if (is_main_image(info)) {
    if (ctx.profile->renames_main_image()) {
      // the loader may report the package name; the exe link names the binary, app_process for zygote children
      if (read_main_executable_path(ctx.path, sizeof(ctx.path))) {
        return ctx.path;
      }
      return ctx.profile->app_process_path();
    }
    if (name[0] != '/' && has_flag(ctx.flags, iterate_flags::full_pathname) &&
        read_main_executable_path(ctx.path, sizeof(ctx.path))) {
      return ctx.path;
    }
    return name;
  }

  if (name[0] == '/' || name[0] == '\0' || !has_flag(ctx.flags, iterate_flags::full_pathname) ||
      !ctx.profile->fixes_basenames()) {
    return name;
  }

  // the loader kept only the file name; the maps entry at the image start has the full path
  maps_record record;
  if (find_mapping(image_start(info), record, ctx.path, sizeof(ctx.path)) &&
      same_basename(ctx.path, record.path.size(), name)) {
    return ctx.path;
  }
  return name;
}

void deliver(walk_context& ctx, const dl_phdr_info& info, size_t size) {
  if (ctx.linker_base != 0 && image_start(info) == ctx.linker_base) {
    ctx.linker_seen = true;
  }

  dl_phdr_info normalized = info;
  normalized.dlpi_name = resolve_name(ctx, info);

  const int result = ctx.callback(&normalized, size, ctx.data);
  if (result != 0) {
    ctx.stopped = true;
    ctx.result = result;
  }
}

int loader_callback(struct dl_phdr_info* info, size_t size, void* data) {
  auto* ctx = static_cast<walk_context*>(data);
  if (!info || !info->dlpi_phdr || info->dlpi_phnum == 0) {
    return 0;
  }
  if (size > sizeof(dl_phdr_info)) {
    size = sizeof(dl_phdr_info);
  }
  deliver(*ctx, *info, size);
  return ctx->stopped ? ctx->result : 0;
}

void walk_loader(walk_context& ctx) {
  if (ctx.loader) {
    ctx.loader(loader_callback, &ctx);
    return;
  }
#if defined(__ANDROID__) && defined(__arm__) && __ANDROID_API__ < 21
  // not exported by libdl before lollipop on arm
  auto iterator = reinterpret_cast<loader_iterator>(dlsym(RTLD_DEFAULT, "dl_iterate_phdr"));
  if (!iterator) {
    return;
  }
  iterator(loader_callback, &ctx);
#else
  loader_iterator iterator = dl_iterate_phdr;
  iterator(loader_callback, &ctx);
#endif
}

// a region becomes a module when it starts at file offset 0 with an elf header and has code
bool region_to_phdr_info(const mapped_region& region, dl_phdr_info& info) {
  if (region.offset != 0 || !region.first_readable || !region.executable || region.path[0] != '/') {
    return false;
  }

  ElfW(Ehdr) header;
  if (region.first_end - region.start < sizeof(header)) {
    return false;
  }
  std::memcpy(&header, reinterpret_cast<const void*>(region.start), sizeof(header));
  if (std::memcmp(header.e_ident, ELFMAG, SELFMAG) != 0 || header.e_ident[EI_CLASS] != native_class) {
    return false;
  }
  if (header.e_phnum == 0 || header.e_phentsize != sizeof(ElfW(Phdr))) {
    return false;
  }

  const uintptr_t phdr_start = region.start + static_cast<uintptr_t>(header.e_phoff);
  const uintptr_t phdr_end = phdr_start + static_cast<uintptr_t>(header.e_phnum) * sizeof(ElfW(Phdr));
  if (phdr_start < region.start || phdr_end > region.first_end) {
    return false;
  }

  const auto* phdr = reinterpret_cast<const ElfW(Phdr)*>(phdr_start);
  uintptr_t lowest = 0;
  if (!lowest_load_vaddr(phdr, header.e_phnum, lowest)) {
    return false;
  }

  std::memset(&info, 0, sizeof(info));
  info.dlpi_addr = static_cast<ElfW(Addr)>(region.start - page_start(lowest));
  info.dlpi_name = region.path;
  info.dlpi_phdr = phdr;
  info.dlpi_phnum = static_cast<ElfW(Half)>(header.e_phnum);
  return true;
}

void walk_maps(walk_context& ctx) {
  maps_reader reader;
  if (!reader.open()) {
    return;
  }

  region_correlator correlator;
  maps_record record;
  mapped_region completed;
  dl_phdr_info info;

  auto consider = [&](const mapped_region& region) {
    if (region_to_phdr_info(region, info)) {
      deliver(ctx, info, sizeof(info));
    }
  };

  while (!ctx.stopped && reader.next(record)) {
    if (correlator.feed(record, completed)) {
      consider(completed);
    }
  }
  if (!ctx.stopped && correlator.finish(completed)) {
    consider(completed);
  }
}

void inject_linker(walk_context& ctx) {
  if (!ctx.profile->injects_linker() || ctx.linker_base == 0 || ctx.linker_seen) {
    return;
  }

  ElfW(Ehdr) header;
  std::memcpy(&header, reinterpret_cast<const void*>(ctx.linker_base), sizeof(header));
  if (std::memcmp(header.e_ident, ELFMAG, SELFMAG) != 0 || header.e_phnum == 0) {
    return;
  }

  const auto* phdr = reinterpret_cast<const ElfW(Phdr)*>(ctx.linker_base + static_cast<uintptr_t>(header.e_phoff));
  uintptr_t lowest = 0;
  if (!lowest_load_vaddr(phdr, header.e_phnum, lowest)) {
    return;
  }

  dl_phdr_info info;
  std::memset(&info, 0, sizeof(info));
  info.dlpi_addr = static_cast<ElfW(Addr)>(ctx.linker_base - page_start(lowest));
  info.dlpi_name = ctx.profile->linker_path();
  info.dlpi_phdr = phdr;
  info.dlpi_phnum = static_cast<ElfW(Half)>(header.e_phnum);
  deliver(ctx, info, sizeof(info));
}

} // namespace

unsigned long read_proc_auxv(unsigned long type) {
  static const auxv_table table = load_auxv_table();
  for (size_t i = 0; i < table.count; ++i) {
    if (table.entries[i].a_type == type) {
      return static_cast<unsigned long>(table.entries[i].a_un.a_val);
    }
  }
  return 0;
}

size_t page_size() {
  static const size_t size = [] {
    const unsigned long value = auxv_value(AT_PAGESZ);
    if (value != 0) {
      return static_cast<size_t>(value);
    }
    const long configured = sysconf(_SC_PAGESIZE);
    return configured > 0 ? static_cast<size_t>(configured) : static_cast<size_t>(4096);
  }();
  return size;
}

uintptr_t image_start(const dl_phdr_info& info) {
  uintptr_t lowest = 0;
  if (!info.dlpi_phdr || !lowest_load_vaddr(info.dlpi_phdr, info.dlpi_phnum, lowest)) {
    return 0;
  }
  return static_cast<uintptr_t>(info.dlpi_addr) + page_start(lowest);
}

uintptr_t image_end(const dl_phdr_info& info) {
  uintptr_t highest = 0;
  for (size_t i = 0; info.dlpi_phdr && i < info.dlpi_phnum; ++i) {
    const ElfW(Phdr)& phdr = info.dlpi_phdr[i];
    if (phdr.p_type != PT_LOAD) {
      continue;
    }
    const uintptr_t end = static_cast<uintptr_t>(phdr.p_vaddr + phdr.p_memsz);
    if (end > highest) {
      highest = end;
    }
  }
  return highest == 0 ? 0 : static_cast<uintptr_t>(info.dlpi_addr) + highest;
}

bool is_main_image(const dl_phdr_info& info) {
  const uintptr_t main_phdr = static_cast<uintptr_t>(auxv_value(AT_PHDR));
  if (main_phdr != 0) {
    return reinterpret_cast<uintptr_t>(info.dlpi_phdr) == main_phdr;
  }
  // no auxv: the main image is the one the loader reports without a path
  return !info.dlpi_name || info.dlpi_name[0] == '\0' ||
         (std::strchr(info.dlpi_name, '/') == nullptr && std::strstr(info.dlpi_name, ".so") == nullptr);
}

bool is_linker_image(const dl_phdr_info& info) {
  const uintptr_t linker_base = static_cast<uintptr_t>(auxv_value(AT_BASE));
  return linker_base != 0 && image_start(info) == linker_base;
}

int iterate_phdr(
    const platform_profile& profile, phdr_callback callback, void* data, iterate_flags flags, loader_iterator loader
) {
  if (!callback) {
    return 0;
  }

  walk_context ctx;
  ctx.profile = &profile;
  ctx.callback = callback;
  ctx.data = data;
  ctx.flags = flags;
  ctx.loader = loader;
  ctx.linker_base = static_cast<uintptr_t>(auxv_value(AT_BASE));

  if (profile.uses_maps_enumeration()) {
    walk_maps(ctx);
  } else {
    walk_loader(ctx);
  }

  if (!ctx.stopped) {
    inject_linker(ctx);
  }
  return ctx.result;
}

int iterate_phdr(phdr_callback callback, void* data, iterate_flags flags) {
  return iterate_phdr(platform_profile::current(), callback, data, flags);
}

} // namespace elfscope::runtime

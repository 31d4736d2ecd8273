#include "elfscope/runtime/mapped_module.hpp"

#include "elfscope/base/interval.hpp"
#include "elfscope/base/path_utils.hpp"
#include "elfscope/elf/elf_image.hpp"
#include "elfscope/runtime/phdr_iterator.hpp"

namespace elfscope::runtime {

std::string_view mapped_module::name() const { return base::basename_view(path); }

bool mapped_module::contains(uintptr_t address) const noexcept {
  for (const auto& segment : segments) {
    const uint64_t start = load_bias + segment.vaddr;
    if (base::range_contains(start, base::range_end_saturating(start, segment.mem_size), address)) {
      return true;
    }
  }
  return false;
}

bool describe_module(const dl_phdr_info& info, mapped_module& out) {
  out = mapped_module{};
  if (!info.dlpi_phdr || info.dlpi_phnum == 0) {
    return false;
  }

  for (size_t i = 0; i < info.dlpi_phnum; ++i) {
    const ElfW(Phdr)& phdr = info.dlpi_phdr[i];
    if (phdr.p_type != PT_LOAD) {
      continue;
    }
    load_segment segment;
    segment.vaddr = phdr.p_vaddr;
    segment.offset = phdr.p_offset;
    segment.file_size = phdr.p_filesz;
    segment.mem_size = phdr.p_memsz;
    segment.flags = phdr.p_flags;
    out.segments.push_back(segment);
  }
  if (out.segments.empty()) {
    return false;
  }

  out.path = info.dlpi_name ? info.dlpi_name : "";
  out.load_bias = static_cast<uintptr_t>(info.dlpi_addr);
  out.base = image_start(info);
  const uintptr_t end = image_end(info);
  out.size = end > out.base ? end - out.base : 0;
  out.cls = sizeof(void*) == 8 ? elf::elf_class::elf64 : elf::elf_class::elf32;
  out.phdr = info.dlpi_phdr;
  out.phnum = info.dlpi_phnum;
  out.is_main_image = is_main_image(info);
  out.is_linker = is_linker_image(info);

  // the build id is optional; an image whose headers are not mapped is still reported
  auto image = elf::elf_image::parse_loaded(elf::byte_view::from_memory(out.base, out.size), out.load_bias);
  if (image.ok()) {
    out.build_id = image.value.build_id();
  }
  return true;
}

} // namespace elfscope::runtime

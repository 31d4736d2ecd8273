#include "elfscope/elf/elf_image.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#include <redlog.hpp>

namespace elfscope::elf {
namespace {

redlog::logger& reader_log() {
  static redlog::logger log = redlog::get_logger("elfscope.elf.reader");
  return log;
}

struct elf32_layout {
  using ehdr = Elf32_Ehdr;
  using phdr = Elf32_Phdr;
  using shdr = Elf32_Shdr;
  using dyn = Elf32_Dyn;
  using sym = Elf32_Sym;
};

struct elf64_layout {
  using ehdr = Elf64_Ehdr;
  using phdr = Elf64_Phdr;
  using shdr = Elf64_Shdr;
  using dyn = Elf64_Dyn;
  using sym = Elf64_Sym;
};

struct header_fields {
  uint16_t type = 0;
  uint16_t machine = 0;
  uint64_t phoff = 0;
  uint64_t shoff = 0;
  uint16_t phentsize = 0;
  uint16_t phnum = 0;
  uint16_t shentsize = 0;
  uint16_t shnum = 0;
  uint16_t shstrndx = 0;
};

template <typename types> std::optional<header_fields> read_header(const byte_view& view) {
  auto raw = view.read<typename types::ehdr>(0);
  if (!raw) {
    return std::nullopt;
  }

  header_fields fields;
  fields.type = raw->e_type;
  fields.machine = raw->e_machine;
  fields.phoff = raw->e_phoff;
  fields.shoff = raw->e_shoff;
  fields.phentsize = raw->e_phentsize;
  fields.phnum = raw->e_phnum;
  fields.shentsize = raw->e_shentsize;
  fields.shnum = raw->e_shnum;
  fields.shstrndx = raw->e_shstrndx;
  return fields;
}

template <typename types> segment read_segment(const byte_view& view, uint64_t offset) {
  const auto raw = *view.read<typename types::phdr>(offset);
  segment out;
  out.type = raw.p_type;
  out.flags = raw.p_flags;
  out.offset = raw.p_offset;
  out.vaddr = raw.p_vaddr;
  out.file_size = raw.p_filesz;
  out.mem_size = raw.p_memsz;
  out.align = raw.p_align;
  return out;
}

template <typename types> section read_section(const byte_view& view, uint64_t offset, uint32_t& name_offset) {
  const auto raw = *view.read<typename types::shdr>(offset);
  section out;
  name_offset = raw.sh_name;
  out.type = raw.sh_type;
  out.flags = raw.sh_flags;
  out.addr = raw.sh_addr;
  out.offset = raw.sh_offset;
  out.size = raw.sh_size;
  out.entry_size = raw.sh_entsize;
  out.link = raw.sh_link;
  out.info = raw.sh_info;
  return out;
}

bool machine_supported(elf_class cls, uint16_t machine) {
  if (cls == elf_class::elf32) {
    return machine == EM_ARM || machine == EM_386;
  }
  return machine == EM_AARCH64 || machine == EM_X86_64;
}

uint64_t align_up(uint64_t value, uint64_t align) { return (value + (align - 1)) & ~(align - 1); }

std::optional<std::vector<uint8_t>> find_build_id_note(const byte_view& notes, uint64_t align) {
  if (align != 8) {
    align = 4;
  }

  uint64_t offset = 0;
  while (notes.contains(offset, 12)) {
    const uint32_t name_size = *notes.read<uint32_t>(offset);
    const uint32_t desc_size = *notes.read<uint32_t>(offset + 4);
    const uint32_t note_type = *notes.read<uint32_t>(offset + 8);
    offset += 12;

    const uint64_t name_offset = offset;
    offset += align_up(name_size, align);
    const uint64_t desc_offset = offset;
    offset += align_up(desc_size, align);

    if (!notes.contains(name_offset, name_size) || !notes.contains(desc_offset, desc_size)) {
      break;
    }

    if (note_type == note_type_gnu_build_id && name_size == 4 &&
        std::memcmp(notes.data() + name_offset, "GNU", 4) == 0) {
      const uint8_t* desc = notes.data() + desc_offset;
      return std::vector<uint8_t>(desc, desc + desc_size);
    }
  }

  return std::nullopt;
}

} // namespace

const char* to_string(elf_class cls) { return cls == elf_class::elf32 ? "elf32" : "elf64"; }

const char* machine_name(uint16_t machine) {
  switch (machine) {
    case EM_ARM:
      return "arm";
    case EM_386:
      return "x86";
    case EM_AARCH64:
      return "arm64";
    case EM_X86_64:
      return "x86_64";
    default:
      return "unknown";
  }
}

base::result<elf_image> elf_image::parse(byte_view view) { return parse_view(view, layout::file, 0); }

base::result<elf_image> elf_image::parse_loaded(byte_view view, uint64_t load_bias) {
  const auto address = static_cast<uint64_t>(view.address());
  if (address < load_bias) {
    return base::error_result<elf_image>(base::error_code::invalid_argument, "view starts below the load bias");
  }
  return parse_view(view, layout::memory, address - load_bias);
}

base::result<elf_image> elf_image::parse_view(byte_view view, layout kind, uint64_t image_vaddr) {
  elf_image image;
  image.view_ = view;
  image.layout_ = kind;
  image.image_vaddr_ = image_vaddr;
  const base::error_code range_code = image.range_error();

  if (view.size() < SELFMAG) {
    return base::error_result<elf_image>(range_code, "view shorter than elf magic");
  }
  if (std::memcmp(view.data(), ELFMAG, SELFMAG) != 0) {
    return base::error_result<elf_image>(base::error_code::malformed_elf, "bad elf magic");
  }
  if (view.size() < EI_NIDENT) {
    return base::error_result<elf_image>(range_code, "view shorter than elf ident");
  }

  const uint8_t elf_class_byte = view.data()[EI_CLASS];
  if (elf_class_byte != ELFCLASS32 && elf_class_byte != ELFCLASS64) {
    return base::error_result<elf_image>(base::error_code::malformed_elf, "invalid elf class");
  }
  image.cls_ = static_cast<elf_class>(elf_class_byte);

  if (view.data()[EI_DATA] != ELFDATA2LSB) {
    return base::error_result<elf_image>(base::error_code::unsupported_arch, "big-endian elf is not supported");
  }

  const auto header =
      image.cls_ == elf_class::elf64 ? read_header<elf64_layout>(view) : read_header<elf32_layout>(view);
  if (!header) {
    return base::error_result<elf_image>(range_code, "elf header truncated");
  }

  image.type_ = header->type;
  image.machine_ = header->machine;
  if (!machine_supported(image.cls_, image.machine_)) {
    reader_log().dbg(
        "unsupported machine", redlog::field("class", to_string(image.cls_)), redlog::field("machine", image.machine_)
    );
    return base::error_result<elf_image>(
        base::error_code::unsupported_arch,
        std::string("unsupported machine for ") + to_string(image.cls_) + ": " + std::to_string(image.machine_)
    );
  }

  auto segment_status = image.parse_segments(header->phoff, header->phnum, header->phentsize);
  if (!segment_status.ok()) {
    return base::error_result<elf_image>(std::move(segment_status));
  }

  if (kind == layout::file) {
    auto section_status = image.parse_sections(header->shoff, header->shnum, header->shentsize, header->shstrndx);
    if (!section_status.ok()) {
      return base::error_result<elf_image>(std::move(section_status));
    }
  }

  image.parse_dynamic();

  reader_log().trc(
      "parsed elf image", redlog::field("class", to_string(image.cls_)),
      redlog::field("machine", machine_name(image.machine_)), redlog::field("segments", image.segments_.size()),
      redlog::field("sections", image.sections_.size()), redlog::field("dynamic", image.dynamic_.present)
  );
  return base::ok_result(std::move(image));
}

base::error_code elf_image::range_error() const noexcept {
  return layout_ == layout::file ? base::error_code::truncated : base::error_code::malformed_elf;
}

base::status elf_image::parse_segments(uint64_t phoff, uint16_t phnum, uint16_t phentsize) {
  if (phnum == 0) {
    return base::ok_status();
  }

  const size_t expected = cls_ == elf_class::elf64 ? sizeof(Elf64_Phdr) : sizeof(Elf32_Phdr);
  if (phentsize < expected) {
    return base::make_status(base::error_code::malformed_elf, "program header entry size too small");
  }
  if (!view_.contains(phoff, static_cast<uint64_t>(phnum) * phentsize)) {
    return base::make_status(range_error(), "program headers outside image");
  }

  segments_.reserve(phnum);
  for (uint16_t i = 0; i < phnum; ++i) {
    const uint64_t offset = phoff + static_cast<uint64_t>(i) * phentsize;
    segments_.push_back(
        cls_ == elf_class::elf64 ? read_segment<elf64_layout>(view_, offset) : read_segment<elf32_layout>(view_, offset)
    );
  }

  return base::ok_status();
}

base::status elf_image::parse_sections(uint64_t shoff, uint16_t shnum, uint16_t shentsize, uint16_t shstrndx) {
  // no section table, or an extended count we do not follow
  if (shoff == 0 || shnum == 0) {
    return base::ok_status();
  }

  const size_t expected = cls_ == elf_class::elf64 ? sizeof(Elf64_Shdr) : sizeof(Elf32_Shdr);
  if (shentsize < expected) {
    return base::make_status(base::error_code::malformed_elf, "section header entry size too small");
  }
  if (!view_.contains(shoff, static_cast<uint64_t>(shnum) * shentsize)) {
    return base::make_status(range_error(), "section headers outside image");
  }

  std::vector<uint32_t> name_offsets(shnum, 0);
  sections_.reserve(shnum);
  for (uint16_t i = 0; i < shnum; ++i) {
    const uint64_t offset = shoff + static_cast<uint64_t>(i) * shentsize;
    sections_.push_back(
        cls_ == elf_class::elf64 ? read_section<elf64_layout>(view_, offset, name_offsets[i])
                                 : read_section<elf32_layout>(view_, offset, name_offsets[i])
    );
  }

  if (shstrndx != SHN_UNDEF && shstrndx < sections_.size()) {
    const byte_view names = section_data(sections_[shstrndx]);
    for (size_t i = 0; i < sections_.size(); ++i) {
      sections_[i].name = names.c_string(name_offsets[i]).value_or(std::string_view{});
    }
  }

  return base::ok_status();
}

void elf_image::parse_dynamic() {
  byte_view entries;
  for (const auto& seg : segments_) {
    if (seg.type != PT_DYNAMIC) {
      continue;
    }
    entries = layout_ == layout::file ? view_.sub(seg.offset, seg.file_size) : vaddr_view(seg.vaddr, seg.file_size);
    break;
  }
  if (entries.empty() && layout_ == layout::file) {
    if (const section* dynamic_section = section_by_type(SHT_DYNAMIC)) {
      entries = section_data(*dynamic_section);
    }
  }
  if (entries.empty()) {
    return;
  }

  dynamic_.present = true;
  const size_t entry_size = cls_ == elf_class::elf64 ? sizeof(Elf64_Dyn) : sizeof(Elf32_Dyn);
  for (uint64_t offset = 0; entries.contains(offset, entry_size); offset += entry_size) {
    int64_t tag = 0;
    uint64_t value = 0;
    if (cls_ == elf_class::elf64) {
      const auto raw = *entries.read<Elf64_Dyn>(offset);
      tag = raw.d_tag;
      value = raw.d_un.d_val;
    } else {
      const auto raw = *entries.read<Elf32_Dyn>(offset);
      tag = raw.d_tag;
      value = raw.d_un.d_val;
    }

    if (tag == DT_NULL) {
      break;
    }

    switch (tag) {
      case DT_SYMTAB:
        dynamic_.symtab = normalize_dynamic_pointer(value);
        break;
      case DT_STRTAB:
        dynamic_.strtab = normalize_dynamic_pointer(value);
        break;
      case DT_STRSZ:
        dynamic_.strsz = value;
        break;
      case DT_SYMENT:
        dynamic_.syment = value;
        break;
      case DT_HASH:
        dynamic_.hash = normalize_dynamic_pointer(value);
        break;
      case DT_SONAME:
        dynamic_.soname = value;
        break;
      case DT_NEEDED:
        dynamic_.needed.push_back(value);
        break;
      default:
        if (tag == dynamic_tag_gnu_hash) {
          dynamic_.gnu_hash = normalize_dynamic_pointer(value);
        }
        break;
    }
  }
}

const segment* elf_image::load_segment_for(uint64_t vaddr) const {
  for (const auto& seg : segments_) {
    if (!seg.is_load()) {
      continue;
    }
    if (layout_ == layout::memory && !seg.readable()) {
      continue;
    }
    const uint64_t extent = layout_ == layout::file ? seg.file_size : seg.mem_size;
    if (base::range_contains(seg.vaddr, base::range_end_saturating(seg.vaddr, extent), vaddr)) {
      return &seg;
    }
  }
  return nullptr;
}

// some loaders rewrite d_ptr entries to absolute addresses in place
uint64_t elf_image::normalize_dynamic_pointer(uint64_t pointer) const {
  if (layout_ != layout::memory) {
    return pointer;
  }
  const uint64_t load_bias = static_cast<uint64_t>(view_.address()) - image_vaddr_;
  if (load_bias != 0 && pointer >= load_bias && load_segment_for(pointer - load_bias)) {
    return pointer - load_bias;
  }
  return pointer;
}

std::optional<uint64_t> elf_image::vaddr_to_offset(uint64_t vaddr) const {
  const segment* seg = load_segment_for(vaddr);
  if (!seg) {
    return std::nullopt;
  }

  const uint64_t offset = layout_ == layout::file ? seg->offset + (vaddr - seg->vaddr) : vaddr - image_vaddr_;
  if (offset >= view_.size()) {
    return std::nullopt;
  }
  return offset;
}

byte_view elf_image::vaddr_view(uint64_t vaddr, uint64_t size) const {
  const segment* seg = load_segment_for(vaddr);
  if (!seg) {
    return {};
  }

  const uint64_t extent = layout_ == layout::file ? seg->file_size : seg->mem_size;
  if (!base::span_fits(vaddr - seg->vaddr, size, extent)) {
    return {};
  }

  const auto offset = vaddr_to_offset(vaddr);
  if (!offset) {
    return {};
  }
  return view_.sub(*offset, size);
}

byte_view elf_image::vaddr_tail(uint64_t vaddr) const {
  const segment* seg = load_segment_for(vaddr);
  if (!seg) {
    return {};
  }

  const uint64_t extent = layout_ == layout::file ? seg->file_size : seg->mem_size;
  const auto offset = vaddr_to_offset(vaddr);
  if (!offset) {
    return {};
  }

  const uint64_t in_segment = extent - (vaddr - seg->vaddr);
  const uint64_t in_view = view_.size() - *offset;
  return view_.sub(*offset, std::min(in_segment, in_view));
}

const section* elf_image::section_by_name(std::string_view name) const {
  for (const auto& sec : sections_) {
    if (sec.name == name) {
      return &sec;
    }
  }
  return nullptr;
}

const section* elf_image::section_by_type(uint32_t type) const {
  for (const auto& sec : sections_) {
    if (sec.type == type) {
      return &sec;
    }
  }
  return nullptr;
}

byte_view elf_image::section_data(const section& sec) const {
  if (sec.type == SHT_NOBITS || sec.type == SHT_NULL) {
    return {};
  }
  if (layout_ == layout::memory) {
    return sec.addr != 0 ? vaddr_view(sec.addr, sec.size) : byte_view{};
  }
  return view_.sub(sec.offset, sec.size);
}

std::vector<uint8_t> elf_image::build_id() const {
  for (const auto& seg : segments_) {
    if (seg.type != PT_NOTE) {
      continue;
    }
    const byte_view notes =
        layout_ == layout::file ? view_.sub(seg.offset, seg.file_size) : vaddr_view(seg.vaddr, seg.file_size);
    if (auto id = find_build_id_note(notes, seg.align)) {
      return *id;
    }
  }

  for (const auto& sec : sections_) {
    if (sec.type != SHT_NOTE) {
      continue;
    }
    if (auto id = find_build_id_note(section_data(sec), 4)) {
      return *id;
    }
  }

  return {};
}

byte_view elf_image::dynamic_strings() const {
  if (!dynamic_.present || dynamic_.strtab == 0) {
    return {};
  }
  if (dynamic_.strsz != 0) {
    byte_view strings = vaddr_view(dynamic_.strtab, dynamic_.strsz);
    if (!strings.empty()) {
      return strings;
    }
  }
  return vaddr_tail(dynamic_.strtab);
}

std::vector<std::string> elf_image::needed() const {
  std::vector<std::string> out;
  const byte_view strings = dynamic_strings();
  for (uint64_t offset : dynamic_.needed) {
    if (auto name = strings.c_string(offset)) {
      out.emplace_back(*name);
    }
  }
  return out;
}

std::string elf_image::soname() const {
  if (!dynamic_.soname) {
    return {};
  }
  auto name = dynamic_strings().c_string(*dynamic_.soname);
  return name ? std::string(*name) : std::string();
}

std::optional<size_t> elf_image::dynamic_symbol_count() const {
  if (dynamic_.hash != 0) {
    const byte_view header = vaddr_view(dynamic_.hash, 8);
    if (auto nchain = header.read<uint32_t>(4)) {
      return static_cast<size_t>(*nchain);
    }
  }

  if (dynamic_.gnu_hash == 0) {
    return std::nullopt;
  }

  const byte_view table = vaddr_tail(dynamic_.gnu_hash);
  const auto bucket_count = table.read<uint32_t>(0);
  const auto symbol_offset = table.read<uint32_t>(4);
  const auto bloom_size = table.read<uint32_t>(8);
  if (!bucket_count || !symbol_offset || !bloom_size) {
    return std::nullopt;
  }

  const uint64_t word_size = cls_ == elf_class::elf64 ? 8 : 4;
  const uint64_t buckets_offset = 16 + static_cast<uint64_t>(*bloom_size) * word_size;
  uint32_t last_bucket = 0;
  for (uint32_t i = 0; i < *bucket_count; ++i) {
    const auto bucket = table.read<uint32_t>(buckets_offset + static_cast<uint64_t>(i) * 4);
    if (!bucket) {
      return std::nullopt;
    }
    last_bucket = std::max(last_bucket, *bucket);
  }

  if (last_bucket < *symbol_offset) {
    return static_cast<size_t>(*symbol_offset);
  }

  // follow the chain of the highest bucket until its terminator bit
  const uint64_t chains_offset = buckets_offset + static_cast<uint64_t>(*bucket_count) * 4;
  for (uint64_t index = last_bucket;; ++index) {
    const auto chain = table.read<uint32_t>(chains_offset + (index - *symbol_offset) * 4);
    if (!chain) {
      return std::nullopt;
    }
    if ((*chain & 1u) != 0) {
      return static_cast<size_t>(index + 1);
    }
  }
}

symbol_source elf_image::section_symbols(uint32_t type) const {
  const section* sec = section_by_type(type);
  if (!sec) {
    return {};
  }

  symbol_source source;
  source.cls = cls_;
  source.machine = machine_;
  source.symbols = section_data(*sec);
  if (sec->link < sections_.size()) {
    source.strings = section_data(sections_[sec->link]);
  }
  const size_t minimum = cls_ == elf_class::elf64 ? sizeof(Elf64_Sym) : sizeof(Elf32_Sym);
  source.entry_size = sec->entry_size >= minimum ? static_cast<size_t>(sec->entry_size) : minimum;
  source.count = source.symbols.size() / source.entry_size;
  return source;
}

symbol_source elf_image::dynamic_symbols() const {
  if (layout_ == layout::file) {
    symbol_source from_sections = section_symbols(SHT_DYNSYM);
    if (from_sections.valid()) {
      return from_sections;
    }
  }

  if (!dynamic_.present || dynamic_.symtab == 0) {
    return {};
  }

  const auto count = dynamic_symbol_count();
  if (!count || *count == 0) {
    reader_log().dbg("dynamic symbol count unavailable");
    return {};
  }

  symbol_source source;
  source.cls = cls_;
  source.machine = machine_;
  const size_t minimum = cls_ == elf_class::elf64 ? sizeof(Elf64_Sym) : sizeof(Elf32_Sym);
  source.entry_size = dynamic_.syment >= minimum ? static_cast<size_t>(dynamic_.syment) : minimum;
  if (*count > std::numeric_limits<size_t>::max() / source.entry_size) {
    return {};
  }
  source.symbols = vaddr_view(dynamic_.symtab, static_cast<uint64_t>(*count) * source.entry_size);
  if (source.symbols.empty()) {
    return {};
  }
  source.count = *count;
  source.strings = dynamic_strings();
  return source;
}

symbol_source elf_image::regular_symbols() const { return section_symbols(SHT_SYMTAB); }

} // namespace elfscope::elf

#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "elf_builder.hpp"
#include "elfscope/elf/elf_image.hpp"
#include "elfscope/symbols/symbol_match.hpp"
#include "elfscope/symbols/symbol_table.hpp"

using elfscope::elf::byte_view;
using elfscope::elf::elf_image;
using elfscope::symbols::symbol_table;
using elfscope::symbols::table_kind;
using elfscope::test::build_elf;
using elfscope::test::elf_options;
using elfscope::test::test_symbol;

namespace {

struct built_table {
  std::vector<uint8_t> bytes;
  symbol_table dynamic;
  symbol_table regular;
};

built_table make_tables(const elf_options& options) {
  built_table out;
  out.bytes = build_elf(options);
  auto image = elf_image::parse(byte_view(out.bytes.data(), out.bytes.size()));
  REQUIRE(image.ok());
  out.dynamic = symbol_table::build(table_kind::dynamic, image.value.dynamic_symbols());
  out.regular = symbol_table::build(table_kind::regular, image.value.regular_symbols());
  return out;
}

} // namespace

TEST_CASE("elfscope symbol_match strips versions and lto suffixes") {
  using namespace elfscope::symbols;
  CHECK(strip_version("memcpy@@GLIBC_2.14") == "memcpy");
  CHECK(strip_version("memcpy@GLIBC_2.2.5") == "memcpy");
  CHECK(strip_lto_suffix("helper.llvm.123456") == "helper");
  CHECK(strip_lto_suffix("helper.llvm.") == "helper.llvm.");
  CHECK(strip_lto_suffix("helper.llvm.12a") == "helper.llvm.12a");

  CHECK(symbol_name_matches("memcpy@@GLIBC_2.14", "memcpy", false));
  CHECK(symbol_name_matches("helper.llvm.42", "helper", true));
  CHECK_FALSE(symbol_name_matches("helper.llvm.42", "helper", false));
  CHECK_FALSE(symbol_name_matches("memcpy_chk", "memcpy", true));
  CHECK_FALSE(symbol_name_matches("memcpy", "", true));
}

TEST_CASE("elfscope symbol_table keeps the first defined duplicate") {
  elf_options options;
  options.dynamic_symbols = {
      test_symbol{"dup", 0, 0, STT_FUNC, STB_GLOBAL, SHN_UNDEF},
      test_symbol{"dup", 0x200, 8},
      test_symbol{"dup", 0x300, 8, STT_FUNC, STB_WEAK},
  };
  auto tables = make_tables(options);

  const auto* entry = tables.dynamic.find_by_name("dup");
  REQUIRE(entry != nullptr);
  CHECK(entry->value == 0x200);
  CHECK(entry->position == 1);
}

TEST_CASE("elfscope symbol_table drops nameless entries") {
  elf_options options;
  options.dynamic_symbols = {{"", 0x100, 4}, {"named", 0x200, 4}};
  auto tables = make_tables(options);

  CHECK(tables.dynamic.size() == 1);
  CHECK(tables.dynamic.name_of(tables.dynamic.entries()[0]) == "named");
  CHECK(tables.dynamic.find_by_name("") == nullptr);
}

TEST_CASE("elfscope symbol_table matches version tags") {
  elf_options options;
  options.dynamic_symbols = {{"fopen@@LIBC_1.0", 0x400, 4}, {"fopen64", 0x500, 4}};
  auto tables = make_tables(options);

  const auto* versioned = tables.dynamic.find_by_name("fopen");
  REQUIRE(versioned != nullptr);
  CHECK(versioned->value == 0x400);

  const auto* exact = tables.dynamic.find_by_name("fopen@@LIBC_1.0");
  REQUIRE(exact != nullptr);
  CHECK(exact->value == 0x400);
}

TEST_CASE("elfscope symbol_table lto suffixes only outside the dynamic table") {
  elf_options options;
  options.dynamic_symbols = {{"worker.llvm.9911", 0x600, 4}};
  options.regular_symbols = {{"worker.llvm.9911", 0x600, 4, STT_FUNC, STB_LOCAL}};
  auto tables = make_tables(options);

  CHECK(tables.dynamic.find_by_name("worker") == nullptr);
  const auto* regular = tables.regular.find_by_name("worker");
  REQUIRE(regular != nullptr);
  CHECK(regular->value == 0x600);
}

TEST_CASE("elfscope symbol_table finds the nearest preceding symbol") {
  elf_options options;
  options.dynamic_symbols = {
      {"first", 0x1000, 0x10},
      {"second", 0x2000, 0x10},
      {"alias_of_second", 0x2000, 0x10},
      {"section_marker", 0x1800, 0, STT_SECTION},
      {"data_blob", 0x3000, 0x40, STT_OBJECT},
  };
  auto tables = make_tables(options);

  CHECK(tables.dynamic.find_nearest(0x0fff) == nullptr);

  const auto* first = tables.dynamic.find_nearest(0x1000);
  REQUIRE(first != nullptr);
  CHECK(tables.dynamic.name_of(*first) == "first");

  // section symbols are not address candidates
  const auto* still_first = tables.dynamic.find_nearest(0x1900);
  REQUIRE(still_first != nullptr);
  CHECK(tables.dynamic.name_of(*still_first) == "first");

  const auto* tie = tables.dynamic.find_nearest(0x2008);
  REQUIRE(tie != nullptr);
  CHECK(tables.dynamic.name_of(*tie) == "second");

  // no size bound on the nearest match
  const auto* far = tables.dynamic.find_nearest(0x9000);
  REQUIRE(far != nullptr);
  CHECK(tables.dynamic.name_of(*far) == "data_blob");
}

TEST_CASE("elfscope symbol_table clears the thumb bit on arm32 functions") {
  elf_options options;
  options.cls = ELFCLASS32;
  options.machine = EM_ARM;
  options.dynamic_symbols = {
      {"thumb_func", 0x1001, 0x20},
      {"odd_object", 0x2001, 0x4, STT_OBJECT},
  };
  auto tables = make_tables(options);

  const auto* thumb = tables.dynamic.find_by_name("thumb_func");
  REQUIRE(thumb != nullptr);
  CHECK(thumb->value == 0x1001);
  CHECK(thumb->address_value == 0x1000);
  CHECK(thumb->is_thumb());

  const auto* nearest = tables.dynamic.find_nearest(0x1000);
  REQUIRE(nearest != nullptr);
  CHECK(tables.dynamic.name_of(*nearest) == "thumb_func");

  const auto* object = tables.dynamic.find_by_name("odd_object");
  REQUIRE(object != nullptr);
  CHECK(object->address_value == 0x2001);
  CHECK_FALSE(object->is_thumb());
}

TEST_CASE("elfscope symbol_table leaves x86 values untouched") {
  elf_options options;
  options.cls = ELFCLASS32;
  options.machine = EM_386;
  options.dynamic_symbols = {{"odd_func", 0x1001, 0x20}};
  auto tables = make_tables(options);

  const auto* entry = tables.dynamic.find_by_name("odd_func");
  REQUIRE(entry != nullptr);
  CHECK(entry->address_value == 0x1001);
}

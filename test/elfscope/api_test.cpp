#include <doctest/doctest.h>

#include <cstdint>
#include <string>

#include <dlfcn.h>
#include <link.h>

#include "elfscope/elfscope.hpp"
#include "test_paths.hpp"

using elfscope::address_flags;
using elfscope::error_code;
using elfscope::library;
using elfscope::lookup_scope;
using elfscope::open_mode;
using elfscope::table_kind;

namespace {

void api_marker() {}

struct fixture_entry {
  dl_phdr_info info{};
  bool found = false;
};

int find_fixture_entry(struct dl_phdr_info* info, size_t, void* data) {
  auto* entry = static_cast<fixture_entry*>(data);
  const std::string name = info->dlpi_name ? info->dlpi_name : "";
  if (name == elfscope::test_paths::fixture_path()) {
    entry->info = *info;
    entry->found = true;
    return 1;
  }
  return 0;
}

} // namespace

TEST_CASE("elfscope api resolves fixture symbols") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);

  auto lib = library::open(elfscope::test_paths::fixture_path());
  REQUIRE(lib.ok());
  CHECK(lib.value.valid());
  CHECK(lib.value.loader_handle() == nullptr);

  auto add = lib.value.symbol("elfscope_fixture_add");
  REQUIRE(add.ok());
  CHECK(reinterpret_cast<void*>(add.value.address) == fixture.symbol("elfscope_fixture_add"));
  CHECK(add.value.table == table_kind::dynamic);
  CHECK(add.value.size > 0);

  auto counter = lib.value.find("elfscope_fixture_counter");
  REQUIRE(counter.ok());
  CHECK(reinterpret_cast<void*>(counter.value.address) == fixture.symbol("elfscope_fixture_counter"));
  CHECK(counter.value.size == sizeof(uint32_t));

  using add_fn = int (*)(int, int);
  CHECK(reinterpret_cast<add_fn>(add.value.address)(2, 3) == 5);
}

TEST_CASE("elfscope api finds hidden symbols through the debug scope") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);

  auto lib = library::open(elfscope::test_paths::fixture_name());
  REQUIRE(lib.ok());

  CHECK(lib.value.symbol("elfscope_fixture_hidden_sum").code() == error_code::not_found);

  auto hidden = lib.value.debug_symbol("elfscope_fixture_hidden_sum");
  REQUIRE(hidden.ok());
  CHECK(hidden.value.table == table_kind::regular);
  CHECK(lib.value.module().contains(hidden.value.address));

  using sum_fn = int (*)(int, int);
  CHECK(reinterpret_cast<sum_fn>(hidden.value.address)(1, 2) == 10);

  auto through_all = lib.value.find("elfscope_fixture_hidden_sum", lookup_scope::all);
  REQUIRE(through_all.ok());
  CHECK(through_all.value.address == hidden.value.address);
}

TEST_CASE("elfscope api describes opened modules") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);

  auto lib = library::open(elfscope::test_paths::fixture_path());
  REQUIRE(lib.ok());
  auto info = lib.value.info();
  REQUIRE(info.ok());
  CHECK(info.value.path == elfscope::test_paths::fixture_path());
  CHECK(info.value.base != 0);
  CHECK(info.value.size > 0);
  CHECK(info.value.phdr != nullptr);
  CHECK(info.value.phnum > 0);

  library moved = std::move(lib.value);
  CHECK(moved.valid());
  CHECK_FALSE(lib.value.valid());
  CHECK(lib.value.info().code() == error_code::invalid_argument);
  CHECK(lib.value.symbol("elfscope_fixture_add").code() == error_code::invalid_argument);
}

TEST_CASE("elfscope api owns handles from forced loads") {
  auto lib = library::open(elfscope::test_paths::fixture_path(), open_mode::always_force_load);
  REQUIRE(lib.ok());
  REQUIRE(lib.value.loader_handle() != nullptr);
  CHECK(lib.value.symbol("elfscope_fixture_name").ok());

  void* handle = lib.value.release();
  CHECK(handle != nullptr);
  CHECK_FALSE(lib.value.valid());
  CHECK(lib.value.loader_handle() == nullptr);

  // still mapped: release handed the reference to us
  CHECK(dlsym(handle, "elfscope_fixture_add") != nullptr);
  dlclose(handle);
}

TEST_CASE("elfscope api reports open failures") {
  CHECK(library::open("").code() == error_code::invalid_argument);
  CHECK(library::open("libelfscope_missing_module.so").code() == error_code::not_found);
}

TEST_CASE("elfscope api builds libraries from phdr entries") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);

  fixture_entry entry;
  elfscope::iterate_phdr(find_fixture_entry, &entry);
  REQUIRE(entry.found);

  auto lib = library::from_phdr(entry.info);
  REQUIRE(lib.ok());
  auto add = lib.value.symbol("elfscope_fixture_add");
  REQUIRE(add.ok());
  CHECK(reinterpret_cast<void*>(add.value.address) == fixture.symbol("elfscope_fixture_add"));

  dl_phdr_info empty{};
  CHECK(library::from_phdr(empty).code() == error_code::invalid_argument);
}

TEST_CASE("elfscope api address_info names fixture symbols") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);
  auto* add = static_cast<uint8_t*>(fixture.symbol("elfscope_fixture_add"));
  REQUIRE(add != nullptr);

  auto at_start = elfscope::address_info(add);
  REQUIRE(at_start.ok());
  CHECK(at_start.value.has_symbol);
  CHECK(at_start.value.module_path == elfscope::test_paths::fixture_path());
  CHECK(at_start.value.symbol_name == "elfscope_fixture_add");
  CHECK(at_start.value.symbol_address == reinterpret_cast<uintptr_t>(add));
  CHECK(at_start.value.offset == 0);
  CHECK(at_start.value.phdr != nullptr);

  elfscope::address_cache cache;
  auto inside = elfscope::address_info(add + 1, address_flags::none, &cache);
  REQUIRE(inside.ok());
  CHECK(inside.value.symbol_name == "elfscope_fixture_add");
  CHECK(inside.value.offset == 1);
  CHECK(cache.size() == 1);

  auto module_only = elfscope::address_info(add, address_flags::no_symbol);
  REQUIRE(module_only.ok());
  CHECK_FALSE(module_only.value.has_symbol);
  CHECK(module_only.value.symbol_name.empty());
  CHECK(module_only.value.offset == reinterpret_cast<uintptr_t>(add) - module_only.value.module_base);
}

TEST_CASE("elfscope api address_info resolves libc") {
  void* libc = dlopen("libc.so.6", RTLD_NOW | RTLD_NOLOAD);
  REQUIRE(libc != nullptr);
  void* target = dlsym(libc, "getpid");
  REQUIRE(target != nullptr);

  auto record = elfscope::address_info(target);
  REQUIRE(record.ok());
  CHECK(record.value.has_symbol);
  CHECK(record.value.symbol_address == reinterpret_cast<uintptr_t>(target));
  CHECK(record.value.offset == 0);
  CHECK(record.value.module_path.find("libc") != std::string::npos);

  auto lib = library::open("libc.so.6");
  REQUIRE(lib.ok());
  auto resolved = lib.value.symbol("getpid");
  REQUIRE(resolved.ok());
  CHECK(reinterpret_cast<void*>(resolved.value.address) == target);

  dlclose(libc);
}

TEST_CASE("elfscope api address_info rejects unmapped addresses") {
  int on_stack = 0;
  CHECK(elfscope::address_info(nullptr).code() == error_code::invalid_argument);
  CHECK(elfscope::address_info(&on_stack).code() == error_code::not_mapped);

  auto main_image = elfscope::address_info(reinterpret_cast<const void*>(&api_marker));
  REQUIRE(main_image.ok());
  CHECK(main_image.value.module_path == elfscope::test_paths::executable_path());
}

TEST_CASE("elfscope api iterate_modules stops early") {
  size_t visited = 0;
  elfscope::iterate_modules([&](const elfscope::runtime::mapped_module& module) {
    CHECK_FALSE(module.path.empty());
    ++visited;
    return false;
  });
  CHECK(visited == 1);

  size_t total = 0;
  elfscope::iterate_modules([&](const elfscope::runtime::mapped_module&) {
    ++total;
    return true;
  });
  CHECK(total > 1);
}

TEST_CASE("elfscope api exposes the platform profile") {
  const auto& profile = elfscope::platform();
  CHECK(profile.arch() == elfscope::runtime::current_arch());
  CHECK(&profile == &elfscope::platform());
}

#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <link.h>

#include "elfscope/runtime/module_enumerator.hpp"
#include "elfscope/runtime/module_registry.hpp"
#include "elfscope/runtime/phdr_iterator.hpp"
#include "elfscope/runtime/platform_profile.hpp"
#include "test_paths.hpp"

using elfscope::runtime::iterate_flags;
using elfscope::runtime::mapped_module;
using elfscope::runtime::module_enumerator;
using elfscope::runtime::module_registry;

namespace {

void enumerator_marker() {}

std::set<std::string> path_set(const std::vector<mapped_module>& modules) {
  std::set<std::string> out;
  for (const auto& module : modules) {
    out.insert(module.path);
  }
  return out;
}

const mapped_module* find_path(const std::vector<mapped_module>& modules, const std::string& path) {
  auto it = std::find_if(modules.begin(), modules.end(), [&](const mapped_module& module) {
    return module.path == path;
  });
  return it == modules.end() ? nullptr : &*it;
}

struct walk_counter {
  size_t calls = 0;
  size_t stop_after = 0;
};

int count_images(struct dl_phdr_info* info, size_t, void* data) {
  auto* counter = static_cast<walk_counter*>(data);
  CHECK(info->dlpi_phdr != nullptr);
  ++counter->calls;
  return counter->stop_after != 0 && counter->calls >= counter->stop_after ? 7 : 0;
}

mapped_module fake_module(uintptr_t base, const std::string& path) {
  mapped_module module;
  module.path = path;
  module.base = base;
  module.load_bias = base;
  module.size = 0x1000;
  return module;
}

} // namespace

TEST_CASE("elfscope module_enumerator snapshot includes the main image") {
  module_enumerator enumerator;
  const auto modules = enumerator.snapshot();
  REQUIRE_FALSE(modules.empty());

  const auto exe = elfscope::test_paths::executable_path();
  const mapped_module* main_image = find_path(modules, exe);
  REQUIRE(main_image != nullptr);
  CHECK(main_image->is_main_image);
  CHECK(main_image->size > 0);
  CHECK(main_image->phdr != nullptr);
  CHECK(main_image->phnum > 0);
  CHECK(main_image->generation != 0);
  CHECK(main_image->contains(reinterpret_cast<uintptr_t>(&enumerator_marker)));

  for (const auto& module : modules) {
    CHECK_FALSE(module.path.empty());
    CHECK(module.base != 0);
    CHECK_FALSE(module.segments.empty());
  }
}

TEST_CASE("elfscope module_enumerator snapshots are stable") {
  module_enumerator enumerator;
  const auto first = enumerator.snapshot();
  const auto second = enumerator.snapshot();

  CHECK(path_set(first) == path_set(second));
  for (const auto& module : first) {
    const mapped_module* again = find_path(second, module.path);
    REQUIRE(again != nullptr);
    CHECK(again->base == module.base);
    CHECK(again->generation == module.generation);
  }
}

TEST_CASE("elfscope module_enumerator sees a loaded fixture") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);
  void* exported = fixture.symbol("elfscope_fixture_add");
  REQUIRE(exported != nullptr);

  module_enumerator enumerator;
  auto module = enumerator.find_containing(reinterpret_cast<uintptr_t>(exported));
  REQUIRE(module.has_value());
  CHECK(module->name() == elfscope::test_paths::fixture_name());
  CHECK(module->path.front() == '/');
  CHECK_FALSE(module->is_main_image);

  const auto modules = enumerator.snapshot();
  bool listed = false;
  for (const auto& candidate : modules) {
    listed = listed || candidate.base == module->base;
  }
  CHECK(listed);
}

TEST_CASE("elfscope module_enumerator find_containing misses unmapped addresses") {
  module_enumerator enumerator;
  CHECK_FALSE(enumerator.find_containing(0).has_value());
  CHECK_FALSE(enumerator.find_containing(1).has_value());
}

TEST_CASE("elfscope module_enumerator describes phdr entries") {
  struct first_entry {
    dl_phdr_info info{};
    bool found = false;
  } entry;

  elfscope::runtime::iterate_phdr(
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* out = static_cast<first_entry*>(data);
        if (!elfscope::runtime::is_main_image(*info)) {
          return 0;
        }
        out->info = *info;
        out->found = true;
        return 1;
      },
      &entry
  );
  REQUIRE(entry.found);

  module_enumerator enumerator;
  auto module = enumerator.describe(entry.info);
  REQUIRE(module.has_value());
  CHECK(module->is_main_image);
  CHECK(module->path == elfscope::test_paths::executable_path());
}

TEST_CASE("elfscope module_enumerator maps walk finds file-backed images") {
  elfscope::test_paths::fixture_handle fixture;
  REQUIRE(fixture.get() != nullptr);

  auto profile = elfscope::runtime::make_profile(0, elfscope::runtime::current_arch(), true);
  REQUIRE(profile->uses_maps_enumeration());
  module_registry registry;
  module_enumerator enumerator(*profile, registry);

  const auto modules = enumerator.snapshot();
  REQUIRE_FALSE(modules.empty());

  const mapped_module* main_image = find_path(modules, elfscope::test_paths::executable_path());
  REQUIRE(main_image != nullptr);
  CHECK(main_image->is_main_image);

  bool fixture_listed = false;
  for (const auto& module : modules) {
    CHECK(module.path.front() == '/');
    fixture_listed = fixture_listed || module.name() == elfscope::test_paths::fixture_name();
  }
  CHECK(fixture_listed);
}

TEST_CASE("elfscope phdr iterator stops on a non-zero return") {
  walk_counter all;
  CHECK(elfscope::runtime::iterate_phdr(count_images, &all) == 0);
  REQUIRE(all.calls > 1);

  walk_counter first;
  first.stop_after = 1;
  CHECK(elfscope::runtime::iterate_phdr(count_images, &first) == 7);
  CHECK(first.calls == 1);

  CHECK(elfscope::runtime::iterate_phdr(nullptr, nullptr) == 0);
}

TEST_CASE("elfscope phdr iterator expands the main image name") {
  struct name_sink {
    std::string main_name;
  } observed;

  elfscope::runtime::iterate_phdr(
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        if (elfscope::runtime::is_main_image(*info)) {
          static_cast<name_sink*>(data)->main_name = info->dlpi_name ? info->dlpi_name : "";
          return 1;
        }
        return 0;
      },
      &observed, iterate_flags::full_pathname
  );
  CHECK(observed.main_name == elfscope::test_paths::executable_path());
}

TEST_CASE("elfscope module_registry keeps generations for unchanged images") {
  module_registry registry;
  std::vector<mapped_module> modules = {fake_module(0x10000, "/lib/a.so"), fake_module(0x20000, "/lib/b.so")};
  registry.refresh(modules);
  const uint64_t a_generation = modules[0].generation;
  const uint64_t b_generation = modules[1].generation;
  CHECK(a_generation != 0);
  CHECK(a_generation != b_generation);
  CHECK(registry.size() == 2);

  std::vector<mapped_module> again = {fake_module(0x10000, "/lib/a.so"), fake_module(0x20000, "/lib/b.so")};
  registry.refresh(again);
  CHECK(again[0].generation == a_generation);
  CHECK(again[1].generation == b_generation);
}

TEST_CASE("elfscope module_registry renews generations after unload and reuse") {
  module_registry registry;
  std::vector<mapped_module> modules = {fake_module(0x10000, "/lib/a.so"), fake_module(0x20000, "/lib/b.so")};
  registry.refresh(modules);
  const uint64_t b_generation = modules[1].generation;
  const uint64_t version = registry.version();

  std::vector<mapped_module> without_b = {fake_module(0x10000, "/lib/a.so")};
  registry.refresh(without_b);
  CHECK(registry.size() == 1);
  CHECK(registry.version() > version);

  std::vector<mapped_module> reloaded = {fake_module(0x10000, "/lib/a.so"), fake_module(0x20000, "/lib/b.so")};
  registry.refresh(reloaded);
  CHECK(reloaded[1].generation != b_generation);

  auto replaced = fake_module(0x10000, "/lib/c.so");
  const uint64_t a_generation = reloaded[0].generation;
  CHECK(registry.observe(replaced) != a_generation);
  CHECK(replaced.generation != a_generation);
}

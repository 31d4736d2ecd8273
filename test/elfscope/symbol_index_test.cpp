#include <doctest/doctest.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "elf_builder.hpp"
#include "elfscope/symbols/module_symbols.hpp"
#include "elfscope/symbols/symbol_cache.hpp"
#include "elfscope/symbols/symbol_index.hpp"

using elfscope::base::error_code;
using elfscope::symbols::lookup_scope;
using elfscope::symbols::module_symbols;
using elfscope::symbols::symbol_index;
using elfscope::symbols::symbol_options;
using elfscope::symbols::table_kind;
using elfscope::test::build_elf;
using elfscope::test::elf_options;
using elfscope::test::test_symbol;

namespace {

std::vector<uint8_t> debug_payload() {
  elf_options inner;
  inner.regular_symbols = {{"from_debug_data", 0x900, 0x40, STT_FUNC, STB_LOCAL}};
  return elfscope::test::xz_compress(build_elf(inner));
}

elf_options library_options() {
  elf_options options;
  options.dynamic_symbols = {
      {"shared_name", 0x400, 0x10},
      {"exported_only", 0x500, 0x20},
  };
  options.regular_symbols = {
      {"shared_name", 0x480, 0x10, STT_FUNC, STB_LOCAL},
      {"static_helper", 0x700, 0x30, STT_FUNC, STB_LOCAL},
  };
  options.with_debug_data = true;
  options.debug_data = debug_payload();
  return options;
}

symbol_options enabled_options() {
  symbol_options options;
  options.debug_data = true;
  options.max_debug_data_size = 1024 * 1024;
  return options;
}

} // namespace

TEST_CASE("elfscope symbol_index resolves names across tables") {
  const auto bytes = build_elf(library_options());
  elfscope::test::temp_file file(bytes);
  REQUIRE_FALSE(file.path().empty());

  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), enabled_options());
  const symbol_index index;
  const uintptr_t bias = module.module().load_bias;

  auto exported = index.resolve_by_name(module, "exported_only", lookup_scope::all);
  REQUIRE(exported.ok());
  CHECK(exported.value.address == bias + 0x500);
  CHECK(exported.value.size == 0x20);
  CHECK(exported.value.table == table_kind::dynamic);

  // the dynamic table wins over .symtab for the same name
  auto shared = index.resolve_by_name(module, "shared_name", lookup_scope::all);
  REQUIRE(shared.ok());
  CHECK(shared.value.address == bias + 0x400);

  auto helper = index.resolve_by_name(module, "static_helper", lookup_scope::all);
  REQUIRE(helper.ok());
  CHECK(helper.value.address == bias + 0x700);
  CHECK(helper.value.table == table_kind::regular);

  auto recovered = index.resolve_by_name(module, "from_debug_data", lookup_scope::all);
  REQUIRE(recovered.ok());
  CHECK(recovered.value.address == bias + 0x900);
  CHECK(recovered.value.table == table_kind::debug_recovered);
}

TEST_CASE("elfscope symbol_index honors lookup scopes") {
  const auto bytes = build_elf(library_options());
  elfscope::test::temp_file file(bytes);
  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), enabled_options());
  const symbol_index index;

  CHECK(index.resolve_by_name(module, "static_helper", lookup_scope::dynamic).code() == error_code::not_found);
  CHECK(index.resolve_by_name(module, "exported_only", lookup_scope::debug).code() == error_code::not_found);

  auto debug_only = index.resolve_by_name(module, "shared_name", lookup_scope::debug);
  REQUIRE(debug_only.ok());
  CHECK(debug_only.value.address == module.module().load_bias + 0x480);
  CHECK(debug_only.value.table == table_kind::regular);

  CHECK(index.resolve_by_name(module, "", lookup_scope::all).code() == error_code::invalid_argument);
  CHECK(index.resolve_by_name(module, "missing_symbol", lookup_scope::all).code() == error_code::not_found);
}

TEST_CASE("elfscope symbol_index resolves addresses to the nearest symbol") {
  const auto bytes = build_elf(library_options());
  elfscope::test::temp_file file(bytes);
  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), enabled_options());
  const symbol_index index;
  const uintptr_t bias = module.module().load_bias;

  auto inside = index.resolve_by_address(module, bias + 0x508);
  REQUIRE(inside.ok());
  CHECK(inside.value.name == "exported_only");
  CHECK(inside.value.symbol_address == bias + 0x500);
  CHECK(inside.value.offset == 8);
  CHECK(inside.value.table == table_kind::dynamic);

  auto helper = index.resolve_by_address(module, bias + 0x710);
  REQUIRE(helper.ok());
  CHECK(helper.value.name == "static_helper");
  CHECK(helper.value.table == table_kind::regular);

  auto recovered = index.resolve_by_address(module, bias + 0x901);
  REQUIRE(recovered.ok());
  CHECK(recovered.value.name == "from_debug_data");
  CHECK(recovered.value.offset == 1);

  CHECK(index.resolve_by_address(module, bias + 0x10).code() == error_code::not_found);
  CHECK(index.resolve_by_address(module, bias + bytes.size() + 0x100).code() == error_code::not_mapped);
}

TEST_CASE("elfscope symbol_index survives corrupt debug data") {
  auto options = library_options();
  options.debug_data = {0xfd, '7', 'z', 'X', 'Z', 0x00, 0x01, 0x02};
  const auto bytes = build_elf(options);
  elfscope::test::temp_file file(bytes);
  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), enabled_options());
  const symbol_index index;

  auto exported = index.resolve_by_name(module, "exported_only", lookup_scope::all);
  REQUIRE(exported.ok());
  CHECK(index.resolve_by_name(module, "from_debug_data", lookup_scope::all).code() == error_code::not_found);
  CHECK(module.debug_status().code == error_code::corrupt_debug_data);

  // the failure is remembered
  CHECK(module.debug_table() == nullptr);
  CHECK(module.debug_status().code == error_code::corrupt_debug_data);
}

TEST_CASE("elfscope symbol_index skips debug data when disabled") {
  const auto bytes = build_elf(library_options());
  elfscope::test::temp_file file(bytes);
  symbol_options options = enabled_options();
  options.debug_data = false;
  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), options);
  const symbol_index index;

  CHECK(index.resolve_by_name(module, "from_debug_data", lookup_scope::debug).code() == error_code::not_found);
  CHECK(module.debug_status().code == error_code::no_debug_data);
}

TEST_CASE("elfscope symbol_index uses the live image without a file") {
  const auto bytes = build_elf(library_options());
  module_symbols module(elfscope::test::module_for_buffer(bytes, "[vdso]"), enabled_options());
  const symbol_index index;

  auto exported = index.resolve_by_name(module, "exported_only", lookup_scope::all);
  REQUIRE(exported.ok());
  CHECK(exported.value.table == table_kind::dynamic);
  CHECK(module.file_status().code == error_code::not_found);
  CHECK(index.resolve_by_name(module, "static_helper", lookup_scope::all).code() == error_code::not_found);
}

TEST_CASE("elfscope symbol_cache reuses and evicts entries") {
  const auto bytes = build_elf(library_options());
  elfscope::symbols::symbol_cache cache(2);

  auto first_module = elfscope::test::module_for_buffer(bytes, "/tmp/elfscope-a.so");
  first_module.generation = 1;
  auto first = cache.acquire(first_module);
  CHECK(cache.acquire(first_module) == first);

  // same base, new generation: the stale entry is replaced
  auto reloaded = first_module;
  reloaded.generation = 2;
  auto second = cache.acquire(reloaded);
  CHECK(second != first);
  CHECK(cache.size() == 1);

  auto other = first_module;
  other.base += 0x10000;
  other.path = "/tmp/elfscope-b.so";
  cache.acquire(other);
  auto third = first_module;
  third.base += 0x20000;
  third.path = "/tmp/elfscope-c.so";
  cache.acquire(third);
  CHECK(cache.size() == 2);
  CHECK(cache.capacity() == 2);

  cache.clear();
  CHECK(cache.size() == 0);
}

TEST_CASE("elfscope address_cache keeps entries until cleared") {
  const auto bytes = build_elf(library_options());
  elfscope::symbols::address_cache cache;
  const auto module = elfscope::test::module_for_buffer(bytes, "/tmp/elfscope-a.so");

  auto first = cache.acquire(module);
  CHECK(cache.acquire(module) == first);
  CHECK(cache.size() == 1);
  cache.clear();
  CHECK(cache.size() == 0);
}

TEST_CASE("elfscope module_symbols builds each table once under concurrent callers") {
  const auto bytes = build_elf(library_options());
  elfscope::test::temp_file file(bytes);
  REQUIRE_FALSE(file.path().empty());

  module_symbols module(elfscope::test::module_for_buffer(bytes, file.path()), enabled_options());

  struct observed {
    const elfscope::symbols::symbol_table* dynamic = nullptr;
    const elfscope::symbols::symbol_table* regular = nullptr;
    const elfscope::symbols::symbol_table* debug = nullptr;
    size_t dynamic_size = 0;
    size_t regular_size = 0;
    size_t debug_size = 0;
  };

  constexpr size_t thread_count = 8;
  std::vector<observed> results(thread_count);
  std::atomic<bool> start{false};
  std::vector<std::thread> threads;
  for (size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back([&, i] {
      while (!start.load()) {
        std::this_thread::yield();
      }
      // alternate the first table touched so builds overlap
      observed& out = results[i];
      if (i % 2 == 0) {
        out.debug = module.debug_table();
        out.dynamic = module.dynamic_table();
        out.regular = module.regular_table();
      } else {
        out.dynamic = module.dynamic_table();
        out.regular = module.regular_table();
        out.debug = module.debug_table();
      }
      out.dynamic_size = out.dynamic ? out.dynamic->size() : 0;
      out.regular_size = out.regular ? out.regular->size() : 0;
      out.debug_size = out.debug ? out.debug->size() : 0;
    });
  }
  start.store(true);
  for (auto& thread : threads) {
    thread.join();
  }

  const observed& first = results.front();
  REQUIRE(first.dynamic != nullptr);
  REQUIRE(first.regular != nullptr);
  REQUIRE(first.debug != nullptr);
  CHECK(first.dynamic_size > 0);
  CHECK(first.regular_size > 0);
  CHECK(first.debug_size > 0);

  for (const auto& result : results) {
    CHECK(result.dynamic == first.dynamic);
    CHECK(result.regular == first.regular);
    CHECK(result.debug == first.debug);
    CHECK(result.dynamic_size == first.dynamic_size);
    CHECK(result.regular_size == first.regular_size);
    CHECK(result.debug_size == first.debug_size);
  }

  CHECK(module.dynamic_table() == first.dynamic);
  CHECK(module.debug_table() == first.debug);
}

#include "elfscope/runtime/module_enumerator.hpp"

#include <utility>

namespace elfscope::runtime {
namespace {

struct snapshot_context {
  std::vector<mapped_module>* modules = nullptr;
  size_t skipped = 0;
};

struct containing_context {
  uintptr_t address = 0;
  mapped_module* out = nullptr;
  bool found = false;
};

struct describe_context {
  const ElfW(Phdr)* phdr = nullptr;
  mapped_module* out = nullptr;
  bool found = false;
};

bool phdr_info_contains(const dl_phdr_info& info, uintptr_t address) {
  for (size_t i = 0; i < info.dlpi_phnum; ++i) {
    const ElfW(Phdr)& phdr = info.dlpi_phdr[i];
    if (phdr.p_type != PT_LOAD) {
      continue;
    }
    const uintptr_t start = static_cast<uintptr_t>(info.dlpi_addr + phdr.p_vaddr);
    const uintptr_t end = start + static_cast<uintptr_t>(phdr.p_memsz);
    if (address >= start && address < end) {
      return true;
    }
  }
  return false;
}

} // namespace

module_enumerator::module_enumerator(const platform_profile& profile, module_registry& registry)
    : profile_(profile), registry_(registry), log_(redlog::get_logger("elfscope.runtime.enumerator")) {}

std::vector<mapped_module> module_enumerator::snapshot() const {
  std::vector<mapped_module> modules;
  snapshot_context ctx;
  ctx.modules = &modules;

  iterate_phdr(
      profile_,
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* ctx = static_cast<snapshot_context*>(data);
        mapped_module module;
        if (describe_module(*info, module)) {
          ctx->modules->push_back(std::move(module));
        } else {
          ++ctx->skipped;
        }
        return 0;
      },
      &ctx, iterate_flags::full_pathname
  );

  registry_.refresh(modules);

  log_.dbg(
      "module snapshot", redlog::field("profile", profile_.name()), redlog::field("modules", modules.size()),
      redlog::field("skipped", ctx.skipped)
  );
  return modules;
}

void module_enumerator::for_each(const std::function<bool(const mapped_module&)>& visitor) const {
  if (!visitor) {
    return;
  }
  const auto modules = snapshot();
  for (const auto& module : modules) {
    if (!visitor(module)) {
      break;
    }
  }
}

std::optional<mapped_module> module_enumerator::find_containing(uintptr_t address) const {
  mapped_module module;
  containing_context ctx;
  ctx.address = address;
  ctx.out = &module;

  iterate_phdr(
      profile_,
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* ctx = static_cast<containing_context*>(data);
        if (!phdr_info_contains(*info, ctx->address)) {
          return 0;
        }
        ctx->found = describe_module(*info, *ctx->out);
        return ctx->found ? 1 : 0;
      },
      &ctx, iterate_flags::full_pathname
  );

  if (!ctx.found) {
    log_.trc(
        "no module contains address", redlog::field("address", "0x%llx", static_cast<unsigned long long>(address))
    );
    return std::nullopt;
  }

  registry_.observe(module);
  return module;
}

std::optional<mapped_module> module_enumerator::describe(const dl_phdr_info& info) const {
  mapped_module module;
  describe_context ctx;
  ctx.phdr = info.dlpi_phdr;
  ctx.out = &module;

  // prefer the walk's normalized view of the same image
  iterate_phdr(
      profile_,
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* ctx = static_cast<describe_context*>(data);
        if (info->dlpi_phdr != ctx->phdr) {
          return 0;
        }
        ctx->found = describe_module(*info, *ctx->out);
        return ctx->found ? 1 : 0;
      },
      &ctx, iterate_flags::full_pathname
  );

  if (!ctx.found && !describe_module(info, module)) {
    return std::nullopt;
  }

  registry_.observe(module);
  return module;
}

} // namespace elfscope::runtime

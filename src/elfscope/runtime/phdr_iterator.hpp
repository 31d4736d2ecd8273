#pragma once

#include <cstddef>
#include <cstdint>

#include <link.h>

#include "elfscope/runtime/platform_profile.hpp"

namespace elfscope::runtime {

enum class iterate_flags : uint32_t {
  none = 0,
  // expand bare names and the empty main-image name to full paths
  full_pathname = 1u << 0,
};

inline iterate_flags operator|(iterate_flags lhs, iterate_flags rhs) {
  return static_cast<iterate_flags>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

inline iterate_flags operator&(iterate_flags lhs, iterate_flags rhs) {
  return static_cast<iterate_flags>(static_cast<uint32_t>(lhs) & static_cast<uint32_t>(rhs));
}

inline bool has_flag(iterate_flags flags, iterate_flags flag) { return (flags & flag) != iterate_flags::none; }

// same contract as dl_iterate_phdr: a non-zero return stops the walk and is returned
using phdr_callback = int (*)(struct dl_phdr_info* info, size_t size, void* data);

// signature of dl_iterate_phdr itself
using loader_iterator = int (*)(phdr_callback callback, void* data);

/**
 * @brief walks every loaded elf image with the profile's normalization applied
 *
 * Allocation-free and lock-free apart from the loader's own iteration lock, so it can run
 * from a crash handler. The info passed to the callback is only valid during the call.
 */
int iterate_phdr(
    const platform_profile& profile, phdr_callback callback, void* data, iterate_flags flags,
    loader_iterator loader = nullptr
);

int iterate_phdr(phdr_callback callback, void* data, iterate_flags flags = iterate_flags::none);

// address of the image's elf header: load bias plus the page-aligned lowest load vaddr
uintptr_t image_start(const dl_phdr_info& info);
// end of the highest load segment
uintptr_t image_end(const dl_phdr_info& info);

bool is_main_image(const dl_phdr_info& info);
bool is_linker_image(const dl_phdr_info& info);

// one auxv entry read from /proc/self/auxv, 0 when absent; used where getauxval is unavailable
unsigned long read_proc_auxv(unsigned long type);

size_t page_size();

} // namespace elfscope::runtime

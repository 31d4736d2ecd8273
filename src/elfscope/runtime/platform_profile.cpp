#include "elfscope/runtime/platform_profile.hpp"

#include <cstdlib>

#include <redlog.hpp>

#if defined(__ANDROID__)
#include <sys/system_properties.h>
#endif

#include "elfscope/base/config.hpp"

namespace elfscope::runtime {
namespace {

constexpr int api_lollipop = 21;
constexpr int api_marshmallow = 23;
constexpr int api_pie = 28;
constexpr int api_q = 29;
constexpr int api_r = 30;

// api < 21 on 32-bit arm: no usable dl_iterate_phdr, walk the maps
class legacy_arm32_profile final : public platform_profile {
public:
  legacy_arm32_profile(int api_level, bool force_maps) : platform_profile(api_level, cpu_arch::arm, force_maps) {}

  profile_kind kind() const override { return profile_kind::legacy_arm32; }
  bool uses_maps_enumeration() const override { return true; }
  bool injects_linker() const override { return true; }
};

class jelly_bean_kitkat_profile final : public platform_profile {
public:
  jelly_bean_kitkat_profile(int api_level, cpu_arch arch, bool force_maps)
      : platform_profile(api_level, arch, force_maps) {}

  profile_kind kind() const override { return profile_kind::jelly_bean_kitkat; }
  bool injects_linker() const override { return true; }
  bool fixes_basenames() const override { return true; }
};

class lollipop_profile final : public platform_profile {
public:
  lollipop_profile(int api_level, cpu_arch arch, bool force_maps) : platform_profile(api_level, arch, force_maps) {}

  profile_kind kind() const override { return profile_kind::lollipop; }
  bool injects_linker() const override { return true; }
  bool fixes_basenames() const override { return true; }
};

class marshmallow_to_oreo_profile final : public platform_profile {
public:
  marshmallow_to_oreo_profile(int api_level, cpu_arch arch, bool force_maps)
      : platform_profile(api_level, arch, force_maps) {}

  profile_kind kind() const override { return profile_kind::marshmallow_to_oreo; }
  bool injects_linker() const override { return true; }
};

class modern_profile final : public platform_profile {
public:
  modern_profile(int api_level, cpu_arch arch, bool force_maps) : platform_profile(api_level, arch, force_maps) {}

  profile_kind kind() const override { return profile_kind::modern; }
};

class host_linux_profile final : public platform_profile {
public:
  host_linux_profile(cpu_arch arch, bool force_maps) : platform_profile(0, arch, force_maps) {}

  profile_kind kind() const override { return profile_kind::host_linux; }
  bool is_android() const override { return false; }

  std::vector<std::string> library_directories() const override {
    std::vector<std::string> paths = {"/lib", "/lib64", "/usr/lib", "/usr/lib64", "/usr/local/lib"};
    switch (arch()) {
      case cpu_arch::x86_64:
        paths.push_back("/usr/lib/x86_64-linux-gnu");
        paths.push_back("/lib/x86_64-linux-gnu");
        break;
      case cpu_arch::arm64:
        paths.push_back("/usr/lib/aarch64-linux-gnu");
        paths.push_back("/lib/aarch64-linux-gnu");
        break;
      case cpu_arch::x86:
        paths.push_back("/usr/lib/i386-linux-gnu");
        paths.push_back("/lib/i386-linux-gnu");
        break;
      case cpu_arch::arm:
        paths.push_back("/usr/lib/arm-linux-gnueabihf");
        paths.push_back("/lib/arm-linux-gnueabihf");
        break;
      default:
        break;
    }
    return paths;
  }
};

} // namespace

const char* to_string(cpu_arch arch) {
  switch (arch) {
    case cpu_arch::arm:
      return "arm";
    case cpu_arch::arm64:
      return "arm64";
    case cpu_arch::x86:
      return "x86";
    case cpu_arch::x86_64:
      return "x86_64";
    case cpu_arch::other:
      return "other";
  }
  return "other";
}

const char* to_string(profile_kind kind) {
  switch (kind) {
    case profile_kind::legacy_arm32:
      return "legacy_arm32";
    case profile_kind::jelly_bean_kitkat:
      return "jelly_bean_kitkat";
    case profile_kind::lollipop:
      return "lollipop";
    case profile_kind::marshmallow_to_oreo:
      return "marshmallow_to_oreo";
    case profile_kind::modern:
      return "modern";
    case profile_kind::host_linux:
      return "host_linux";
  }
  return "unknown";
}

cpu_arch current_arch() {
#if defined(__aarch64__)
  return cpu_arch::arm64;
#elif defined(__arm__)
  return cpu_arch::arm;
#elif defined(__x86_64__)
  return cpu_arch::x86_64;
#elif defined(__i386__)
  return cpu_arch::x86;
#else
  return cpu_arch::other;
#endif
}

bool is_64bit(cpu_arch arch) {
  if (arch == cpu_arch::other) {
    return sizeof(void*) == 8;
  }
  return arch == cpu_arch::arm64 || arch == cpu_arch::x86_64;
}

int detect_api_level() {
#if defined(__ANDROID__)
  char value[PROP_VALUE_MAX] = {};
  if (__system_property_get("ro.build.version.sdk", value) > 0) {
    const int level = std::atoi(value);
    if (level > 0) {
      return level;
    }
  }
  return __ANDROID_API__;
#else
  return 0;
#endif
}

std::vector<std::string> platform_profile::library_directories() const {
  const char* lib = is_64bit() ? "lib64" : "lib";
  std::vector<std::string> paths;
  if (api_level_ >= api_q) {
    paths.push_back(std::string("/apex/com.android.runtime/") + lib + "/bionic");
  }
  if (api_level_ >= api_r) {
    paths.push_back(std::string("/apex/com.android.art/") + lib);
  }
  paths.push_back(std::string("/system/") + lib);
  paths.push_back(std::string("/vendor/") + lib);
  return paths;
}

const char* platform_profile::linker_path() const {
  if (!is_android()) {
    return "";
  }
  if (api_level_ >= api_q) {
    return is_64bit() ? "/apex/com.android.runtime/bin/linker64" : "/apex/com.android.runtime/bin/linker";
  }
  return is_64bit() ? "/system/bin/linker64" : "/system/bin/linker";
}

const char* platform_profile::app_process_path() const {
  return is_64bit() ? "/system/bin/app_process64" : "/system/bin/app_process32";
}

std::unique_ptr<platform_profile> make_profile(int api_level, cpu_arch arch, bool force_maps) {
  if (api_level <= 0) {
    return std::make_unique<host_linux_profile>(arch, force_maps);
  }
  if (api_level < api_lollipop) {
    if (arch == cpu_arch::arm) {
      return std::make_unique<legacy_arm32_profile>(api_level, force_maps);
    }
    return std::make_unique<jelly_bean_kitkat_profile>(api_level, arch, force_maps);
  }
  if (api_level < api_marshmallow) {
    return std::make_unique<lollipop_profile>(api_level, arch, force_maps);
  }
  if (api_level < api_pie) {
    return std::make_unique<marshmallow_to_oreo_profile>(api_level, arch, force_maps);
  }
  return std::make_unique<modern_profile>(api_level, arch, force_maps);
}

const platform_profile& platform_profile::current() {
  static const std::unique_ptr<platform_profile> profile = [] {
    const auto cfg = base::current_config();
    const int api_level = cfg.api_level > 0 ? cfg.api_level : detect_api_level();
    auto selected = make_profile(api_level, current_arch(), cfg.force_maps);

    auto log = redlog::get_logger("elfscope.runtime.profile");
    log.inf(
        "selected platform profile", redlog::field("profile", selected->name()),
        redlog::field("api_level", selected->api_level()), redlog::field("arch", to_string(selected->arch())),
        redlog::field("maps", selected->uses_maps_enumeration())
    );
    return selected;
  }();
  return *profile;
}

} // namespace elfscope::runtime

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace elfscope::runtime {

enum class cpu_arch { arm, arm64, x86, x86_64, other };

enum class profile_kind { legacy_arm32, jelly_bean_kitkat, lollipop, marshmallow_to_oreo, modern, host_linux };

const char* to_string(cpu_arch arch);
const char* to_string(profile_kind kind);

// abi of this process, fixed at compile time
cpu_arch current_arch();
bool is_64bit(cpu_arch arch);

// ro.build.version.sdk on android, 0 elsewhere
int detect_api_level();

/**
 * @brief enumeration normalization rules for one android release range
 *
 * Selected once per process. The raw phdr walk consults these capabilities instead of
 * checking api levels itself.
 */
class platform_profile {
public:
  virtual ~platform_profile() = default;

  virtual profile_kind kind() const = 0;
  virtual bool is_android() const { return true; }

  // walk /proc/self/maps instead of the loader's phdr iterator
  virtual bool uses_maps_enumeration() const { return maps_forced_; }
  // report the loader image even though the loader's iterator leaves it out
  virtual bool injects_linker() const { return false; }
  // the loader reports bare file names that must be expanded to full paths
  virtual bool fixes_basenames() const { return false; }
  // report the main image by its executable path, never the package name the loader may use;
  // app_process is the fallback when /proc/self/exe cannot be read
  virtual bool renames_main_image() const { return is_android(); }

  virtual std::vector<std::string> library_directories() const;

  const char* name() const { return to_string(kind()); }
  int api_level() const noexcept { return api_level_; }
  cpu_arch arch() const noexcept { return arch_; }
  bool is_64bit() const noexcept { return runtime::is_64bit(arch_); }

  // empty when the loader is reported by the platform itself
  const char* linker_path() const;
  const char* app_process_path() const;

  static const platform_profile& current();

protected:
  platform_profile(int api_level, cpu_arch arch, bool force_maps)
      : api_level_(api_level), arch_(arch), maps_forced_(force_maps) {}

private:
  int api_level_;
  cpu_arch arch_;
  bool maps_forced_;
};

// api_level 0 selects the desktop linux profile
std::unique_ptr<platform_profile> make_profile(int api_level, cpu_arch arch, bool force_maps = false);

} // namespace elfscope::runtime

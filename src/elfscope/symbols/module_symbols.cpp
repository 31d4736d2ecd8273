#include "elfscope/symbols/module_symbols.hpp"

#include <limits.h>
#include <string>
#include <utility>

#include "elfscope/base/config.hpp"
#include "elfscope/base/path_utils.hpp"
#include "elfscope/runtime/maps_reader.hpp"

namespace elfscope::symbols {

symbol_options symbol_options::from_config() {
  const auto cfg = base::current_config();
  symbol_options options;
  options.debug_data = cfg.debug_data;
  options.max_debug_data_size = cfg.max_debug_data_size;
  return options;
}

base::result<elf::mapped_file> open_module_file(const runtime::mapped_module& module) {
  base::archive_path archive;
  if (base::split_archive_path(module.path, archive)) {
    runtime::maps_record record;
    char path_buffer[PATH_MAX] = {};
    if (!runtime::find_mapping(module.base, record, path_buffer, sizeof(path_buffer))) {
      return base::error_result<elf::mapped_file>(
          base::error_code::not_mapped, "no mapping for archive module " + module.path
      );
    }
    return elf::mapped_file::open(std::string(archive.archive), record.offset);
  }

  if (!base::is_absolute_path(module.path)) {
    return base::error_result<elf::mapped_file>(
        base::error_code::not_found, "module has no file path: " + module.path
    );
  }
  return elf::mapped_file::open(module.path);
}

module_symbols::module_symbols(runtime::mapped_module module, symbol_options options)
    : module_(std::move(module)), options_(options), log_(redlog::get_logger("elfscope.symbols.module")) {}

const elf::elf_image* module_symbols::file_image_locked() {
  if (file_loaded_) {
    return file_image_ ? &*file_image_ : nullptr;
  }
  file_loaded_ = true;

  auto file = open_module_file(module_);
  if (!file.ok()) {
    file_status_ = std::move(file.status_info);
    log_.dbg(
        "module file unavailable", redlog::field("path", module_.path),
        redlog::field("error", base::to_string(file_status_.code))
    );
    return nullptr;
  }
  file_ = std::move(file.value);

  auto image = elf::elf_image::parse(file_.view());
  if (!image.ok()) {
    file_status_ = std::move(image.status_info);
    log_.wrn(
        "module file is not a readable elf image", redlog::field("path", module_.path),
        redlog::field("error", file_status_.message)
    );
    file_.reset();
    return nullptr;
  }

  file_image_ = std::move(image.value);
  file_status_ = base::ok_status();
  return &*file_image_;
}

void module_symbols::load_dynamic_locked() {
  dynamic_loaded_ = true;

  // the live image first: no file access, and it works for images without a file
  auto live =
      elf::elf_image::parse_loaded(elf::byte_view::from_memory(module_.base, module_.size), module_.load_bias);
  if (live.ok()) {
    const auto source = live.value.dynamic_symbols();
    if (source.valid()) {
      dynamic_ = std::make_unique<symbol_table>(symbol_table::build(table_kind::dynamic, source));
      log_.trc(
          "dynamic table from memory", redlog::field("path", module_.path), redlog::field("symbols", dynamic_->size())
      );
      return;
    }
  }

  if (const elf::elf_image* image = file_image_locked()) {
    const auto source = image->dynamic_symbols();
    if (source.valid()) {
      dynamic_ = std::make_unique<symbol_table>(symbol_table::build(table_kind::dynamic, source));
      log_.trc(
          "dynamic table from file", redlog::field("path", module_.path), redlog::field("symbols", dynamic_->size())
      );
      return;
    }
  }

  log_.dbg("no dynamic symbol table", redlog::field("path", module_.path));
}

void module_symbols::load_debug_locked() {
  debug_loaded_ = true;

  if (!options_.debug_data) {
    debug_status_ = base::make_status(base::error_code::no_debug_data, "debug data decoding disabled");
    return;
  }

  const elf::elf_image* image = file_image_locked();
  if (!image) {
    debug_status_ = base::make_status(base::error_code::no_debug_data, "module file unavailable");
    return;
  }

  auto extracted = elf::extract_debug_data(*image, options_.max_debug_data_size);
  if (!extracted.ok()) {
    debug_status_ = std::move(extracted.status_info);
    if (debug_status_.code == base::error_code::corrupt_debug_data) {
      log_.wrn(
          "debug symbols unavailable", redlog::field("path", module_.path),
          redlog::field("error", debug_status_.message)
      );
    }
    return;
  }

  debug_image_ = std::make_unique<elf::debug_image>(std::move(extracted.value));
  debug_ = std::make_unique<symbol_table>(symbol_table::build(table_kind::debug_recovered, debug_image_->symbols()));
  debug_status_ = base::ok_status();
  log_.dbg(
      "debug table recovered", redlog::field("path", module_.path), redlog::field("symbols", debug_->size())
  );
}

const symbol_table* module_symbols::dynamic_table() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!dynamic_loaded_) {
    load_dynamic_locked();
  }
  return dynamic_.get();
}

const symbol_table* module_symbols::regular_table() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!regular_loaded_) {
    regular_loaded_ = true;
    if (const elf::elf_image* image = file_image_locked()) {
      const auto source = image->regular_symbols();
      if (source.valid()) {
        regular_ = std::make_unique<symbol_table>(symbol_table::build(table_kind::regular, source));
      }
    }
  }
  return regular_.get();
}

const symbol_table* module_symbols::debug_table() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!debug_loaded_) {
    load_debug_locked();
  }
  return debug_.get();
}

std::vector<const symbol_table*> module_symbols::tables(lookup_scope scope) {
  std::vector<const symbol_table*> out;
  if (scope == lookup_scope::dynamic || scope == lookup_scope::all) {
    if (const symbol_table* table = dynamic_table()) {
      out.push_back(table);
    }
  }
  if (scope == lookup_scope::debug || scope == lookup_scope::all) {
    if (const symbol_table* table = regular_table()) {
      out.push_back(table);
    }
    if (const symbol_table* table = debug_table()) {
      out.push_back(table);
    }
  }
  return out;
}

base::status module_symbols::file_status() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_image_locked();
  return file_status_;
}

base::status module_symbols::debug_status() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!debug_loaded_) {
    load_debug_locked();
  }
  return debug_status_;
}

} // namespace elfscope::symbols

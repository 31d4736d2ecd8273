#include "elfscope/elf/debug_data.hpp"

#include <algorithm>
#include <string>

#include <lzma.h>
#include <redlog.hpp>

#include "elfscope/base/config.hpp"

namespace elfscope::elf {
namespace {

redlog::logger& debug_data_log() {
  static redlog::logger log = redlog::get_logger("elfscope.elf.debug_data");
  return log;
}

class lzma_stream_guard {
public:
  explicit lzma_stream_guard(lzma_stream& stream) : stream_(stream) {}
  ~lzma_stream_guard() { lzma_end(&stream_); }
  lzma_stream_guard(const lzma_stream_guard&) = delete;
  lzma_stream_guard& operator=(const lzma_stream_guard&) = delete;

private:
  lzma_stream& stream_;
};

} // namespace

base::result<std::vector<uint8_t>> decompress_xz(byte_view compressed, size_t max_output_size) {
  using bytes = std::vector<uint8_t>;
  if (compressed.empty()) {
    return base::error_result<bytes>(base::error_code::corrupt_debug_data, "empty compressed stream");
  }

  lzma_stream stream = LZMA_STREAM_INIT;
  lzma_ret ret = lzma_stream_decoder(&stream, UINT64_MAX, LZMA_CONCATENATED);
  if (ret != LZMA_OK) {
    return base::error_result<bytes>(
        base::error_code::corrupt_debug_data, "xz decoder init failed: " + std::to_string(static_cast<int>(ret))
    );
  }
  lzma_stream_guard guard(stream);

  stream.next_in = compressed.data();
  stream.avail_in = compressed.size();

  const size_t chunk_size = 4096;
  bytes output(std::min(chunk_size, std::max<size_t>(max_output_size, 1)));
  size_t total_out = 0;

  do {
    if (total_out == output.size()) {
      if (output.size() >= max_output_size) {
        return base::error_result<bytes>(
            base::error_code::corrupt_debug_data,
            "decompressed debug data exceeds limit of " + std::to_string(max_output_size) + " bytes"
        );
      }
      output.resize(std::min(output.size() * 2, max_output_size));
    }

    stream.next_out = output.data() + total_out;
    stream.avail_out = output.size() - total_out;

    ret = lzma_code(&stream, LZMA_FINISH);
    total_out = static_cast<size_t>(stream.total_out);
  } while (ret == LZMA_OK);

  if (ret != LZMA_STREAM_END) {
    return base::error_result<bytes>(
        base::error_code::corrupt_debug_data, "xz decompression failed: " + std::to_string(static_cast<int>(ret))
    );
  }

  output.resize(total_out);
  return base::ok_result(std::move(output));
}

base::result<debug_image> extract_debug_data(const elf_image& image, size_t max_output_size) {
  const section* sec = image.section_by_name(debug_data_section_name);
  if (!sec) {
    return base::error_result<debug_image>(base::error_code::no_debug_data, "no .gnu_debugdata section");
  }

  const byte_view compressed = image.section_data(*sec);
  if (compressed.empty()) {
    return base::error_result<debug_image>(
        base::error_code::corrupt_debug_data, ".gnu_debugdata is empty or outside the file"
    );
  }

  auto decoded = decompress_xz(compressed, max_output_size);
  if (!decoded.ok()) {
    debug_data_log().wrn("failed to decompress debug data", redlog::field("error", decoded.status_info.message));
    return base::error_result<debug_image>(std::move(decoded.status_info));
  }

  debug_image out;
  out.bytes_ = std::move(decoded.value);

  auto inner = elf_image::parse(byte_view(out.bytes_.data(), out.bytes_.size()));
  if (!inner.ok()) {
    debug_data_log().wrn("debug data is not a valid elf image", redlog::field("error", inner.status_info.message));
    return base::error_result<debug_image>(
        base::error_code::corrupt_debug_data, "inner debug image: " + inner.status_info.message
    );
  }
  out.image_ = std::move(inner.value);

  debug_data_log().dbg(
      "recovered debug image", redlog::field("compressed", compressed.size()),
      redlog::field("decompressed", out.size()),
      redlog::field("symbols", out.symbols().count)
  );
  return base::ok_result(std::move(out));
}

base::result<debug_image> extract_debug_data(const elf_image& image) {
  return extract_debug_data(image, base::current_config().max_debug_data_size);
}

} // namespace elfscope::elf

#include "athlete_core/services/compression_service.hpp"

#include <zstd.h>

namespace athlete_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (compression_level < 1 || compression_level > ZSTD_maxCLevel()) {
    throw CompressionError("Invalid zstd compression level " + std::to_string(compression_level));
  }

  size_t const worst_case_size = ZSTD_compressBound(data.size());
  std::vector<char> compressed_buffer(worst_case_size);

  size_t const compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);

  if (ZSTD_isError(compressed_size)) {
    throw CompressionError("ZSTD compression failed: " +
                           std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const decompressed_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());

  if (decompressed_size == ZSTD_CONTENTSIZE_ERROR ||
      decompressed_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Failed to get decompressed size or data is not zstd format.");
  }
  if (decompressed_size > MAX_DECOMPRESSED_SIZE) {
    throw CompressionError("Decompressed size " + std::to_string(decompressed_size) +
                           " exceeds the chunk limit");
  }
  if (decompressed_size == 0) {
    return "";
  }

  std::string decompressed_buffer(decompressed_size, '\0');

  size_t const actual_size = ZSTD_decompress(decompressed_buffer.data(), decompressed_buffer.size(),
                                             compressed_data.data(), compressed_data.size());

  if (ZSTD_isError(actual_size)) {
    throw CompressionError("ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != decompressed_size) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual_size) +
                           " bytes, frame header announced " + std::to_string(decompressed_size));
  }

  return decompressed_buffer;
}

}  // namespace athlete_core

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace athlete_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// zstd codec for chunk text at rest.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;
  // Upper bound on a decompressed chunk; guards against corrupt frame headers
  static constexpr unsigned long long MAX_DECOMPRESSED_SIZE = 64ULL * 1024 * 1024;

  /**
   * @brief Compresses text into a single zstd frame.
   * @param data The text to compress. Empty input still yields a valid frame.
   * @param compression_level The zstd compression level.
   * @return The compressed frame.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Decompresses a frame produced by compress().
   * @throws CompressionError if the data is not a zstd frame with a known size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace athlete_core

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "athlete_core/chunking/tokenizer.hpp"
#include "athlete_core/config.hpp"
#include "athlete_core/types/chunk.hpp"
#include "athlete_core/types/source_document.hpp"

namespace athlete_core {

// Splits text into overlapping token windows.
class TextChunker {
 public:
  TextChunker(int chunk_size,
              int chunk_overlap,
              std::shared_ptr<const Tokenizer> tokenizer = nullptr);
  explicit TextChunker(const Config& config);

  /**
   * @brief Splits one text into chunks of at most chunk_size tokens.
   *
   * Windows start every (chunk_size - chunk_overlap) tokens until the start
   * passes the end of the token sequence. With prepend_metadata the
   * "Athlete: .. | Topic: .. | Title: .." header is put in front of the text
   * before tokenizing, so it counts towards the first window.
   *
   * Empty or whitespace-only text yields no chunks.
   */
  std::vector<Chunk> split_text(const std::string& text,
                                const ChunkMetadata& metadata,
                                bool prepend_metadata = true) const;

  // Chunks every passage, carrying its attribution into the chunk metadata.
  std::vector<Chunk> split_passages(const std::vector<Passage>& passages,
                                    bool prepend_metadata = true) const;

  static std::string build_metadata_prefix(const ChunkMetadata& metadata);
  static ChunkMetadata metadata_for(const Passage& passage);

  int chunk_size() const { return chunk_size_; }
  int chunk_overlap() const { return chunk_overlap_; }
  const Tokenizer& tokenizer() const { return *tokenizer_; }

 private:
  int chunk_size_;
  int chunk_overlap_;
  std::shared_ptr<const Tokenizer> tokenizer_;
};

}  // namespace athlete_core

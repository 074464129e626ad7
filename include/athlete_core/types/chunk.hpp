#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace athlete_core {

// Attribution carried by every chunk. The fixed fields cover what the indexer
// and retriever look at; anything else the crawler hands us goes into `extra`.
struct ChunkMetadata {
  std::string source_doc_id;
  std::string athlete_name;
  std::optional<std::string> topic;
  std::optional<std::string> url;
  std::optional<std::string> title;
  std::map<std::string, std::string> extra;
};

struct Chunk {
  std::string text;
  ChunkMetadata metadata;
  int chunk_index = 0;
  int token_count = 0;
};

struct EmbeddedChunk {
  Chunk chunk;
  std::vector<float> embedding;
  std::string embedding_model;
  int embedding_dimension = 0;
};

// Duplicate-suppression key: one chunk per (source_doc_id, chunk_index) per athlete
struct ChunkKey {
  std::string source_doc_id;
  int chunk_index = 0;

  bool operator<(const ChunkKey &other) const {
    if (source_doc_id != other.source_doc_id)
      return source_doc_id < other.source_doc_id;
    return chunk_index < other.chunk_index;
  }
  bool operator==(const ChunkKey &other) const {
    return source_doc_id == other.source_doc_id && chunk_index == other.chunk_index;
  }
};

}  // namespace athlete_core

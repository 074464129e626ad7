#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "athlete_core/types/chunk.hpp"

namespace athlete_core {

class MetadataStoreError : public std::exception {
 public:
  explicit MetadataStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A stored chunk as the retriever sees it. `embedding` is the raw provider
// vector, retained so the vector index can be rebuilt without re-embedding.
struct MetadataDocument {
  std::string key;
  Chunk chunk;
  int64_t faiss_id = -1;
  std::chrono::system_clock::time_point indexed_at;
  std::string embedding_model;
  int embedding_dimension = 0;
  std::vector<float> embedding;
};

struct AthleteChunkCount {
  std::string athlete_name;
  int64_t chunk_count = 0;
};

// Stable key of the document holding chunk `chunk_index` of `source_doc_id`
// for `athlete_name`.
std::string make_document_key(const std::string &athlete_name,
                              const std::string &source_doc_id,
                              int chunk_index);

/**
 * @brief Persistent home of chunk text and attribution, addressed by key.
 *
 * The vector index only knows keys; everything a caller needs to show or
 * filter a hit lives here. Implementations must reject a second document for
 * the same (athlete_name, source_doc_id, chunk_index) with MetadataStoreError.
 */
class MetadataStore {
 public:
  virtual ~MetadataStore() = default;

  virtual void insert(const MetadataDocument &document) = 0;

  // All documents or none
  virtual void insert_batch(const std::vector<MetadataDocument> &documents) = 0;

  virtual std::optional<MetadataDocument> find_by_key(const std::string &key) = 0;

  // Missing keys are absent from the result
  virtual std::unordered_map<std::string, MetadataDocument> find_by_keys(
      const std::vector<std::string> &keys) = 0;

  // Any athlete's document for this (source_doc_id, chunk_index)
  virtual std::optional<MetadataDocument> find_duplicate(const std::string &source_doc_id,
                                                         int chunk_index) = 0;

  // Distinct source_doc_ids that already have chunks for the athlete
  virtual std::set<std::string> aggregate_indexed_source_ids(const std::string &athlete_name) = 0;

  virtual std::set<ChunkKey> indexed_chunk_keys(const std::string &athlete_name) = 0;

  // Returns the number of documents removed
  virtual int64_t remove(const std::vector<std::string> &keys) = 0;
  virtual int64_t delete_athlete_chunks(const std::string &athlete_name) = 0;
  virtual int64_t delete_all() = 0;

  // Every document, ordered by faiss_id
  virtual std::vector<MetadataDocument> list_documents_with_embeddings() = 0;

  virtual void update_vector_ids(const std::vector<std::pair<std::string, int64_t>> &key_to_id) = 0;

  virtual int64_t count_chunks(const std::optional<std::string> &athlete_name = std::nullopt) = 0;
  // Documents that claim a vector in the index (faiss_id >= 0)
  virtual int64_t count_indexed_chunks() = 0;
  virtual std::vector<AthleteChunkCount> chunk_counts_by_athlete() = 0;
};

}  // namespace athlete_core

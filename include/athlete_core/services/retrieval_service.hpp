#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "athlete_core/config.hpp"
#include "athlete_core/db/metadata_store.hpp"
#include "athlete_core/index/vector_index.hpp"
#include "athlete_core/llm/embedding_provider.hpp"

namespace athlete_core {

struct RetrievedChunk {
  MetadataDocument document;
  float similarity;
  faiss::idx_t vector_id;
};

class RetrievalService {
 public:
  RetrievalService(const Config &config,
                   std::shared_ptr<MetadataStore> metadata_store,
                   std::shared_ptr<VectorIndex> vector_index,
                   std::shared_ptr<EmbeddingProvider> embedding_provider);

  /**
   * @brief Top-k chunks for a query, most similar first.
   *
   * With an athlete filter the index is searched ten times deeper than top_k
   * (capped at the index size) and hits of other athletes are dropped, so
   * fewer than top_k results can come back when the athlete is rare. Hits
   * whose metadata is gone are skipped.
   *
   * @throws EmbeddingError if the query embedding has the wrong dimension.
   */
  std::vector<RetrievedChunk> retrieve(const std::string &query,
                                       const std::optional<std::string> &athlete_filter,
                                       int top_k,
                                       float min_similarity);

  // Uses top_k_chunks and min_similarity from the configuration
  std::vector<RetrievedChunk> retrieve(const std::string &query,
                                       const std::optional<std::string> &athlete_filter = std::nullopt);

  static nlohmann::json to_json(const RetrievedChunk &result);

 private:
  static constexpr int FILTER_OVERFETCH_FACTOR = 10;

  Config config_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;

  std::vector<float> embed_query(const std::string &query);
};

}  // namespace athlete_core

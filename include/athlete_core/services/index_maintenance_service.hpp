#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "athlete_core/db/metadata_store.hpp"
#include "athlete_core/index/vector_index.hpp"

namespace athlete_core {

struct IndexStats {
  int64_t total_chunks = 0;
  int64_t faiss_vectors = 0;
  std::vector<AthleteChunkCount> athletes;
  std::string index_path;
  int embedding_dimension = 0;
  std::optional<std::string> athlete_name;

  nlohmann::json to_json() const;
};

struct RebuildResult {
  size_t reindexed = 0;
  size_t skipped = 0;
};

// Whole-index operations that keep the vector index and the metadata store in
// step: statistics, athlete deletion, rebuild from retained embeddings, wipe.
class IndexMaintenanceService {
 public:
  IndexMaintenanceService(std::shared_ptr<MetadataStore> metadata_store,
                          std::shared_ptr<VectorIndex> vector_index);

  IndexStats get_stats(const std::optional<std::string> &athlete_name = std::nullopt);

  // Deletes the athlete's documents and rebuilds the index without them.
  // Returns the number of deleted documents.
  int64_t delete_athlete(const std::string &athlete_name);

  /**
   * @brief Re-creates the vector index from the embeddings kept in the store.
   *
   * Documents are re-added in faiss_id order, so ids are dense again
   * afterwards and the store's faiss_id column is rewritten to match.
   * Documents without a usable embedding get faiss_id -1 and stay
   * unsearchable until they are indexed again.
   */
  RebuildResult rebuild_index();

  // Rebuilds when the number of documents that claim a vector differs from the
  // number of vectors in the index, as after a corrupt index file was dropped
  // on load or a run stopped between the metadata insert and the index save.
  // Returns true when a rebuild ran.
  bool reconcile();

  // Removes every document and persists an empty index. Returns the number of
  // deleted documents.
  int64_t clear();

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<VectorIndex> vector_index_;
};

}  // namespace athlete_core

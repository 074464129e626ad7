#include "athlete_core/services/index_maintenance_service.hpp"

#include <algorithm>
#include <iostream>

namespace athlete_core {

nlohmann::json IndexStats::to_json() const {
  nlohmann::json athletes_json = nlohmann::json::array();
  for (const auto &entry : athletes) {
    athletes_json.push_back(
        {{"athlete_name", entry.athlete_name}, {"chunk_count", entry.chunk_count}});
  }
  nlohmann::json j = {{"total_chunks", total_chunks},
                      {"faiss_vectors", faiss_vectors},
                      {"athletes", std::move(athletes_json)},
                      {"index_path", index_path},
                      {"embedding_dimension", embedding_dimension}};
  if (athlete_name)
    j["athlete_name"] = *athlete_name;
  return j;
}

IndexMaintenanceService::IndexMaintenanceService(std::shared_ptr<MetadataStore> metadata_store,
                                                 std::shared_ptr<VectorIndex> vector_index)
    : metadata_store_(std::move(metadata_store)), vector_index_(std::move(vector_index)) {}

IndexStats IndexMaintenanceService::get_stats(const std::optional<std::string> &athlete_name) {
  IndexStats stats;
  stats.total_chunks = metadata_store_->count_chunks(athlete_name);
  stats.faiss_vectors = vector_index_->size();
  stats.index_path = vector_index_->index_dir().string();
  stats.embedding_dimension = vector_index_->dimension();
  stats.athlete_name = athlete_name;

  for (auto &entry : metadata_store_->chunk_counts_by_athlete()) {
    if (!athlete_name || entry.athlete_name == *athlete_name) {
      stats.athletes.push_back(std::move(entry));
    }
  }
  return stats;
}

int64_t IndexMaintenanceService::delete_athlete(const std::string &athlete_name) {
  const int64_t deleted = metadata_store_->delete_athlete_chunks(athlete_name);
  std::cout << "[Maintenance] Deleted " << deleted << " documents of '" << athlete_name << "'"
            << std::endl;
  if (deleted > 0) {
    rebuild_index();
  }
  return deleted;
}

RebuildResult IndexMaintenanceService::rebuild_index() {
  RebuildResult result;
  const size_t dimension = static_cast<size_t>(vector_index_->dimension());

  std::vector<MetadataDocument> documents = metadata_store_->list_documents_with_embeddings();

  std::vector<std::vector<float>> vectors;
  std::vector<std::string> keys;
  std::vector<std::pair<std::string, int64_t>> unindexed;
  for (auto &document : documents) {
    const bool usable = document.embedding.size() == dimension &&
                        std::any_of(document.embedding.begin(), document.embedding.end(),
                                    [](float v) { return v != 0.0f; });
    if (!usable) {
      std::cerr << "Warning: Document '" << document.key
                << "' has no usable embedding, leaving it out of the rebuilt index" << std::endl;
      if (document.faiss_id != VectorIndex::NO_RESULT)
        unindexed.emplace_back(document.key, VectorIndex::NO_RESULT);
      ++result.skipped;
      continue;
    }
    keys.push_back(document.key);
    vectors.push_back(std::move(document.embedding));
  }

  vector_index_->reset();
  std::vector<faiss::idx_t> ids = vector_index_->add(vectors, keys);

  std::vector<std::pair<std::string, int64_t>> key_to_id = std::move(unindexed);
  key_to_id.reserve(key_to_id.size() + ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    key_to_id.emplace_back(keys[i], ids[i]);
  }
  metadata_store_->update_vector_ids(key_to_id);
  vector_index_->save();

  result.reindexed = ids.size();
  std::cout << "[Maintenance] Rebuilt index with " << result.reindexed << " vectors ("
            << result.skipped << " documents skipped)" << std::endl;
  return result;
}

bool IndexMaintenanceService::reconcile() {
  const int64_t indexed = metadata_store_->count_indexed_chunks();
  const int64_t vectors = vector_index_->size();
  if (indexed == vectors) {
    return false;
  }
  std::cerr << "Warning: Metadata store has " << indexed << " indexed documents but the vector "
            << "index holds " << vectors << " vectors, rebuilding from stored embeddings"
            << std::endl;
  rebuild_index();
  return true;
}

int64_t IndexMaintenanceService::clear() {
  const int64_t deleted = metadata_store_->delete_all();
  vector_index_->reset();
  vector_index_->save();
  std::cout << "[Maintenance] Cleared " << deleted << " documents and the vector index"
            << std::endl;
  return deleted;
}

}  // namespace athlete_core

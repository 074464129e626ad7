#pragma once
#include <sqlite_modern_cpp.h>

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "athlete_core/db/database_manager.hpp"
#include "athlete_core/db/metadata_store.hpp"

namespace athlete_core {

// MetadataStore over the chunk_metadata table. Chunk text is kept
// zstd-compressed, extra metadata as a JSON object, the embedding as a raw
// float blob.
class SqliteMetadataStore : public MetadataStore {
 public:
  explicit SqliteMetadataStore(DatabaseManager &db_manager);
  ~SqliteMetadataStore() override = default;

  // Disable copy constructor and assignment
  SqliteMetadataStore(const SqliteMetadataStore &) = delete;
  SqliteMetadataStore &operator=(const SqliteMetadataStore &) = delete;

  void insert(const MetadataDocument &document) override;
  void insert_batch(const std::vector<MetadataDocument> &documents) override;

  std::optional<MetadataDocument> find_by_key(const std::string &key) override;
  std::unordered_map<std::string, MetadataDocument> find_by_keys(
      const std::vector<std::string> &keys) override;
  std::optional<MetadataDocument> find_duplicate(const std::string &source_doc_id,
                                                 int chunk_index) override;

  std::set<std::string> aggregate_indexed_source_ids(const std::string &athlete_name) override;
  std::set<ChunkKey> indexed_chunk_keys(const std::string &athlete_name) override;

  int64_t remove(const std::vector<std::string> &keys) override;
  int64_t delete_athlete_chunks(const std::string &athlete_name) override;
  int64_t delete_all() override;

  std::vector<MetadataDocument> list_documents_with_embeddings() override;
  void update_vector_ids(const std::vector<std::pair<std::string, int64_t>> &key_to_id) override;

  int64_t count_chunks(const std::optional<std::string> &athlete_name = std::nullopt) override;
  int64_t count_indexed_chunks() override;
  std::vector<AthleteChunkCount> chunk_counts_by_athlete() override;

 private:
  DatabaseManager &db_manager_;

  // Stay well below SQLITE_MAX_VARIABLE_NUMBER
  static constexpr size_t MAX_BOUND_KEYS = 500;

  void insert_row(sqlite::database &db, const MetadataDocument &document);
};

}  // namespace athlete_core

#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace athlete_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct VectorSearchHit {
  faiss::idx_t id;
  float score;
};

/**
 * @brief Exact inner-product index over unit-norm vectors.
 *
 * Every vector is L2-normalised on the way in (and every query on the way to
 * search) so that scores are cosine similarities. Ids are the insertion
 * ordinal: dense, zero based, never reused. Each id maps to the opaque key of
 * its metadata document.
 *
 * On disk the index is a pair of files in index_dir:
 *   faiss.index      - FAISS binary of the IndexFlatIP
 *   id_mapping.json  - {format_version, dimension, next_id, entries:[{id,key}]}
 */
class VectorIndex {
 public:
  static constexpr faiss::idx_t NO_RESULT = -1;
  static constexpr int FORMAT_VERSION = 1;
  static constexpr const char *INDEX_FILE_NAME = "faiss.index";
  static constexpr const char *MAPPING_FILE_NAME = "id_mapping.json";

  VectorIndex(std::filesystem::path index_dir, int dimension);
  ~VectorIndex() = default;

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Appends all vectors or none. Returns the assigned ids in input order.
  std::vector<faiss::idx_t> add(const std::vector<std::vector<float>> &vectors,
                                const std::vector<std::string> &keys);

  // Hits in descending score order. When k exceeds size() the tail is padded
  // with NO_RESULT ids.
  std::vector<VectorSearchHit> search(const std::vector<float> &query, int k) const;

  void save() const;

  // Replaces the in-memory state with the persisted pair. Returns true when a
  // persisted index was loaded, false when starting empty.
  bool load();

  void reset();

  std::optional<std::string> metadata_key(faiss::idx_t id) const;
  int64_t size() const;
  int64_t next_id() const;
  int dimension() const { return dimension_; }
  const std::filesystem::path &index_dir() const { return index_dir_; }

 private:
  std::filesystem::path index_dir_;
  int dimension_;
  std::unique_ptr<faiss::IndexFlatIP> index_;
  std::unordered_map<faiss::idx_t, std::string> id_to_key_;
  int64_t next_id_ = 0;
  mutable std::shared_mutex mutex_;

  void reset_unlocked();
  std::vector<float> normalized_copy(const std::vector<float> &vector) const;
  std::filesystem::path index_file() const { return index_dir_ / INDEX_FILE_NAME; }
  std::filesystem::path mapping_file() const { return index_dir_ / MAPPING_FILE_NAME; }
};

}  // namespace athlete_core

#include "athlete_core/index/vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <nlohmann/json.hpp>

namespace athlete_core {

namespace {

bool has_zero_norm(const std::vector<float> &vector) {
  return std::all_of(vector.begin(), vector.end(), [](float v) { return v == 0.0f; });
}

}  // namespace

VectorIndex::VectorIndex(std::filesystem::path index_dir, int dimension)
    : index_dir_(std::move(index_dir)), dimension_(dimension) {
  if (dimension_ <= 0) {
    throw VectorIndexError("Vector dimension must be greater than 0, got " +
                           std::to_string(dimension_));
  }
  index_ = std::make_unique<faiss::IndexFlatIP>(dimension_);
}

std::vector<float> VectorIndex::normalized_copy(const std::vector<float> &vector) const {
  std::vector<float> copy = vector;
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), 1, copy.data());
  return copy;
}

std::vector<faiss::idx_t> VectorIndex::add(const std::vector<std::vector<float>> &vectors,
                                           const std::vector<std::string> &keys) {
  if (vectors.size() != keys.size()) {
    throw VectorIndexError("Vector count (" + std::to_string(vectors.size()) +
                           ") does not match key count (" + std::to_string(keys.size()) + ")");
  }
  if (vectors.empty()) {
    return {};
  }

  // Validate everything before touching the index so a failed call appends nothing
  std::vector<float> flat;
  flat.reserve(vectors.size() * static_cast<size_t>(dimension_));
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != static_cast<size_t>(dimension_)) {
      throw VectorIndexError("Vector dimension mismatch for key '" + keys[i] + "'. Expected " +
                             std::to_string(dimension_) + ", got " +
                             std::to_string(vectors[i].size()));
    }
    if (has_zero_norm(vectors[i])) {
      throw VectorIndexError("Cannot normalise zero vector for key '" + keys[i] + "'");
    }
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
  }
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), vectors.size(), flat.data());

  std::unique_lock lock(mutex_);
  std::vector<faiss::idx_t> ids;
  ids.reserve(vectors.size());
  try {
    index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors: " + std::string(e.what()));
  }
  for (const auto &key : keys) {
    id_to_key_[next_id_] = key;
    ids.push_back(next_id_);
    ++next_id_;
  }
  return ids;
}

std::vector<VectorSearchHit> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (k <= 0) {
    return {};
  }
  if (query.size() != static_cast<size_t>(dimension_)) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " + std::to_string(query.size()));
  }

  std::vector<float> normalized = normalized_copy(query);

  std::shared_lock lock(mutex_);
  const faiss::idx_t total = index_->ntotal;
  if (total == 0) {
    return {};
  }

  const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, total);
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, normalized.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<VectorSearchHit> hits;
  hits.reserve(static_cast<size_t>(k));
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    hits.push_back({labels[i], distances[i]});
  }
  while (hits.size() < static_cast<size_t>(k)) {
    hits.push_back({NO_RESULT, -std::numeric_limits<float>::infinity()});
  }
  return hits;
}

void VectorIndex::save() const {
  std::shared_lock lock(mutex_);

  nlohmann::json mapping;
  mapping["format_version"] = FORMAT_VERSION;
  mapping["dimension"] = dimension_;
  mapping["next_id"] = next_id_;
  nlohmann::json entries = nlohmann::json::array();
  for (faiss::idx_t id = 0; id < next_id_; ++id) {
    auto it = id_to_key_.find(id);
    if (it != id_to_key_.end()) {
      entries.push_back({{"id", id}, {"key", it->second}});
    }
  }
  mapping["entries"] = std::move(entries);

  const std::filesystem::path index_tmp = index_file().string() + ".tmp";
  const std::filesystem::path mapping_tmp = mapping_file().string() + ".tmp";

  try {
    std::filesystem::create_directories(index_dir_);

    faiss::write_index(index_.get(), index_tmp.c_str());

    std::ofstream out(mapping_tmp, std::ios::trunc);
    if (!out) {
      throw VectorIndexError("Could not open " + mapping_tmp.string() + " for writing");
    }
    out << mapping.dump(2);
    out.close();
    if (!out) {
      throw VectorIndexError("Failed writing " + mapping_tmp.string());
    }

    std::filesystem::rename(index_tmp, index_file());
    std::filesystem::rename(mapping_tmp, mapping_file());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to write Faiss index: " + std::string(e.what()));
  } catch (const std::filesystem::filesystem_error &e) {
    throw VectorIndexError("Failed to save index to " + index_dir_.string() + ": " + e.what());
  }

  std::cout << "[VectorIndex] Saved " << index_->ntotal << " vectors to " << index_dir_.string()
            << std::endl;
}

bool VectorIndex::load() {
  std::unique_lock lock(mutex_);

  if (!std::filesystem::exists(index_file()) || !std::filesystem::exists(mapping_file())) {
    std::cout << "[VectorIndex] No persisted index in " << index_dir_.string()
              << ", starting empty." << std::endl;
    reset_unlocked();
    return false;
  }

  auto start_empty = [&](const std::string &reason) {
    std::cerr << "Warning: Ignoring persisted index in " << index_dir_.string() << ": " << reason
              << ". Starting with an empty index." << std::endl;
    reset_unlocked();
    return false;
  };

  nlohmann::json mapping;
  {
    std::ifstream in(mapping_file());
    if (!in) {
      return start_empty("cannot open " + mapping_file().string());
    }
    mapping = nlohmann::json::parse(in, nullptr, /*allow_exceptions*/ false);
  }
  if (mapping.is_discarded() || !mapping.is_object()) {
    return start_empty("id mapping is not valid JSON");
  }

  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(index_file().c_str()));
  } catch (const std::exception &e) {
    // FaissException for bad headers, std::bad_alloc etc. for garbage sizes
    return start_empty("unreadable Faiss file (" + std::string(e.what()) + ")");
  }

  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(loaded.get());
  if (!flat) {
    return start_empty("index is not a flat inner-product index");
  }

  int format_version = 0;
  int stored_dimension = 0;
  int64_t stored_next_id = 0;
  std::unordered_map<faiss::idx_t, std::string> id_to_key;
  try {
    format_version = mapping.at("format_version").get<int>();
    stored_dimension = mapping.at("dimension").get<int>();
    stored_next_id = mapping.at("next_id").get<int64_t>();
    for (const auto &entry : mapping.at("entries")) {
      id_to_key[entry.at("id").get<faiss::idx_t>()] = entry.at("key").get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    return start_empty("malformed id mapping (" + std::string(e.what()) + ")");
  }

  if (format_version != FORMAT_VERSION) {
    return start_empty("unsupported format version " + std::to_string(format_version));
  }

  if (flat->d != dimension_ || stored_dimension != dimension_) {
    reset_unlocked();
    throw VectorIndexError("Persisted index in " + index_dir_.string() + " has dimension " +
                           std::to_string(flat->d) + " but the configured dimension is " +
                           std::to_string(dimension_));
  }

  if (stored_next_id != flat->ntotal) {
    return start_empty("next_id " + std::to_string(stored_next_id) +
                       " does not match vector count " + std::to_string(flat->ntotal));
  }
  for (const auto &[id, key] : id_to_key) {
    if (id < 0 || id >= flat->ntotal) {
      return start_empty("mapping id " + std::to_string(id) + " out of range");
    }
  }

  loaded.release();
  index_.reset(flat);
  id_to_key_ = std::move(id_to_key);
  next_id_ = stored_next_id;

  std::cout << "[VectorIndex] Loaded " << index_->ntotal << " vectors from "
            << index_dir_.string() << std::endl;
  return true;
}

void VectorIndex::reset() {
  std::unique_lock lock(mutex_);
  reset_unlocked();
}

void VectorIndex::reset_unlocked() {
  index_ = std::make_unique<faiss::IndexFlatIP>(dimension_);
  id_to_key_.clear();
  next_id_ = 0;
}

std::optional<std::string> VectorIndex::metadata_key(faiss::idx_t id) const {
  std::shared_lock lock(mutex_);
  auto it = id_to_key_.find(id);
  if (it == id_to_key_.end()) {
    return std::nullopt;
  }
  return it->second;
}

int64_t VectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return index_->ntotal;
}

int64_t VectorIndex::next_id() const {
  std::shared_lock lock(mutex_);
  return next_id_;
}

}  // namespace athlete_core

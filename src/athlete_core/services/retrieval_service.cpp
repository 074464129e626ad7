#include "athlete_core/services/retrieval_service.hpp"

#include <algorithm>
#include <iostream>

#include "athlete_core/types.hpp"

namespace athlete_core {

RetrievalService::RetrievalService(const Config &config,
                                   std::shared_ptr<MetadataStore> metadata_store,
                                   std::shared_ptr<VectorIndex> vector_index,
                                   std::shared_ptr<EmbeddingProvider> embedding_provider)
    : config_(config),
      metadata_store_(std::move(metadata_store)),
      vector_index_(std::move(vector_index)),
      embedding_provider_(std::move(embedding_provider)) {}

std::vector<float> RetrievalService::embed_query(const std::string &query) {
  std::vector<float> embedding = embedding_provider_->embed(query);
  if (embedding.size() != static_cast<size_t>(vector_index_->dimension())) {
    throw EmbeddingError("Query embedding has dimension " + std::to_string(embedding.size()) +
                         ", expected " + std::to_string(vector_index_->dimension()));
  }
  return embedding;
}

std::vector<RetrievedChunk> RetrievalService::retrieve(
    const std::string &query,
    const std::optional<std::string> &athlete_filter,
    int top_k,
    float min_similarity) {
  const int64_t index_size = vector_index_->size();
  if (top_k <= 0 || index_size == 0) {
    return {};
  }

  std::vector<float> query_embedding = embed_query(query);

  int64_t search_k = athlete_filter ? static_cast<int64_t>(top_k) * FILTER_OVERFETCH_FACTOR
                                    : static_cast<int64_t>(top_k);
  search_k = std::min(search_k, index_size);

  std::vector<VectorSearchHit> hits =
      vector_index_->search(query_embedding, static_cast<int>(search_k));

  // Resolve all candidate keys with one store round trip
  std::vector<std::pair<const VectorSearchHit *, std::string>> candidates;
  std::vector<std::string> keys;
  for (const auto &hit : hits) {
    if (hit.id == VectorIndex::NO_RESULT)
      continue;
    std::optional<std::string> key = vector_index_->metadata_key(hit.id);
    if (!key) {
      std::cerr << "Warning: Vector " << hit.id << " has no metadata key, skipping" << std::endl;
      continue;
    }
    candidates.emplace_back(&hit, *key);
    keys.push_back(*key);
  }
  std::unordered_map<std::string, MetadataDocument> documents = metadata_store_->find_by_keys(keys);

  std::vector<RetrievedChunk> results;
  for (const auto &[hit, key] : candidates) {
    if (results.size() >= static_cast<size_t>(top_k))
      break;

    auto it = documents.find(key);
    if (it == documents.end()) {
      std::cerr << "Warning: Metadata for vector " << hit->id << " ('" << key
                << "') not found, skipping stale reference" << std::endl;
      continue;
    }
    if (athlete_filter && it->second.chunk.metadata.athlete_name != *athlete_filter)
      continue;
    if (hit->score < min_similarity)
      continue;

    results.push_back({.document = it->second, .similarity = hit->score, .vector_id = hit->id});
  }

  std::cout << "[Retriever] " << results.size() << " chunks for query (searched " << search_k
            << " of " << index_size << " vectors"
            << (athlete_filter ? ", athlete '" + *athlete_filter + "'" : std::string()) << ")"
            << std::endl;
  return results;
}

std::vector<RetrievedChunk> RetrievalService::retrieve(
    const std::string &query,
    const std::optional<std::string> &athlete_filter) {
  return retrieve(query, athlete_filter, config_.top_k_chunks, config_.min_similarity);
}

nlohmann::json RetrievalService::to_json(const RetrievedChunk &result) {
  const MetadataDocument &doc = result.document;
  const ChunkMetadata &metadata = doc.chunk.metadata;
  nlohmann::json j = {{"text", doc.chunk.text},
                      {"similarity", result.similarity},
                      {"vector_id", result.vector_id},
                      {"athlete_name", metadata.athlete_name},
                      {"source_doc_id", metadata.source_doc_id},
                      {"chunk_index", doc.chunk.chunk_index},
                      {"token_count", doc.chunk.token_count},
                      {"embedding_model", doc.embedding_model},
                      {"indexed_at", time_point_to_string(doc.indexed_at)}};
  if (metadata.topic)
    j["topic"] = *metadata.topic;
  if (metadata.url)
    j["url"] = *metadata.url;
  if (metadata.title)
    j["title"] = *metadata.title;
  if (!metadata.extra.empty())
    j["extra"] = metadata.extra;
  return j;
}

}  // namespace athlete_core

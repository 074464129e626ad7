#include "athlete_core/services/indexing_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <set>

namespace athlete_core {

namespace {

// Length in code points after stripping surrounding whitespace
size_t trimmed_length(const std::string &text) {
  const char *ws = " \t\n\r\f\v";
  const size_t begin = text.find_first_not_of(ws);
  if (begin == std::string::npos)
    return 0;
  const size_t end = text.find_last_not_of(ws);
  size_t length = 0;
  for (size_t i = begin; i <= end; ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
      ++length;
  }
  return length;
}

bool is_zero_vector(const std::vector<float> &vector) {
  return std::all_of(vector.begin(), vector.end(), [](float v) { return v == 0.0f; });
}

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

IndexingPipeline::IndexingPipeline(const Config &config,
                                   std::shared_ptr<SourceDocumentRepo> source_repo,
                                   std::shared_ptr<MetadataStore> metadata_store,
                                   std::shared_ptr<VectorIndex> vector_index,
                                   std::shared_ptr<EmbeddingProvider> embedding_provider)
    : config_(config),
      chunker_(config),
      source_repo_(std::move(source_repo)),
      metadata_store_(std::move(metadata_store)),
      vector_index_(std::move(vector_index)),
      embedding_provider_(std::move(embedding_provider)) {}

std::vector<Passage> IndexingPipeline::fetch_passages(const std::string &athlete_name,
                                                      bool skip_indexed) {
  std::vector<SourceDocument> documents = source_repo_->find_by_athlete(athlete_name);
  if (documents.empty()) {
    std::cerr << "Warning: No source documents found for '" << athlete_name << "'" << std::endl;
    return {};
  }

  std::vector<Passage> passages;
  for (const auto &doc : documents) {
    for (size_t idx = 0; idx < doc.web.size(); ++idx) {
      const WebItem &item = doc.web[idx];
      const std::string &text = item.best_text();
      if (trimmed_length(text) < static_cast<size_t>(config_.min_passage_length)) {
        continue;
      }

      Passage passage;
      passage.id = doc.id + "_" + std::to_string(idx);
      passage.text = text;
      passage.athlete_name = doc.athlete_name;
      passage.topic = doc.topic;
      passage.url = item.source_url;
      passage.title = item.title;
      passage.original_doc_id = doc.id;
      passage.web_index = static_cast<int>(idx);
      passage.status_code = item.status_code;
      passages.push_back(std::move(passage));
    }
  }
  std::cout << "[Pipeline] " << passages.size() << " passages extracted from " << documents.size()
            << " documents for '" << athlete_name << "'" << std::endl;

  if (skip_indexed) {
    const std::set<std::string> indexed = metadata_store_->aggregate_indexed_source_ids(athlete_name);
    if (!indexed.empty()) {
      const size_t before = passages.size();
      std::erase_if(passages, [&](const Passage &p) { return indexed.count(p.id) > 0; });
      std::cout << "[Pipeline] Skipped " << before - passages.size()
                << " already indexed passages" << std::endl;
    }
  }
  return passages;
}

std::vector<Chunk> IndexingPipeline::split_into_chunks(const std::vector<Passage> &passages) const {
  return chunker_.split_passages(passages, config_.prepend_metadata_to_chunks);
}

std::vector<EmbeddedChunk> IndexingPipeline::embed_chunks(const std::vector<Chunk> &chunks) {
  std::vector<EmbeddedChunk> embedded;
  embedded.reserve(chunks.size());

  const size_t batch_size = static_cast<size_t>(config_.batch_size);
  const size_t expected_dimension = static_cast<size_t>(vector_index_->dimension());
  const size_t total_batches = (chunks.size() + batch_size - 1) / batch_size;
  const std::string model = embedding_provider_->model_name();

  for (size_t start = 0; start < chunks.size(); start += batch_size) {
    const size_t end = std::min(start + batch_size, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    std::vector<std::vector<float>> vectors = embedding_provider_->embed_batch(texts);
    if (vectors.size() != texts.size()) {
      throw EmbeddingError("Embedding provider returned " + std::to_string(vectors.size()) +
                           " vectors for a batch of " + std::to_string(texts.size()));
    }

    for (size_t i = 0; i < vectors.size(); ++i) {
      const Chunk &chunk = chunks[start + i];
      if (vectors[i].size() != expected_dimension) {
        std::cerr << "Warning: Dropping chunk " << chunk.chunk_index << " of '"
                  << chunk.metadata.source_doc_id << "': embedding has dimension "
                  << vectors[i].size() << ", expected " << expected_dimension << std::endl;
        continue;
      }
      embedded.push_back(EmbeddedChunk{.chunk = chunk,
                                       .embedding = std::move(vectors[i]),
                                       .embedding_model = model,
                                       .embedding_dimension =
                                           static_cast<int>(expected_dimension)});
    }
    std::cout << "[Pipeline] Embedded batch " << (start / batch_size) + 1 << "/" << total_batches
              << std::endl;
  }
  return embedded;
}

size_t IndexingPipeline::index_chunks(const std::vector<EmbeddedChunk> &embedded,
                                      bool skip_duplicates) {
  if (embedded.empty()) {
    return 0;
  }

  const size_t expected_dimension = static_cast<size_t>(vector_index_->dimension());
  // One lookup per athlete per run, then kept current with this run's chunks
  std::map<std::string, std::set<ChunkKey>> known_keys;

  std::vector<MetadataDocument> documents;
  std::vector<std::vector<float>> vectors;
  std::vector<std::string> keys;
  size_t duplicates = 0;
  size_t rejected = 0;

  const int64_t first_id = vector_index_->next_id();
  const auto now = std::chrono::system_clock::now();

  for (const auto &record : embedded) {
    const Chunk &chunk = record.chunk;
    if (record.embedding.size() != expected_dimension || is_zero_vector(record.embedding)) {
      std::cerr << "Warning: Rejecting chunk " << chunk.chunk_index << " of '"
                << chunk.metadata.source_doc_id << "': unusable embedding of dimension "
                << record.embedding.size() << std::endl;
      ++rejected;
      continue;
    }

    if (skip_duplicates) {
      const std::string &athlete = chunk.metadata.athlete_name;
      auto it = known_keys.find(athlete);
      if (it == known_keys.end()) {
        it = known_keys.emplace(athlete, metadata_store_->indexed_chunk_keys(athlete)).first;
      }
      ChunkKey key{.source_doc_id = chunk.metadata.source_doc_id, .chunk_index = chunk.chunk_index};
      if (!it->second.insert(std::move(key)).second) {
        ++duplicates;
        continue;
      }
    }

    MetadataDocument document;
    document.key = make_document_key(chunk.metadata.athlete_name, chunk.metadata.source_doc_id,
                                     chunk.chunk_index);
    document.chunk = chunk;
    document.faiss_id = first_id + static_cast<int64_t>(documents.size());
    document.indexed_at = now;
    document.embedding_model = record.embedding_model;
    document.embedding_dimension = static_cast<int>(record.embedding.size());
    document.embedding = record.embedding;

    keys.push_back(document.key);
    vectors.push_back(record.embedding);
    documents.push_back(std::move(document));
  }

  if (duplicates > 0) {
    std::cout << "[Pipeline] Skipped " << duplicates << " duplicate chunks" << std::endl;
  }
  if (documents.empty()) {
    std::cout << "[Pipeline] No new chunks to index (" << rejected << " rejected)" << std::endl;
    return 0;
  }

  metadata_store_->insert_batch(documents);

  std::vector<faiss::idx_t> ids;
  try {
    ids = vector_index_->add(vectors, keys);
    vector_index_->save();
  } catch (const VectorIndexError &e) {
    std::cerr << "Error: Vector index append failed, removing " << keys.size()
              << " metadata documents: " << e.what() << std::endl;
    restore_after_failed_append(keys);
    throw;
  }

  std::vector<std::pair<std::string, int64_t>> moved_ids;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (ids[i] != documents[i].faiss_id) {
      moved_ids.emplace_back(keys[i], ids[i]);
    }
  }
  if (!moved_ids.empty()) {
    metadata_store_->update_vector_ids(moved_ids);
  }

  std::cout << "[Pipeline] Indexed " << documents.size() << " chunks, index now holds "
            << vector_index_->size() << " vectors" << std::endl;
  return documents.size();
}

void IndexingPipeline::restore_after_failed_append(const std::vector<std::string> &inserted_keys) {
  try {
    metadata_store_->remove(inserted_keys);
  } catch (const MetadataStoreError &e) {
    std::cerr << "Error: Could not remove metadata of failed append: " << e.what() << std::endl;
  }
  // The last saved state is the last consistent one
  try {
    vector_index_->load();
  } catch (const VectorIndexError &e) {
    std::cerr << "Error: Could not reload vector index after failed append: " << e.what()
              << std::endl;
  }
}

IndexingStats IndexingPipeline::process_athlete(const std::string &athlete_name,
                                                bool skip_indexed) {
  const auto start = std::chrono::steady_clock::now();
  IndexingStats stats;
  stats.athlete_name = athlete_name;

  std::cout << "[Pipeline] Indexing '" << athlete_name << "'" << std::endl;

  PipelineStage stage = PipelineStage::FETCH;
  try {
    std::vector<Passage> passages = fetch_passages(athlete_name, skip_indexed);
    stats.documents_loaded = passages.size();
    if (passages.empty()) {
      stats.status = IndexingStatus::NO_NEW_DOCUMENTS;
      stats.duration_seconds = seconds_since(start);
      return stats;
    }

    stage = PipelineStage::CHUNK;
    std::vector<Chunk> chunks = split_into_chunks(passages);
    stats.chunks_created = chunks.size();
    if (chunks.empty()) {
      stats.status = IndexingStatus::NO_CHUNKS_CREATED;
      stats.duration_seconds = seconds_since(start);
      return stats;
    }

    stage = PipelineStage::EMBED;
    std::vector<EmbeddedChunk> embedded = embed_chunks(chunks);

    stage = PipelineStage::INDEX;
    stats.chunks_indexed = index_chunks(embedded);
  } catch (const std::exception &e) {
    throw IndexingError(stage, "Indexing '" + athlete_name + "' failed: " + e.what());
  }

  stats.status = IndexingStatus::SUCCESS;
  stats.duration_seconds = seconds_since(start);
  std::cout << "[Pipeline] '" << athlete_name << "': " << stats.documents_loaded << " passages, "
            << stats.chunks_created << " chunks, " << stats.chunks_indexed << " indexed in "
            << stats.duration_seconds << "s" << std::endl;
  return stats;
}

std::vector<IndexingStats> IndexingPipeline::process_all(const std::vector<std::string> &athlete_names,
                                                         bool skip_indexed) {
  std::vector<IndexingStats> results;
  results.reserve(athlete_names.size());
  size_t failed = 0;
  size_t indexed = 0;

  for (const auto &athlete_name : athlete_names) {
    const auto start = std::chrono::steady_clock::now();
    try {
      results.push_back(process_athlete(athlete_name, skip_indexed));
      indexed += results.back().chunks_indexed;
    } catch (const IndexingError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      IndexingStats stats;
      stats.athlete_name = athlete_name;
      stats.status = IndexingStatus::ERROR;
      stats.error = e.what();
      stats.failed_stage = e.stage();
      stats.duration_seconds = seconds_since(start);
      results.push_back(std::move(stats));
      ++failed;
    }
  }

  std::cout << "[Pipeline] Batch finished: " << athlete_names.size() - failed << "/"
            << athlete_names.size() << " athletes succeeded, " << indexed << " chunks indexed"
            << std::endl;
  return results;
}

}  // namespace athlete_core

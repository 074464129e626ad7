#pragma once

#include <memory>
#include <string>
#include <vector>

#include "athlete_core/chunking/text_chunker.hpp"
#include "athlete_core/config.hpp"
#include "athlete_core/db/metadata_store.hpp"
#include "athlete_core/db/source_document_repo.hpp"
#include "athlete_core/index/vector_index.hpp"
#include "athlete_core/llm/embedding_provider.hpp"
#include "athlete_core/types.hpp"

namespace athlete_core {

class IndexingError : public std::exception {
 public:
  IndexingError(PipelineStage stage, const std::string &message)
      : stage_(stage), message_("[" + to_string(stage) + "] " + message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  PipelineStage stage() const { return stage_; }

 private:
  PipelineStage stage_;
  std::string message_;
};

/**
 * @brief fetch -> chunk -> embed -> index for one athlete at a time.
 *
 * Runs are incremental: passages whose id already has chunks in the metadata
 * store are not fetched again, and chunks whose (source_doc_id, chunk_index)
 * is already stored for the athlete are not indexed again. Running the same
 * athlete twice therefore indexes nothing the second time.
 */
class IndexingPipeline {
 public:
  IndexingPipeline(const Config &config,
                   std::shared_ptr<SourceDocumentRepo> source_repo,
                   std::shared_ptr<MetadataStore> metadata_store,
                   std::shared_ptr<VectorIndex> vector_index,
                   std::shared_ptr<EmbeddingProvider> embedding_provider);

  virtual ~IndexingPipeline() = default;

  std::vector<Passage> fetch_passages(const std::string &athlete_name, bool skip_indexed = true);

  std::vector<Chunk> split_into_chunks(const std::vector<Passage> &passages) const;

  // Throws EmbeddingError when the provider fails or answers a batch with the
  // wrong number of vectors. Vectors of the wrong dimension are dropped.
  std::vector<EmbeddedChunk> embed_chunks(const std::vector<Chunk> &chunks);

  // Returns the number of chunks written to both stores
  size_t index_chunks(const std::vector<EmbeddedChunk> &embedded, bool skip_duplicates = true);

  // Throws IndexingError carrying the stage that failed
  IndexingStats process_athlete(const std::string &athlete_name, bool skip_indexed = true);

  // One entry per requested athlete, in order. A failing athlete is recorded
  // with status error and does not stop the batch.
  std::vector<IndexingStats> process_all(const std::vector<std::string> &athlete_names,
                                         bool skip_indexed = true);

 private:
  Config config_;
  TextChunker chunker_;
  std::shared_ptr<SourceDocumentRepo> source_repo_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;

  void restore_after_failed_append(const std::vector<std::string> &inserted_keys);
};

}  // namespace athlete_core

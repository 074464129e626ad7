#pragma once

#include <memory>

#include "athlete_core/config.hpp"

namespace athlete_core {
class DatabaseManager;
class MetadataStore;
class SourceDocumentRepo;
class VectorIndex;
class EmbeddingProvider;
class IndexingPipeline;
class RetrievalService;
class IndexMaintenanceService;
}  // namespace athlete_core

namespace athlete_core {

// Owns one instance of every component and wires them together. The vector
// index is loaded from disk on construction.
class ServiceProvider {
 public:
  ServiceProvider(const Config &config, std::shared_ptr<EmbeddingProvider> embedding_provider);
  ~ServiceProvider();

  ServiceProvider(const ServiceProvider &) = delete;
  ServiceProvider &operator=(const ServiceProvider &) = delete;

  // Production wiring: embeddings come from the Ollama server in the config
  static std::unique_ptr<ServiceProvider> create(const Config &config);

  const Config &get_config() const { return config_; }
  MetadataStore &get_metadata_store() { return *metadata_store_; }
  SourceDocumentRepo &get_source_document_repo() { return *source_repo_; }
  VectorIndex &get_vector_index() { return *vector_index_; }
  EmbeddingProvider &get_embedding_provider() { return *embedding_provider_; }
  IndexingPipeline &get_indexing_pipeline() { return *pipeline_; }
  RetrievalService &get_retrieval_service() { return *retrieval_service_; }
  IndexMaintenanceService &get_maintenance_service() { return *maintenance_service_; }

 private:
  Config config_;
  // Declared first so the stores holding references into it are destroyed before it
  std::unique_ptr<DatabaseManager> db_manager_;
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<SourceDocumentRepo> source_repo_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::unique_ptr<IndexingPipeline> pipeline_;
  std::unique_ptr<RetrievalService> retrieval_service_;
  std::unique_ptr<IndexMaintenanceService> maintenance_service_;
};

}  // namespace athlete_core

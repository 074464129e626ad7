#include "athlete_core/services/service_provider.hpp"

#include <stdexcept>

#include "athlete_core/db/database_manager.hpp"
#include "athlete_core/db/source_document_repo.hpp"
#include "athlete_core/db/sqlite_metadata_store.hpp"
#include "athlete_core/index/vector_index.hpp"
#include "athlete_core/llm/ollama_client.hpp"
#include "athlete_core/services/index_maintenance_service.hpp"
#include "athlete_core/services/indexing_pipeline.hpp"
#include "athlete_core/services/retrieval_service.hpp"

namespace athlete_core {

ServiceProvider::ServiceProvider(const Config &config,
                                 std::shared_ptr<EmbeddingProvider> embedding_provider)
    : config_(config), embedding_provider_(std::move(embedding_provider)) {
  if (!embedding_provider_) {
    throw std::invalid_argument("ServiceProvider requires an embedding provider");
  }
  if (embedding_provider_->dimension() != config_.vector_dimension) {
    throw std::runtime_error("Embedding provider dimension " +
                             std::to_string(embedding_provider_->dimension()) +
                             " does not match vector_dimension " +
                             std::to_string(config_.vector_dimension));
  }

  db_manager_ = std::make_unique<DatabaseManager>(config_.metadata_db_path, config_.db_pool_size);
  metadata_store_ = std::make_shared<SqliteMetadataStore>(*db_manager_);
  source_repo_ = std::make_shared<SourceDocumentRepo>(*db_manager_);

  vector_index_ = std::make_shared<VectorIndex>(config_.faiss_index_path, config_.vector_dimension);
  vector_index_->load();

  pipeline_ = std::make_unique<IndexingPipeline>(config_, source_repo_, metadata_store_,
                                                 vector_index_, embedding_provider_);
  retrieval_service_ = std::make_unique<RetrievalService>(config_, metadata_store_, vector_index_,
                                                          embedding_provider_);
  maintenance_service_ = std::make_unique<IndexMaintenanceService>(metadata_store_, vector_index_);
  maintenance_service_->reconcile();
}

ServiceProvider::~ServiceProvider() = default;

std::unique_ptr<ServiceProvider> ServiceProvider::create(const Config &config) {
  auto ollama_client = std::make_shared<OllamaClient>(config.ollama_url, config.embedding_model,
                                                      config.vector_dimension);
  return std::make_unique<ServiceProvider>(config, std::move(ollama_client));
}

}  // namespace athlete_core

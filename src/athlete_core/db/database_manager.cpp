#include "athlete_core/db/database_manager.hpp"

#include <stdexcept>

namespace athlete_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema();

  // 2. Create the connection pool shared by the repositories
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  // One row per indexed chunk. faiss_id points into the vector index,
  // vector_blob keeps the raw embedding for rebuilds.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunk_metadata (
          doc_key TEXT PRIMARY KEY,
          athlete_name TEXT NOT NULL,
          source_doc_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          token_count INTEGER NOT NULL,
          content BLOB NOT NULL,
          topic TEXT,
          url TEXT,
          title TEXT,
          extra TEXT NOT NULL DEFAULT '{}',
          faiss_id INTEGER NOT NULL,
          embedding_model TEXT NOT NULL,
          embedding_dimension INTEGER NOT NULL,
          vector_blob BLOB,
          indexed_at TEXT NOT NULL,
          UNIQUE (athlete_name, source_doc_id, chunk_index)
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunk_metadata_source
      ON chunk_metadata(source_doc_id, chunk_index)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunk_metadata_faiss_id
      ON chunk_metadata(faiss_id)
    )";

  // Crawler output, one row per scraped document
  db << R"(
      CREATE TABLE IF NOT EXISTS source_documents (
          id TEXT PRIMARY KEY,
          athlete_name TEXT NOT NULL,
          topic TEXT,
          web TEXT NOT NULL,
          scraped_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_source_documents_athlete
      ON source_documents(athlete_name)
    )";
}

}  // namespace athlete_core

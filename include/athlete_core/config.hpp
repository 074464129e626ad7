#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace athlete_core {

// Process-wide settings, built once by the composition root and handed to each
// component by reference.
class Config {
 public:
  // Storage
  std::string metadata_db_path;
  std::string faiss_index_path;
  int db_pool_size;

  // Embeddings
  std::string ollama_url;
  std::string embedding_model;
  int vector_dimension;
  int batch_size;

  // Chunking
  int chunk_size;
  int chunk_overlap;
  bool prepend_metadata_to_chunks;
  int min_passage_length;

  // Retrieval defaults
  int top_k_chunks;
  float min_similarity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    try {
      config.metadata_db_path =
          json_config.value("metadata_db_path", std::string("./data/metadata.db"));
      config.faiss_index_path =
          json_config.value("faiss_index_path", std::string("./data/faiss_indexes"));
      config.db_pool_size = json_config.value("db_pool_size", 2);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.vector_dimension = json_config.value("vector_dimension", 768);
      config.batch_size = json_config.value("batch_size", 32);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.prepend_metadata_to_chunks = json_config.value("prepend_metadata_to_chunks", true);
      config.min_passage_length = json_config.value("min_passage_length", 100);

      config.top_k_chunks = json_config.value("top_k_chunks", 5);
      config.min_similarity = json_config.value("min_similarity", 0.3f);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (faiss_index_path.empty()) {
      throw std::runtime_error("faiss_index_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (vector_dimension <= 0) {
      throw std::runtime_error("vector_dimension must be greater than 0");
    }
    if (batch_size <= 0) {
      throw std::runtime_error("batch_size must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (min_passage_length < 0) {
      throw std::runtime_error("min_passage_length cannot be negative");
    }
    if (top_k_chunks <= 0) {
      throw std::runtime_error("top_k_chunks must be greater than 0");
    }
    if (min_similarity < -1.0f || min_similarity > 1.0f) {
      throw std::runtime_error("min_similarity must be in [-1, 1]");
    }
  }
};

}  // namespace athlete_core

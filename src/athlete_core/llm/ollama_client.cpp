#include "athlete_core/llm/ollama_client.hpp"

#include <ollama.hpp>

namespace athlete_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           int dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  if (dimension_ <= 0) {
    throw EmbeddingError("Embedding dimension must be greater than 0");
  }
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::embed(const std::string &text) {
  std::vector<std::vector<float>> embeddings = embed_batch({text});
  return std::move(embeddings.front());
}

std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  try {
    ollama::request request(ollama::message_type::embedding);
    request["model"] = embedding_model_;
    request["input"] = texts;
    request["truncate"] = true;

    ollama::response response = ollama::generate_embeddings(request);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingError("Response does not contain embeddings field");
    }
    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingError("Embeddings field is not an array");
    }
    if (embeddings.size() != texts.size()) {
      throw EmbeddingError("Ollama returned " + std::to_string(embeddings.size()) +
                           " embeddings for " + std::to_string(texts.size()) + " inputs");
    }

    std::vector<std::vector<float>> result;
    result.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      result.push_back(embedding.get<std::vector<float>>());
    }
    return result;
  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }
}

}  // namespace athlete_core

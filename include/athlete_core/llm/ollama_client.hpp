#pragma once

#include <string>
#include <vector>

#include "athlete_core/llm/embedding_provider.hpp"

namespace athlete_core {

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws EmbeddingError when no server answers at ollama_url
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model, int dimension);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text) override;

  // One /api/embed round trip for the whole batch
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) override;

  int dimension() const override { return dimension_; }
  std::string model_name() const override { return embedding_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int dimension_;

  void setup_server_connection();
};

}  // namespace athlete_core

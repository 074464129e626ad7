#pragma once

#include <string>
#include <vector>

namespace athlete_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Maps text to fixed-dimension vectors. embed_batch returns one vector per
// input, in input order. Implementations do not validate vector length;
// callers compare against dimension().
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) = 0;

  virtual int dimension() const = 0;
  virtual std::string model_name() const = 0;
};

}  // namespace athlete_core

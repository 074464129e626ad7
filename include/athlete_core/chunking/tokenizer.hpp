#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace athlete_core {

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual std::vector<std::string> encode(const std::string& text) const = 0;
  virtual std::string decode(const std::vector<std::string>& tokens,
                             size_t begin,
                             size_t end) const = 0;

  std::string decode(const std::vector<std::string>& tokens) const {
    return decode(tokens, 0, tokens.size());
  }
  size_t count_tokens(const std::string& text) const {
    return encode(text).size();
  }
};

/**
 * @brief Deterministic, vocabulary-free pre-tokenizer over UTF-8 text.
 *
 * A token is either a run of whitespace or an optional single leading space
 * followed by a run of one character class (letters, digits, punctuation).
 * Runs are capped so no token grows without bound on text without spaces.
 * Decoding is plain concatenation, so decode(encode(t)) == t for valid UTF-8.
 * Invalid byte sequences are replaced with U+FFFD before splitting.
 */
class CharClassTokenizer : public Tokenizer {
 public:
  std::vector<std::string> encode(const std::string& text) const override;
  std::string decode(const std::vector<std::string>& tokens,
                     size_t begin,
                     size_t end) const override;
  using Tokenizer::decode;

 private:
  enum class CharClass { Space, Letter, Digit, Punct };

  static CharClass classify(uint32_t code_point);
  static size_t max_run(CharClass char_class);
  static std::string sanitize(const std::string& text);

  static constexpr size_t MAX_LETTER_RUN = 16;
  static constexpr size_t MAX_DIGIT_RUN = 3;
  static constexpr size_t MAX_PUNCT_RUN = 4;
};

}  // namespace athlete_core

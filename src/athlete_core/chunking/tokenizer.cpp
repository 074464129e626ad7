#include "athlete_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

namespace athlete_core {

CharClassTokenizer::CharClass CharClassTokenizer::classify(uint32_t code_point) {
  switch (code_point) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\v':
    case '\f':
      return CharClass::Space;
    default:
      break;
  }
  if (code_point >= 0x80) {
    // Umlauts, accents, CJK, emoji: all part of words for our purposes
    return CharClass::Letter;
  }
  if ((code_point >= 'a' && code_point <= 'z') || (code_point >= 'A' && code_point <= 'Z')) {
    return CharClass::Letter;
  }
  if (code_point >= '0' && code_point <= '9') {
    return CharClass::Digit;
  }
  return CharClass::Punct;
}

size_t CharClassTokenizer::max_run(CharClass char_class) {
  switch (char_class) {
    case CharClass::Letter:
      return MAX_LETTER_RUN;
    case CharClass::Digit:
      return MAX_DIGIT_RUN;
    case CharClass::Punct:
      return MAX_PUNCT_RUN;
    default:
      return 1;
  }
}

std::string CharClassTokenizer::sanitize(const std::string& text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string clean;
  clean.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
  return clean;
}

std::vector<std::string> CharClassTokenizer::encode(const std::string& text) const {
  const std::string clean = sanitize(text);
  std::vector<std::string> tokens;

  auto it = clean.begin();
  const auto end = clean.end();
  while (it != end) {
    auto token_start = it;
    auto lookahead = it;
    uint32_t code_point = utf8::next(lookahead, end);

    if (classify(code_point) == CharClass::Space) {
      auto run_end = it;
      while (run_end != end) {
        auto next = run_end;
        if (classify(utf8::next(next, end)) != CharClass::Space)
          break;
        run_end = next;
      }
      // A trailing ' ' belongs to the word that follows it
      auto split = run_end;
      if (run_end != end && *(run_end - 1) == ' ')
        --split;
      if (split != it) {
        tokens.emplace_back(it, split);
        it = split;
        continue;
      }
      ++it;
      lookahead = it;
      code_point = utf8::next(lookahead, end);
    }

    const CharClass char_class = classify(code_point);
    const size_t limit = max_run(char_class);
    size_t count = 0;
    while (it != end && count < limit) {
      auto next = it;
      if (classify(utf8::next(next, end)) != char_class)
        break;
      it = next;
      ++count;
    }
    tokens.emplace_back(token_start, it);
  }
  return tokens;
}

std::string CharClassTokenizer::decode(const std::vector<std::string>& tokens,
                                       size_t begin,
                                       size_t end) const {
  end = std::min(end, tokens.size());
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    out += tokens[i];
  }
  return out;
}

}  // namespace athlete_core

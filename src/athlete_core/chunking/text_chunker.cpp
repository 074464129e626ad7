#include "athlete_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace athlete_core {

namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
  });
}

}  // namespace

TextChunker::TextChunker(int chunk_size,
                         int chunk_overlap,
                         std::shared_ptr<const Tokenizer> tokenizer)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap), tokenizer_(std::move(tokenizer)) {
  if (chunk_size_ <= 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (chunk_overlap_ < 0 || chunk_overlap_ >= chunk_size_) {
    throw std::invalid_argument("chunk_overlap must be in [0, chunk_size)");
  }
  if (!tokenizer_) {
    tokenizer_ = std::make_shared<CharClassTokenizer>();
  }
}

TextChunker::TextChunker(const Config& config)
    : TextChunker(config.chunk_size, config.chunk_overlap) {}

std::string TextChunker::build_metadata_prefix(const ChunkMetadata& metadata) {
  std::vector<std::string> parts;
  if (!metadata.athlete_name.empty())
    parts.push_back("Athlete: " + metadata.athlete_name);
  if (metadata.topic && !metadata.topic->empty())
    parts.push_back("Topic: " + *metadata.topic);
  if (metadata.title && !metadata.title->empty())
    parts.push_back("Title: " + *metadata.title);

  if (parts.empty())
    return "";

  std::string prefix = parts[0];
  for (size_t i = 1; i < parts.size(); ++i) {
    prefix += " | " + parts[i];
  }
  return prefix + "\n\n";
}

std::vector<Chunk> TextChunker::split_text(const std::string& text,
                                           const ChunkMetadata& metadata,
                                           bool prepend_metadata) const {
  if (is_blank(text)) {
    std::cerr << "Warning: Empty text for document '" << metadata.source_doc_id
              << "', no chunks created." << std::endl;
    return {};
  }

  const std::string full_text =
      prepend_metadata ? build_metadata_prefix(metadata) + text : text;

  const std::vector<std::string> tokens = tokenizer_->encode(full_text);
  const size_t total_tokens = tokens.size();

  if (total_tokens <= static_cast<size_t>(chunk_size_)) {
    return {Chunk{.text = full_text,
                  .metadata = metadata,
                  .chunk_index = 0,
                  .token_count = static_cast<int>(total_tokens)}};
  }

  const size_t window = static_cast<size_t>(chunk_size_);
  const size_t step = static_cast<size_t>(chunk_size_ - chunk_overlap_);

  std::vector<Chunk> chunks;
  chunks.reserve(total_tokens / step + 1);
  int chunk_index = 0;
  for (size_t start = 0; start < total_tokens; start += step) {
    const size_t end = std::min(start + window, total_tokens);
    chunks.push_back(Chunk{.text = tokenizer_->decode(tokens, start, end),
                           .metadata = metadata,
                           .chunk_index = chunk_index++,
                           .token_count = static_cast<int>(end - start)});
  }
  return chunks;
}

ChunkMetadata TextChunker::metadata_for(const Passage& passage) {
  ChunkMetadata metadata;
  metadata.source_doc_id = passage.id;
  metadata.athlete_name = passage.athlete_name;
  if (!passage.topic.empty())
    metadata.topic = passage.topic;
  if (!passage.url.empty())
    metadata.url = passage.url;
  if (!passage.title.empty())
    metadata.title = passage.title;
  if (!passage.original_doc_id.empty())
    metadata.extra["original_doc_id"] = passage.original_doc_id;
  metadata.extra["web_index"] = std::to_string(passage.web_index);
  if (passage.status_code)
    metadata.extra["status_code"] = std::to_string(*passage.status_code);
  return metadata;
}

std::vector<Chunk> TextChunker::split_passages(const std::vector<Passage>& passages,
                                               bool prepend_metadata) const {
  std::vector<Chunk> all_chunks;
  for (const auto& passage : passages) {
    std::vector<Chunk> chunks =
        split_text(passage.text, metadata_for(passage), prepend_metadata);
    all_chunks.insert(all_chunks.end(), std::make_move_iterator(chunks.begin()),
                      std::make_move_iterator(chunks.end()));
  }
  std::cout << "[Chunker] " << passages.size() << " passages split into " << all_chunks.size()
            << " chunks." << std::endl;
  return all_chunks;
}

}  // namespace athlete_core

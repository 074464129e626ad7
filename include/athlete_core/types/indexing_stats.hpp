#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace athlete_core {

enum class IndexingStatus { SUCCESS, NO_NEW_DOCUMENTS, NO_CHUNKS_CREATED, ERROR };

enum class PipelineStage { FETCH, CHUNK, EMBED, INDEX };

std::string to_string(IndexingStatus status);
IndexingStatus indexing_status_from_string(const std::string &str);

std::string to_string(PipelineStage stage);

// Result of one pipeline run for one athlete.
struct IndexingStats {
  std::string athlete_name;
  size_t documents_loaded = 0;
  size_t chunks_created = 0;
  size_t chunks_indexed = 0;
  double duration_seconds = 0.0;
  IndexingStatus status = IndexingStatus::SUCCESS;
  std::optional<std::string> error;
  std::optional<PipelineStage> failed_stage;

  nlohmann::json to_json() const;
};

}  // namespace athlete_core

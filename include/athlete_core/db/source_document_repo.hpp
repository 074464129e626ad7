#pragma once
#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "athlete_core/db/database_manager.hpp"
#include "athlete_core/types/source_document.hpp"

namespace athlete_core {

class SourceDocumentRepoError : public std::exception {
 public:
  explicit SourceDocumentRepoError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ImportResult {
  int imported = 0;
  int skipped = 0;
};

// Crawler documents, stored as they were scraped. The indexing pipeline
// reads them back per athlete.
class SourceDocumentRepo {
 public:
  explicit SourceDocumentRepo(DatabaseManager &db_manager);

  SourceDocumentRepo(const SourceDocumentRepo &) = delete;
  SourceDocumentRepo &operator=(const SourceDocumentRepo &) = delete;

  // Inserts or replaces by document id
  void upsert(const SourceDocument &document);
  void upsert_batch(const std::vector<SourceDocument> &documents);

  std::optional<SourceDocument> find_by_id(const std::string &id);
  // Ordered by document id so passage order is stable between runs
  std::vector<SourceDocument> find_by_athlete(const std::string &athlete_name);
  std::vector<std::string> list_athletes();
  int64_t count(const std::optional<std::string> &athlete_name = std::nullopt);

  /**
   * @brief Loads a crawler export into the table.
   *
   * Accepts either a JSON array of documents or JSON Lines (one document per
   * line, as written by mongoexport). Documents without an id or athlete are
   * skipped with a warning. All valid documents are written in one
   * transaction.
   */
  ImportResult import_from_json_file(const std::filesystem::path &path);

 private:
  DatabaseManager &db_manager_;

  void upsert_row(sqlite::database &db, const SourceDocument &document);
};

}  // namespace athlete_core

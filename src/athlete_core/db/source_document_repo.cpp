#include "athlete_core/db/source_document_repo.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "athlete_core/db/pooled_connection.hpp"
#include "athlete_core/db/sqlite_error_utils.hpp"
#include "athlete_core/db/transaction.hpp"
#include "athlete_core/types.hpp"

namespace athlete_core {

namespace {

std::string web_to_json(const std::vector<WebItem> &web) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &item : web) {
    j.push_back(web_item_to_json(item));
  }
  return j.dump();
}

std::vector<WebItem> web_from_json(const std::string &id, const std::string &text) {
  std::vector<WebItem> web;
  nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_array()) {
    std::cerr << "Warning: Source document " << id << " has a malformed web array" << std::endl;
    return web;
  }
  for (const auto &item : j) {
    if (item.is_object())
      web.push_back(web_item_from_json(item));
  }
  return web;
}

SourceDocument row_to_document(std::string id,
                               std::string athlete_name,
                               std::optional<std::string> topic,
                               const std::string &web,
                               const std::string &scraped_at) {
  SourceDocument doc;
  doc.web = web_from_json(id, web);
  doc.id = std::move(id);
  doc.athlete_name = std::move(athlete_name);
  doc.topic = topic.value_or("");
  doc.scraped_at = string_to_time_point(scraped_at);
  return doc;
}

}  // namespace

SourceDocumentRepo::SourceDocumentRepo(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void SourceDocumentRepo::upsert_row(sqlite::database &db, const SourceDocument &document) {
  db << "INSERT INTO source_documents (id, athlete_name, topic, web, scraped_at) "
        "VALUES (?,?,?,?,?) ON CONFLICT(id) DO UPDATE SET athlete_name=excluded.athlete_name, "
        "topic=excluded.topic, web=excluded.web, scraped_at=excluded.scraped_at"
     << document.id << document.athlete_name << document.topic << web_to_json(document.web)
     << time_point_to_string(document.scraped_at);
}

void SourceDocumentRepo::upsert(const SourceDocument &document) {
  try {
    PooledConnection conn(db_manager_);
    upsert_row(*conn, document);
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("upsert source document " + document.id, e));
  }
}

void SourceDocumentRepo::upsert_batch(const std::vector<SourceDocument> &documents) {
  if (documents.empty())
    return;

  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    for (const auto &document : documents) {
      upsert_row(*conn, document);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("upsert_batch", e));
  }
}

std::optional<SourceDocument> SourceDocumentRepo::find_by_id(const std::string &id) {
  try {
    std::optional<SourceDocument> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, athlete_name, topic, web, scraped_at FROM source_documents WHERE id = ?"
          << id >>
        [&](std::string id, std::string athlete_name, std::optional<std::string> topic,
            std::string web, std::string scraped_at) {
          result = row_to_document(std::move(id), std::move(athlete_name), std::move(topic), web,
                                   scraped_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("find_by_id", e));
  }
}

std::vector<SourceDocument> SourceDocumentRepo::find_by_athlete(const std::string &athlete_name) {
  std::vector<SourceDocument> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, athlete_name, topic, web, scraped_at FROM source_documents "
             "WHERE athlete_name = ? ORDER BY id"
          << athlete_name >>
        [&](std::string id, std::string athlete_name, std::optional<std::string> topic,
            std::string web, std::string scraped_at) {
          documents.push_back(row_to_document(std::move(id), std::move(athlete_name),
                                              std::move(topic), web, scraped_at));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("find_by_athlete", e));
  }
  return documents;
}

std::vector<std::string> SourceDocumentRepo::list_athletes() {
  std::vector<std::string> athletes;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT athlete_name FROM source_documents ORDER BY athlete_name" >>
        [&](std::string athlete_name) { athletes.push_back(std::move(athlete_name)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("list_athletes", e));
  }
  return athletes;
}

int64_t SourceDocumentRepo::count(const std::optional<std::string> &athlete_name) {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    if (athlete_name) {
      *conn << "SELECT COUNT(*) FROM source_documents WHERE athlete_name = ?" << *athlete_name >>
          count;
    } else {
      *conn << "SELECT COUNT(*) FROM source_documents" >> count;
    }
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw SourceDocumentRepoError(format_db_error("count", e));
  }
}

ImportResult SourceDocumentRepo::import_from_json_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    throw SourceDocumentRepoError("Could not open import file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string content = buffer.str();

  std::vector<nlohmann::json> raw_documents;
  const size_t first = content.find_first_not_of(" \t\r\n");
  if (first != std::string::npos && content[first] == '[') {
    nlohmann::json array = nlohmann::json::parse(content, nullptr, /*allow_exceptions*/ false);
    if (array.is_discarded()) {
      throw SourceDocumentRepoError("Import file is not valid JSON: " + path.string());
    }
    for (auto &doc : array) {
      raw_documents.push_back(std::move(doc));
    }
  } else {
    std::istringstream lines(content);
    std::string line;
    int line_number = 0;
    while (std::getline(lines, line)) {
      ++line_number;
      if (line.find_first_not_of(" \t\r") == std::string::npos)
        continue;
      nlohmann::json doc = nlohmann::json::parse(line, nullptr, /*allow_exceptions*/ false);
      if (doc.is_discarded()) {
        std::cerr << "Warning: Skipping invalid JSON on line " << line_number << " of "
                  << path.string() << std::endl;
        raw_documents.push_back(nullptr);
        continue;
      }
      raw_documents.push_back(std::move(doc));
    }
  }

  ImportResult result;
  std::vector<SourceDocument> documents;
  for (const auto &raw : raw_documents) {
    if (raw.is_null()) {
      ++result.skipped;
      continue;
    }
    try {
      documents.push_back(source_document_from_json(raw));
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning: Skipping source document: " << e.what() << std::endl;
      ++result.skipped;
    }
  }

  upsert_batch(documents);
  result.imported = static_cast<int>(documents.size());
  std::cout << "[SourceDocuments] Imported " << result.imported << " documents from "
            << path.string() << " (" << result.skipped << " skipped)" << std::endl;
  return result;
}

}  // namespace athlete_core

#include "athlete_core/db/sqlite_metadata_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>

#include "athlete_core/db/pooled_connection.hpp"
#include "athlete_core/db/sqlite_error_utils.hpp"
#include "athlete_core/db/transaction.hpp"
#include "athlete_core/services/compression_service.hpp"
#include "athlete_core/types.hpp"

namespace athlete_core {

namespace {

const char *const SELECT_COLUMNS =
    "SELECT doc_key, athlete_name, source_doc_id, chunk_index, token_count, content, topic, url, "
    "title, extra, faiss_id, embedding_model, embedding_dimension, vector_blob, indexed_at "
    "FROM chunk_metadata";

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  }
  return vector;
}

std::string extra_to_json(const std::map<std::string, std::string> &extra) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[k, v] : extra) {
    j[k] = v;
  }
  return j.dump();
}

std::map<std::string, std::string> extra_from_json(const std::string &key, const std::string &text) {
  std::map<std::string, std::string> extra;
  nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) {
    std::cerr << "Warning: Ignoring malformed extra metadata of document '" << key << "'"
              << std::endl;
    return extra;
  }
  for (const auto &[k, v] : j.items()) {
    extra[k] = v.is_string() ? v.get<std::string>() : v.dump();
  }
  return extra;
}

std::string placeholders(size_t count) {
  std::string result;
  for (size_t i = 0; i < count; ++i) {
    result += (i == 0) ? "?" : ",?";
  }
  return result;
}

// Row callback shared by every query that selects SELECT_COLUMNS
struct DocumentRowReader {
  std::vector<MetadataDocument> &out;

  void operator()(std::string doc_key,
                  std::string athlete_name,
                  std::string source_doc_id,
                  int chunk_index,
                  int token_count,
                  std::vector<char> content,
                  std::optional<std::string> topic,
                  std::optional<std::string> url,
                  std::optional<std::string> title,
                  std::string extra,
                  int64_t faiss_id,
                  std::string embedding_model,
                  int embedding_dimension,
                  std::optional<std::vector<char>> vector_blob,
                  std::string indexed_at) const {
    MetadataDocument document;
    document.key = std::move(doc_key);
    try {
      document.chunk.text = CompressionService::decompress(content);
    } catch (const CompressionError &e) {
      throw MetadataStoreError("Corrupt content in document '" + document.key + "': " + e.what());
    }
    document.chunk.chunk_index = chunk_index;
    document.chunk.token_count = token_count;
    document.chunk.metadata.athlete_name = std::move(athlete_name);
    document.chunk.metadata.source_doc_id = std::move(source_doc_id);
    document.chunk.metadata.topic = std::move(topic);
    document.chunk.metadata.url = std::move(url);
    document.chunk.metadata.title = std::move(title);
    document.chunk.metadata.extra = extra_from_json(document.key, extra);
    document.faiss_id = faiss_id;
    document.embedding_model = std::move(embedding_model);
    document.embedding_dimension = embedding_dimension;
    if (vector_blob) {
      document.embedding = blob_to_vector(*vector_blob);
    }
    document.indexed_at = string_to_time_point(indexed_at);
    out.push_back(std::move(document));
  }
};

}  // namespace

std::string make_document_key(const std::string &athlete_name,
                              const std::string &source_doc_id,
                              int chunk_index) {
  return athlete_name + "::" + source_doc_id + "::" + std::to_string(chunk_index);
}

SqliteMetadataStore::SqliteMetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void SqliteMetadataStore::insert_row(sqlite::database &db, const MetadataDocument &document) {
  const ChunkMetadata &metadata = document.chunk.metadata;
  std::optional<std::vector<char>> vector_blob;
  if (!document.embedding.empty()) {
    vector_blob = vector_to_blob(document.embedding);
  }

  db << "INSERT INTO chunk_metadata (doc_key, athlete_name, source_doc_id, chunk_index, "
        "token_count, content, topic, url, title, extra, faiss_id, embedding_model, "
        "embedding_dimension, vector_blob, indexed_at) VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
     << document.key << metadata.athlete_name << metadata.source_doc_id
     << document.chunk.chunk_index << document.chunk.token_count
     << CompressionService::compress(document.chunk.text) << metadata.topic << metadata.url
     << metadata.title << extra_to_json(metadata.extra) << document.faiss_id
     << document.embedding_model << document.embedding_dimension << vector_blob
     << time_point_to_string(document.indexed_at);
}

void SqliteMetadataStore::insert(const MetadataDocument &document) {
  try {
    PooledConnection conn(db_manager_);
    insert_row(*conn, document);
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("insert '" + document.key + "'", e));
  }
}

void SqliteMetadataStore::insert_batch(const std::vector<MetadataDocument> &documents) {
  if (documents.empty())
    return;

  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    for (const auto &document : documents) {
      insert_row(*conn, document);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("insert_batch", e));
  }
}

std::optional<MetadataDocument> SqliteMetadataStore::find_by_key(const std::string &key) {
  try {
    std::vector<MetadataDocument> rows;
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_COLUMNS) + " WHERE doc_key = ?" << key >> DocumentRowReader{rows};
    if (rows.empty()) {
      return std::nullopt;
    }
    return std::move(rows.front());
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("find_by_key", e));
  }
}

std::unordered_map<std::string, MetadataDocument> SqliteMetadataStore::find_by_keys(
    const std::vector<std::string> &keys) {
  std::unordered_map<std::string, MetadataDocument> result;
  if (keys.empty())
    return result;

  try {
    PooledConnection conn(db_manager_);
    for (size_t offset = 0; offset < keys.size(); offset += MAX_BOUND_KEYS) {
      const size_t count = std::min(MAX_BOUND_KEYS, keys.size() - offset);
      std::vector<MetadataDocument> rows;

      auto query = *conn << std::string(SELECT_COLUMNS) + " WHERE doc_key IN (" +
                                placeholders(count) + ")";
      for (size_t i = offset; i < offset + count; ++i) {
        query << keys[i];
      }
      query >> DocumentRowReader{rows};

      for (auto &row : rows) {
        std::string key = row.key;
        result.emplace(std::move(key), std::move(row));
      }
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("find_by_keys", e));
  }
  return result;
}

std::optional<MetadataDocument> SqliteMetadataStore::find_duplicate(const std::string &source_doc_id,
                                                                    int chunk_index) {
  try {
    std::vector<MetadataDocument> rows;
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_COLUMNS) +
                 " WHERE source_doc_id = ? AND chunk_index = ? ORDER BY faiss_id LIMIT 1"
          << source_doc_id << chunk_index >>
        DocumentRowReader{rows};
    if (rows.empty()) {
      return std::nullopt;
    }
    return std::move(rows.front());
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("find_duplicate", e));
  }
}

std::set<std::string> SqliteMetadataStore::aggregate_indexed_source_ids(
    const std::string &athlete_name) {
  std::set<std::string> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT source_doc_id FROM chunk_metadata WHERE athlete_name = ?"
          << athlete_name >>
        [&](std::string source_doc_id) { ids.insert(std::move(source_doc_id)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("aggregate_indexed_source_ids", e));
  }
  return ids;
}

std::set<ChunkKey> SqliteMetadataStore::indexed_chunk_keys(const std::string &athlete_name) {
  std::set<ChunkKey> keys;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT source_doc_id, chunk_index FROM chunk_metadata WHERE athlete_name = ?"
          << athlete_name >>
        [&](std::string source_doc_id, int chunk_index) {
          keys.insert(ChunkKey{.source_doc_id = std::move(source_doc_id),
                               .chunk_index = chunk_index});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("indexed_chunk_keys", e));
  }
  return keys;
}

int64_t SqliteMetadataStore::remove(const std::vector<std::string> &keys) {
  if (keys.empty())
    return 0;

  try {
    int64_t removed = 0;
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    for (const auto &key : keys) {
      *conn << "DELETE FROM chunk_metadata WHERE doc_key = ?" << key;
      removed += sqlite3_changes(conn->connection().get());
    }
    tx.commit();
    return removed;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("remove", e));
  }
}

int64_t SqliteMetadataStore::delete_athlete_chunks(const std::string &athlete_name) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunk_metadata WHERE athlete_name = ?" << athlete_name;
    return sqlite3_changes(conn->connection().get());
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_athlete_chunks", e));
  }
}

int64_t SqliteMetadataStore::delete_all() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunk_metadata";
    return sqlite3_changes(conn->connection().get());
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("delete_all", e));
  }
}

std::vector<MetadataDocument> SqliteMetadataStore::list_documents_with_embeddings() {
  std::vector<MetadataDocument> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_COLUMNS) + " ORDER BY faiss_id, doc_key" >>
        DocumentRowReader{documents};
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("list_documents_with_embeddings", e));
  }
  return documents;
}

void SqliteMetadataStore::update_vector_ids(
    const std::vector<std::pair<std::string, int64_t>> &key_to_id) {
  if (key_to_id.empty())
    return;

  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    for (const auto &[key, faiss_id] : key_to_id) {
      *conn << "UPDATE chunk_metadata SET faiss_id = ? WHERE doc_key = ?" << faiss_id << key;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("update_vector_ids", e));
  }
}

int64_t SqliteMetadataStore::count_chunks(const std::optional<std::string> &athlete_name) {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    if (athlete_name) {
      *conn << "SELECT COUNT(*) FROM chunk_metadata WHERE athlete_name = ?" << *athlete_name >>
          count;
    } else {
      *conn << "SELECT COUNT(*) FROM chunk_metadata" >> count;
    }
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("count_chunks", e));
  }
}

int64_t SqliteMetadataStore::count_indexed_chunks() {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunk_metadata WHERE faiss_id >= 0" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("count_indexed_chunks", e));
  }
}

std::vector<AthleteChunkCount> SqliteMetadataStore::chunk_counts_by_athlete() {
  std::vector<AthleteChunkCount> counts;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT athlete_name, COUNT(*) FROM chunk_metadata GROUP BY athlete_name "
             "ORDER BY COUNT(*) DESC, athlete_name" >>
        [&](std::string athlete_name, int64_t chunk_count) {
          counts.push_back({.athlete_name = std::move(athlete_name), .chunk_count = chunk_count});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError(format_db_error("chunk_counts_by_athlete", e));
  }
  return counts;
}

}  // namespace athlete_core

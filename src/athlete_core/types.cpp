#include "athlete_core/types.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace athlete_core {

std::string to_string(IndexingStatus status) {
  switch (status) {
    case IndexingStatus::SUCCESS:
      return "success";
    case IndexingStatus::NO_NEW_DOCUMENTS:
      return "no_new_documents";
    case IndexingStatus::NO_CHUNKS_CREATED:
      return "no_chunks_created";
    case IndexingStatus::ERROR:
      return "error";
    default:
      return "unknown";
  }
}

IndexingStatus indexing_status_from_string(const std::string &str) {
  if (str == "success")
    return IndexingStatus::SUCCESS;
  if (str == "no_new_documents")
    return IndexingStatus::NO_NEW_DOCUMENTS;
  if (str == "no_chunks_created")
    return IndexingStatus::NO_CHUNKS_CREATED;
  if (str == "error")
    return IndexingStatus::ERROR;
  throw std::invalid_argument("Unknown IndexingStatus: " + str);
}

std::string to_string(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::FETCH:
      return "fetch";
    case PipelineStage::CHUNK:
      return "chunk";
    case PipelineStage::EMBED:
      return "embed";
    case PipelineStage::INDEX:
      return "index";
    default:
      return "unknown";
  }
}

nlohmann::json IndexingStats::to_json() const {
  nlohmann::json j = {{"athlete_name", athlete_name},
                      {"documents_loaded", documents_loaded},
                      {"chunks_created", chunks_created},
                      {"chunks_indexed", chunks_indexed},
                      {"duration_seconds", duration_seconds},
                      {"status", to_string(status)}};
  if (error)
    j["error"] = *error;
  if (failed_stage)
    j["failed_stage"] = to_string(*failed_stage);
  return j;
}

const std::string &WebItem::best_text() const {
  if (!markdown.empty())
    return markdown;
  if (!html.empty())
    return html;
  return raw_html;
}

namespace {

std::string string_or_empty(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return "";
  return it->get<std::string>();
}

// Mongo exports write ObjectIds as {"$oid": "..."}
std::string document_id_from_json(const nlohmann::json &json_doc) {
  for (const char *key : {"_id", "id"}) {
    auto it = json_doc.find(key);
    if (it == json_doc.end())
      continue;
    if (it->is_string())
      return it->get<std::string>();
    if (it->is_object() && it->contains("$oid") && (*it)["$oid"].is_string())
      return (*it)["$oid"].get<std::string>();
    if (it->is_number_integer())
      return std::to_string(it->get<long long>());
  }
  return "";
}

}  // namespace

WebItem web_item_from_json(const nlohmann::json &json_item) {
  WebItem item;
  item.markdown = string_or_empty(json_item, "markdown");
  item.html = string_or_empty(json_item, "html");
  item.raw_html = string_or_empty(json_item, "rawHtml");

  auto meta = json_item.find("metadata");
  if (meta != json_item.end() && meta->is_object()) {
    item.source_url = string_or_empty(*meta, "sourceURL");
    item.title = string_or_empty(*meta, "title");
    auto status = meta->find("statusCode");
    if (status != meta->end() && status->is_number_integer()) {
      item.status_code = status->get<int>();
    }
  }
  return item;
}

nlohmann::json web_item_to_json(const WebItem &item) {
  nlohmann::json meta = {{"sourceURL", item.source_url}, {"title", item.title}};
  if (item.status_code)
    meta["statusCode"] = *item.status_code;
  return {{"markdown", item.markdown},
          {"html", item.html},
          {"rawHtml", item.raw_html},
          {"metadata", std::move(meta)}};
}

SourceDocument source_document_from_json(const nlohmann::json &json_doc) {
  if (!json_doc.is_object()) {
    throw std::invalid_argument("Source document must be a JSON object");
  }

  SourceDocument doc;
  doc.id = document_id_from_json(json_doc);
  if (doc.id.empty()) {
    throw std::invalid_argument("Source document has no '_id'");
  }
  doc.athlete_name = string_or_empty(json_doc, "athlete_name");
  if (doc.athlete_name.empty()) {
    throw std::invalid_argument("Source document " + doc.id + " has no 'athlete_name'");
  }
  doc.topic = string_or_empty(json_doc, "topic");

  auto web = json_doc.find("web");
  if (web != json_doc.end() && web->is_array()) {
    for (const auto &json_item : *web) {
      if (json_item.is_object())
        doc.web.push_back(web_item_from_json(json_item));
    }
  }

  // The crawler does not always write our timestamp format; fall back to "now"
  doc.scraped_at = std::chrono::system_clock::now();
  std::string scraped_at = string_or_empty(json_doc, "scraped_at");
  if (!scraped_at.empty()) {
    try {
      doc.scraped_at = string_to_time_point(scraped_at);
    } catch (const std::runtime_error &e) {
      std::cerr << "Warning: Source document " << doc.id << ": " << e.what() << std::endl;
    }
  }
  return doc;
}

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // We stored GMT time.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

}  // namespace athlete_core

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace athlete_core {

// One scraped page inside a crawler document.
struct WebItem {
  std::string markdown;
  std::string html;
  std::string raw_html;
  std::string source_url;
  std::string title;
  std::optional<int> status_code;

  // markdown first, then html, then the raw page
  const std::string &best_text() const;
};

// Raw crawler output for one (athlete, topic) query.
struct SourceDocument {
  std::string id;
  std::string athlete_name;
  std::string topic;
  std::vector<WebItem> web;
  std::chrono::system_clock::time_point scraped_at;
};

// A single usable text extracted from one web item of a SourceDocument.
struct Passage {
  std::string id;  // "<document id>_<web index>"
  std::string text;
  std::string athlete_name;
  std::string topic;
  std::string url;
  std::string title;
  std::string original_doc_id;
  int web_index = 0;
  std::optional<int> status_code;
};

// Crawler JSON <-> SourceDocument. The crawler writes camelCase keys for the
// per-page metadata ("sourceURL", "statusCode") and "rawHtml".
WebItem web_item_from_json(const nlohmann::json &json_item);
nlohmann::json web_item_to_json(const WebItem &item);
SourceDocument source_document_from_json(const nlohmann::json &json_doc);

}  // namespace athlete_core

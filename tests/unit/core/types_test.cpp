#include <gtest/gtest.h>

#include <set>

#include "athlete_core/types.hpp"

namespace athlete_core {

TEST(TypesTest, IndexingStatusStringsRoundTrip) {
  for (auto status : {IndexingStatus::SUCCESS, IndexingStatus::NO_NEW_DOCUMENTS,
                      IndexingStatus::NO_CHUNKS_CREATED, IndexingStatus::ERROR}) {
    EXPECT_EQ(indexing_status_from_string(to_string(status)), status);
  }
  EXPECT_THROW(indexing_status_from_string("done"), std::invalid_argument);
}

TEST(TypesTest, PipelineStageNames) {
  EXPECT_EQ(to_string(PipelineStage::FETCH), "fetch");
  EXPECT_EQ(to_string(PipelineStage::CHUNK), "chunk");
  EXPECT_EQ(to_string(PipelineStage::EMBED), "embed");
  EXPECT_EQ(to_string(PipelineStage::INDEX), "index");
}

TEST(TypesTest, IndexingStatsJsonOmitsErrorOnSuccess) {
  IndexingStats stats;
  stats.athlete_name = "Serena Williams";
  stats.documents_loaded = 3;
  stats.chunks_created = 7;
  stats.chunks_indexed = 7;

  nlohmann::json j = stats.to_json();
  EXPECT_EQ(j["athlete_name"], "Serena Williams");
  EXPECT_EQ(j["documents_loaded"], 3);
  EXPECT_EQ(j["chunks_created"], 7);
  EXPECT_EQ(j["chunks_indexed"], 7);
  EXPECT_EQ(j["status"], "success");
  EXPECT_FALSE(j.contains("error"));
  EXPECT_FALSE(j.contains("failed_stage"));
}

TEST(TypesTest, IndexingStatsJsonCarriesFailure) {
  IndexingStats stats;
  stats.athlete_name = "A";
  stats.status = IndexingStatus::ERROR;
  stats.error = "boom";
  stats.failed_stage = PipelineStage::EMBED;

  nlohmann::json j = stats.to_json();
  EXPECT_EQ(j["status"], "error");
  EXPECT_EQ(j["error"], "boom");
  EXPECT_EQ(j["failed_stage"], "embed");
}

TEST(TypesTest, ChunkKeyOrdersBySourceThenIndex) {
  std::set<ChunkKey> keys;
  keys.insert({"b", 0});
  keys.insert({"a", 2});
  keys.insert({"a", 1});
  EXPECT_FALSE(keys.insert({"a", 1}).second);

  ASSERT_EQ(keys.size(), 3u);
  auto it = keys.begin();
  EXPECT_EQ(*it++, (ChunkKey{"a", 1}));
  EXPECT_EQ(*it++, (ChunkKey{"a", 2}));
  EXPECT_EQ(*it, (ChunkKey{"b", 0}));
}

TEST(TypesTest, BestTextPrefersMarkdownThenHtml) {
  WebItem item;
  item.raw_html = "<html>raw</html>";
  EXPECT_EQ(item.best_text(), "<html>raw</html>");
  item.html = "<p>html</p>";
  EXPECT_EQ(item.best_text(), "<p>html</p>");
  item.markdown = "# md";
  EXPECT_EQ(item.best_text(), "# md");
}

TEST(TypesTest, SourceDocumentFromCrawlerJson) {
  nlohmann::json j = nlohmann::json::parse(R"JSON({
    "_id": {"$oid": "64f0c0ffee"},
    "athlete_name": "Usain Bolt",
    "topic": "records",
    "scraped_at": "2024-05-01 10:20:30",
    "web": [
      {"markdown": "Bolt ran 9.58",
       "metadata": {"sourceURL": "https://example.org/bolt", "title": "Bolt", "statusCode": 200}},
      "not an object",
      {"html": "<p>x</p>"}
    ]
  })JSON");

  SourceDocument doc = source_document_from_json(j);
  EXPECT_EQ(doc.id, "64f0c0ffee");
  EXPECT_EQ(doc.athlete_name, "Usain Bolt");
  EXPECT_EQ(doc.topic, "records");
  EXPECT_EQ(time_point_to_string(doc.scraped_at), "2024-05-01 10:20:30");
  ASSERT_EQ(doc.web.size(), 2u);
  EXPECT_EQ(doc.web[0].markdown, "Bolt ran 9.58");
  EXPECT_EQ(doc.web[0].source_url, "https://example.org/bolt");
  EXPECT_EQ(doc.web[0].title, "Bolt");
  EXPECT_EQ(doc.web[0].status_code, 200);
  EXPECT_EQ(doc.web[1].best_text(), "<p>x</p>");
  EXPECT_FALSE(doc.web[1].status_code.has_value());
}

TEST(TypesTest, SourceDocumentRequiresIdAndAthlete) {
  EXPECT_THROW(source_document_from_json({{"athlete_name", "A"}}), std::invalid_argument);
  EXPECT_THROW(source_document_from_json({{"_id", "x"}}), std::invalid_argument);
  EXPECT_THROW(source_document_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(TypesTest, WebItemJsonRoundTrip) {
  WebItem item;
  item.markdown = "text";
  item.source_url = "https://example.org";
  item.title = "T";
  item.status_code = 404;

  WebItem back = web_item_from_json(web_item_to_json(item));
  EXPECT_EQ(back.markdown, "text");
  EXPECT_EQ(back.source_url, "https://example.org");
  EXPECT_EQ(back.title, "T");
  EXPECT_EQ(back.status_code, 404);
}

TEST(TypesTest, TimePointStringRoundTrip) {
  auto tp = string_to_time_point("2023-12-31 23:59:59");
  EXPECT_EQ(time_point_to_string(tp), "2023-12-31 23:59:59");
  EXPECT_THROW(string_to_time_point("yesterday"), std::runtime_error);
}

}  // namespace athlete_core

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <fstream>
#include <string>
#include <vector>

#include "athlete_core/services/indexing_pipeline.hpp"
#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"

namespace athlete_tests {

using namespace athlete_core;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class IndexingPipelineTest : public EngineTestBase {
 protected:
  // Long enough to pass min_passage_length and to need several chunks
  std::string long_text(const std::string& word) {
    return TestUtilities::create_text(word, 120);
  }

  Chunk make_chunk(const std::string& athlete, const std::string& source_doc_id, int chunk_index) {
    Chunk chunk;
    chunk.text = athlete + " " + source_doc_id + " " + std::to_string(chunk_index);
    chunk.chunk_index = chunk_index;
    chunk.token_count = 3;
    chunk.metadata.athlete_name = athlete;
    chunk.metadata.source_doc_id = source_doc_id;
    return chunk;
  }

  EmbeddedChunk make_embedded(const std::string& athlete,
                              const std::string& source_doc_id,
                              int chunk_index) {
    return EmbeddedChunk{.chunk = make_chunk(athlete, source_doc_id, chunk_index),
                         .embedding = axis_vector(config_.vector_dimension, chunk_index % 16),
                         .embedding_model = "fake-bow",
                         .embedding_dimension = config_.vector_dimension};
  }

  // Pipeline over a mock embedder that delegates to the fake one
  std::unique_ptr<IndexingPipeline> make_pipeline(std::shared_ptr<EmbeddingProvider> provider) {
    return std::make_unique<IndexingPipeline>(config_, source_repo_, metadata_store_,
                                              vector_index_, std::move(provider));
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> make_mock() {
    auto mock = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    ON_CALL(*mock, dimension()).WillByDefault(Return(config_.vector_dimension));
    ON_CALL(*mock, model_name()).WillByDefault(Return("mock-embed"));
    return mock;
  }
};

TEST_F(IndexingPipelineTest, FetchPassages_FiltersShortTextsAndNamesPassages) {
  // Arrange
  source_repo_->upsert(TestUtilities::create_source_document(
      "doc1", "Usain Bolt", {long_text("sprint"), "too short", long_text("relay")}, "records"));

  // Act
  std::vector<Passage> passages = pipeline_->fetch_passages("Usain Bolt");

  // Assert
  ASSERT_EQ(passages.size(), 2u);
  EXPECT_EQ(passages[0].id, "doc1_0");
  EXPECT_EQ(passages[0].web_index, 0);
  EXPECT_EQ(passages[1].id, "doc1_2");
  EXPECT_EQ(passages[1].web_index, 2);
  EXPECT_EQ(passages[1].original_doc_id, "doc1");
  EXPECT_EQ(passages[1].athlete_name, "Usain Bolt");
  EXPECT_EQ(passages[1].topic, "records");
  EXPECT_EQ(passages[1].url, "https://example.org/doc1/2");
  EXPECT_EQ(passages[1].status_code, 200);
}

TEST_F(IndexingPipelineTest, FetchPassages_UnknownAthleteIsEmpty) {
  EXPECT_TRUE(pipeline_->fetch_passages("Nobody").empty());
}

TEST_F(IndexingPipelineTest, FetchPassages_SkipsAlreadyIndexedPassages) {
  add_documents("Usain Bolt", "doc", {long_text("sprint"), long_text("relay")});
  metadata_store_->insert(TestUtilities::create_metadata_document(
      "Usain Bolt", "doc0_0", 0, axis_vector(config_.vector_dimension, 0)));

  std::vector<Passage> fresh = pipeline_->fetch_passages("Usain Bolt", true);
  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0].id, "doc1_0");

  EXPECT_EQ(pipeline_->fetch_passages("Usain Bolt", false).size(), 2u);
}

TEST_F(IndexingPipelineTest, ProcessAthlete_IndexesIntoBothStores) {
  add_documents("Usain Bolt", "doc", {long_text("sprint"), long_text("relay")});

  IndexingStats stats = pipeline_->process_athlete("Usain Bolt");

  EXPECT_EQ(stats.status, IndexingStatus::SUCCESS);
  EXPECT_EQ(stats.athlete_name, "Usain Bolt");
  EXPECT_EQ(stats.documents_loaded, 2u);
  EXPECT_GT(stats.chunks_created, 2u);
  EXPECT_EQ(stats.chunks_indexed, stats.chunks_created);
  EXPECT_FALSE(stats.error.has_value());
  EXPECT_EQ(metadata_store_->count_chunks("Usain Bolt"), static_cast<int64_t>(stats.chunks_indexed));
  EXPECT_EQ(vector_index_->size(), static_cast<int64_t>(stats.chunks_indexed));

  // Every vector id resolves to a stored document with the same id
  for (faiss::idx_t id = 0; id < vector_index_->size(); ++id) {
    auto key = vector_index_->metadata_key(id);
    ASSERT_TRUE(key.has_value());
    auto document = metadata_store_->find_by_key(*key);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ(document->faiss_id, id);
    EXPECT_EQ(document->embedding_model, "fake-bow");
  }

  // The index was persisted
  VectorIndex reopened(config_.faiss_index_path, config_.vector_dimension);
  EXPECT_TRUE(reopened.load());
  EXPECT_EQ(reopened.size(), vector_index_->size());
}

TEST_F(IndexingPipelineTest, ProcessAthlete_SecondRunIndexesNothing) {
  add_documents("Usain Bolt", "doc", {long_text("sprint")});
  IndexingStats first = pipeline_->process_athlete("Usain Bolt");
  ASSERT_GT(first.chunks_indexed, 0u);
  const int64_t vectors = vector_index_->size();

  IndexingStats second = pipeline_->process_athlete("Usain Bolt");

  EXPECT_EQ(second.status, IndexingStatus::NO_NEW_DOCUMENTS);
  EXPECT_EQ(second.chunks_indexed, 0u);
  EXPECT_EQ(vector_index_->size(), vectors);
  EXPECT_EQ(metadata_store_->count_chunks(), vectors);
}

TEST_F(IndexingPipelineTest, ProcessAthlete_ReindexWithoutSkipStillSuppressesDuplicates) {
  add_documents("Usain Bolt", "doc", {long_text("sprint")});
  pipeline_->process_athlete("Usain Bolt");
  const int64_t vectors = vector_index_->size();

  IndexingStats again = pipeline_->process_athlete("Usain Bolt", false);

  EXPECT_EQ(again.status, IndexingStatus::SUCCESS);
  EXPECT_GT(again.chunks_created, 0u);
  EXPECT_EQ(again.chunks_indexed, 0u);
  EXPECT_EQ(vector_index_->size(), vectors);
}

TEST_F(IndexingPipelineTest, ProcessAthlete_NewDocumentsAreIndexedIncrementally) {
  add_documents("Usain Bolt", "a", {long_text("sprint")});
  IndexingStats first = pipeline_->process_athlete("Usain Bolt");

  add_documents("Usain Bolt", "b", {long_text("relay")});
  IndexingStats second = pipeline_->process_athlete("Usain Bolt");

  EXPECT_EQ(second.status, IndexingStatus::SUCCESS);
  EXPECT_EQ(second.documents_loaded, 1u);
  EXPECT_EQ(vector_index_->size(),
            static_cast<int64_t>(first.chunks_indexed + second.chunks_indexed));
  EXPECT_EQ(vector_index_->next_id(), vector_index_->size());
}

TEST_F(IndexingPipelineTest, ProcessAthlete_NoUsablePassages) {
  source_repo_->upsert(TestUtilities::create_source_document("doc1", "Usain Bolt", {"short"}));

  IndexingStats stats = pipeline_->process_athlete("Usain Bolt");

  EXPECT_EQ(stats.status, IndexingStatus::NO_NEW_DOCUMENTS);
  EXPECT_EQ(stats.documents_loaded, 0u);
  EXPECT_EQ(vector_index_->size(), 0);
}

TEST_F(IndexingPipelineTest, EmbedChunks_SendsConfiguredBatchSizes) {
  std::vector<Chunk> chunks;
  for (int i = 0; i < 10; ++i) {
    chunks.push_back(make_chunk("A", "doc_0", i));
  }

  std::vector<EmbeddedChunk> embedded = pipeline_->embed_chunks(chunks);

  ASSERT_EQ(embedded.size(), 10u);
  EXPECT_EQ(embedder_->batch_sizes(), (std::vector<size_t>{4, 4, 2}));
  EXPECT_EQ(embedded[7].chunk.chunk_index, 7);
  EXPECT_EQ(embedded[7].embedding, embedder_->vector_for(chunks[7].text));
  EXPECT_EQ(embedded[7].embedding_model, "fake-bow");
  EXPECT_EQ(embedded[7].embedding_dimension, config_.vector_dimension);
}

TEST_F(IndexingPipelineTest, EmbedChunks_DropsWrongDimensionVectors) {
  auto mock = make_mock();
  EXPECT_CALL(*mock, embed_batch(_))
      .WillOnce(Return(std::vector<std::vector<float>>{axis_vector(config_.vector_dimension, 0),
                                                       std::vector<float>(3, 1.0f)}));
  auto pipeline = make_pipeline(mock);

  std::vector<EmbeddedChunk> embedded =
      pipeline->embed_chunks({make_chunk("A", "doc_0", 0), make_chunk("A", "doc_0", 1)});

  ASSERT_EQ(embedded.size(), 1u);
  EXPECT_EQ(embedded[0].chunk.chunk_index, 0);
  EXPECT_EQ(embedded[0].embedding_model, "mock-embed");
}

TEST_F(IndexingPipelineTest, EmbedChunks_CountMismatchThrows) {
  auto mock = make_mock();
  EXPECT_CALL(*mock, embed_batch(_))
      .WillOnce(Return(std::vector<std::vector<float>>{axis_vector(config_.vector_dimension, 0)}));
  auto pipeline = make_pipeline(mock);

  EXPECT_THROW(pipeline->embed_chunks({make_chunk("A", "doc_0", 0), make_chunk("A", "doc_0", 1)}),
               EmbeddingError);
}

TEST_F(IndexingPipelineTest, IndexChunks_SkipsStoredAndRepeatedChunks) {
  ASSERT_EQ(pipeline_->index_chunks({make_embedded("A", "doc_0", 0)}), 1u);

  size_t indexed = pipeline_->index_chunks({make_embedded("A", "doc_0", 0),
                                            make_embedded("A", "doc_0", 1),
                                            make_embedded("A", "doc_0", 1),
                                            make_embedded("B", "doc_0", 0)});

  EXPECT_EQ(indexed, 2u);
  EXPECT_EQ(metadata_store_->count_chunks(), 3);
  EXPECT_EQ(vector_index_->size(), 3);
}

TEST_F(IndexingPipelineTest, IndexChunks_RejectsUnusableEmbeddings) {
  EmbeddedChunk zero = make_embedded("A", "doc_0", 0);
  zero.embedding.assign(static_cast<size_t>(config_.vector_dimension), 0.0f);
  EmbeddedChunk wrong = make_embedded("A", "doc_0", 1);
  wrong.embedding.resize(3);

  size_t indexed = pipeline_->index_chunks({zero, wrong, make_embedded("A", "doc_0", 2)});

  EXPECT_EQ(indexed, 1u);
  EXPECT_EQ(vector_index_->size(), 1);
  EXPECT_TRUE(metadata_store_->find_by_key(make_document_key("A", "doc_0", 2)).has_value());
  EXPECT_FALSE(metadata_store_->find_by_key(make_document_key("A", "doc_0", 0)).has_value());
}

TEST_F(IndexingPipelineTest, IndexChunks_EmptyInputIsNoOp) {
  EXPECT_EQ(pipeline_->index_chunks({}), 0u);
  EXPECT_EQ(vector_index_->size(), 0);
}

TEST_F(IndexingPipelineTest, ProcessAthlete_FailedIndexWriteLeavesStoresConsistent) {
  add_documents("Usain Bolt", "doc", {long_text("sprint")});
  // A regular file where the index directory should be makes save() fail
  {
    std::ofstream blocker(config_.faiss_index_path);
    blocker << "not a directory";
  }

  try {
    pipeline_->process_athlete("Usain Bolt");
    FAIL() << "Expected IndexingError";
  } catch (const IndexingError& e) {
    EXPECT_EQ(e.stage(), PipelineStage::INDEX);
  }

  EXPECT_EQ(metadata_store_->count_chunks(), 0);
  EXPECT_EQ(vector_index_->size(), 0);
}

TEST_F(IndexingPipelineTest, ProcessAthlete_EmbeddingFailureCarriesStage) {
  add_documents("Usain Bolt", "doc", {long_text("sprint")});
  auto mock = make_mock();
  EXPECT_CALL(*mock, embed_batch(_)).WillOnce(::testing::Throw(EmbeddingError("server offline")));
  auto pipeline = make_pipeline(mock);

  try {
    pipeline->process_athlete("Usain Bolt");
    FAIL() << "Expected IndexingError";
  } catch (const IndexingError& e) {
    EXPECT_EQ(e.stage(), PipelineStage::EMBED);
    EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("[embed]"));
    EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("server offline"));
  }
  EXPECT_EQ(metadata_store_->count_chunks(), 0);
  EXPECT_EQ(vector_index_->size(), 0);
}

TEST_F(IndexingPipelineTest, ProcessAll_IsolatesFailingAthlete) {
  add_documents("Good One", "g", {long_text("sprint")});
  add_documents("Broken Athlete", "b", {long_text("hurdles")});
  add_documents("Good Two", "h", {long_text("relay")});

  FakeEmbeddingProvider fake(config_.vector_dimension);
  auto mock = make_mock();
  ON_CALL(*mock, embed_batch(_)).WillByDefault(Invoke([&fake](const std::vector<std::string>& texts) {
    for (const auto& text : texts) {
      if (text.find("Broken") != std::string::npos) {
        throw EmbeddingError("model crashed");
      }
    }
    return fake.embed_batch(texts);
  }));
  auto pipeline = make_pipeline(mock);

  std::vector<IndexingStats> results =
      pipeline->process_all({"Good One", "Broken Athlete", "Good Two", "Nobody"});

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].status, IndexingStatus::SUCCESS);
  EXPECT_EQ(results[1].status, IndexingStatus::ERROR);
  EXPECT_EQ(results[1].athlete_name, "Broken Athlete");
  EXPECT_EQ(results[1].failed_stage, PipelineStage::EMBED);
  ASSERT_TRUE(results[1].error.has_value());
  EXPECT_THAT(*results[1].error, ::testing::HasSubstr("model crashed"));
  EXPECT_EQ(results[2].status, IndexingStatus::SUCCESS);
  EXPECT_EQ(results[3].status, IndexingStatus::NO_NEW_DOCUMENTS);

  EXPECT_EQ(metadata_store_->count_chunks("Broken Athlete"), 0);
  EXPECT_EQ(metadata_store_->count_chunks(),
            static_cast<int64_t>(results[0].chunks_indexed + results[2].chunks_indexed));
  EXPECT_EQ(vector_index_->size(), metadata_store_->count_chunks());
}

}  // namespace athlete_tests

#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <iterator>

#include "athlete_core/index/vector_index.hpp"
#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"

namespace athlete_tests {

using namespace athlete_core;

class VectorIndexTest : public ::testing::Test {
 protected:
  static constexpr int DIM = 4;

  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("athlete_vector_index_test");
    index_dir_ = temp_dir_ / "faiss_indexes";
    index_ = std::make_unique<VectorIndex>(index_dir_, DIM);
  }

  void TearDown() override {
    index_.reset();
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path index_dir_;
  std::unique_ptr<VectorIndex> index_;
};

TEST_F(VectorIndexTest, Constructor_RejectsNonPositiveDimension) {
  EXPECT_THROW(VectorIndex(index_dir_, 0), VectorIndexError);
}

TEST_F(VectorIndexTest, Add_AssignsSequentialIds) {
  auto ids = index_->add({axis_vector(DIM, 0), axis_vector(DIM, 1)}, {"k0", "k1"});
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[0], 0);
  EXPECT_EQ(ids[1], 1);

  auto more = index_->add({axis_vector(DIM, 2)}, {"k2"});
  ASSERT_EQ(more.size(), 1u);
  EXPECT_EQ(more[0], 2);

  EXPECT_EQ(index_->size(), 3);
  EXPECT_EQ(index_->next_id(), 3);
  EXPECT_EQ(index_->metadata_key(1), "k1");
  EXPECT_FALSE(index_->metadata_key(7).has_value());
}

TEST_F(VectorIndexTest, Add_IsAllOrNothing) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});

  EXPECT_THROW(index_->add({axis_vector(DIM, 1), std::vector<float>(DIM + 1, 1.0f)}, {"a", "b"}),
               VectorIndexError);
  EXPECT_THROW(index_->add({axis_vector(DIM, 1), std::vector<float>(DIM, 0.0f)}, {"a", "b"}),
               VectorIndexError);
  EXPECT_THROW(index_->add({axis_vector(DIM, 1)}, {"a", "b"}), VectorIndexError);

  EXPECT_EQ(index_->size(), 1);
  EXPECT_EQ(index_->next_id(), 1);
}

TEST_F(VectorIndexTest, Search_ReturnsCosineScoresInDescendingOrder) {
  index_->add({{1.0f, 0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f, 0.0f}},
              {"x", "y", "xy"});

  // Unnormalised query pointing along x
  auto hits = index_->search({5.0f, 0.0f, 0.0f, 0.0f}, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].id, 0);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_EQ(hits[1].id, 2);
  EXPECT_NEAR(hits[1].score, 1.0f / std::sqrt(2.0f), 1e-5);
  EXPECT_EQ(hits[2].id, 1);
  EXPECT_NEAR(hits[2].score, 0.0f, 1e-5);
}

TEST_F(VectorIndexTest, Search_PadsWhenKExceedsSize) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});

  auto hits = index_->search(axis_vector(DIM, 0), 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].id, 0);
  EXPECT_EQ(hits[1].id, VectorIndex::NO_RESULT);
  EXPECT_EQ(hits[2].id, VectorIndex::NO_RESULT);
  EXPECT_TRUE(std::isinf(hits[2].score));
}

TEST_F(VectorIndexTest, Search_EmptyIndexOrZeroK) {
  EXPECT_TRUE(index_->search(axis_vector(DIM, 0), 5).empty());

  index_->add({axis_vector(DIM, 0)}, {"k0"});
  EXPECT_TRUE(index_->search(axis_vector(DIM, 0), 0).empty());
}

TEST_F(VectorIndexTest, Search_RejectsWrongDimension) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});
  EXPECT_THROW(index_->search(std::vector<float>(DIM - 1, 1.0f), 1), VectorIndexError);
}

TEST_F(VectorIndexTest, SaveAndLoad_RoundTrip) {
  index_->add({axis_vector(DIM, 0), axis_vector(DIM, 3)}, {"k0", "k3"});
  index_->save();

  EXPECT_TRUE(std::filesystem::exists(index_dir_ / VectorIndex::INDEX_FILE_NAME));
  EXPECT_TRUE(std::filesystem::exists(index_dir_ / VectorIndex::MAPPING_FILE_NAME));

  VectorIndex reopened(index_dir_, DIM);
  EXPECT_TRUE(reopened.load());
  EXPECT_EQ(reopened.size(), 2);
  EXPECT_EQ(reopened.next_id(), 2);
  EXPECT_EQ(reopened.metadata_key(1), "k3");

  auto hits = reopened.search(axis_vector(DIM, 3), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 1);

  // Ids keep counting from the persisted next_id
  auto ids = reopened.add({axis_vector(DIM, 1)}, {"k1"});
  EXPECT_EQ(ids[0], 2);
}

TEST_F(VectorIndexTest, SaveAndLoad_SearchResultsAreUnchanged) {
  // Arrange
  index_->add({{1.0f, 0.2f, 0.0f, 0.1f},
               {0.3f, 1.0f, 0.5f, 0.0f},
               {0.0f, 0.4f, 1.0f, 0.9f},
               {0.7f, 0.7f, 0.1f, 0.2f},
               {0.1f, 0.0f, 0.3f, 1.0f}},
              {"k0", "k1", "k2", "k3", "k4"});
  const std::vector<float> query{0.6f, 0.5f, 0.2f, 0.3f};
  auto before = index_->search(query, 5);
  index_->save();

  // Act
  VectorIndex reopened(index_dir_, DIM);
  ASSERT_TRUE(reopened.load());
  auto after = reopened.search(query, 5);

  // Assert
  ASSERT_EQ(after.size(), before.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(after[i].id, before[i].id);
    EXPECT_FLOAT_EQ(after[i].score, before[i].score);
    EXPECT_EQ(reopened.metadata_key(after[i].id), index_->metadata_key(before[i].id));
  }
}

TEST_F(VectorIndexTest, Load_MissingFilesStartsEmpty) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});

  EXPECT_FALSE(index_->load());
  EXPECT_EQ(index_->size(), 0);
  EXPECT_EQ(index_->next_id(), 0);
}

TEST_F(VectorIndexTest, Load_CorruptMappingStartsEmpty) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});
  index_->save();
  {
    std::ofstream out(index_dir_ / VectorIndex::MAPPING_FILE_NAME, std::ios::trunc);
    out << "{not json";
  }

  VectorIndex reopened(index_dir_, DIM);
  EXPECT_FALSE(reopened.load());
  EXPECT_EQ(reopened.size(), 0);
}

TEST_F(VectorIndexTest, Load_CorruptIndexFileStartsEmpty) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});
  index_->save();
  {
    std::ofstream out(index_dir_ / VectorIndex::INDEX_FILE_NAME, std::ios::trunc | std::ios::binary);
    out << "garbage";
  }

  VectorIndex reopened(index_dir_, DIM);
  EXPECT_FALSE(reopened.load());
  EXPECT_EQ(reopened.size(), 0);
}

TEST_F(VectorIndexTest, Load_TruncatedIndexFileStartsEmpty) {
  // Arrange: a valid header whose vector data is cut short
  index_->add({axis_vector(DIM, 0), axis_vector(DIM, 1), axis_vector(DIM, 2)}, {"k0", "k1", "k2"});
  index_->save();
  const auto index_path = index_dir_ / VectorIndex::INDEX_FILE_NAME;
  std::string bytes;
  {
    std::ifstream in(index_path, std::ios::binary);
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  ASSERT_GT(bytes.size(), 8u);
  {
    std::ofstream out(index_path, std::ios::trunc | std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size() - 8));
  }

  // Act
  VectorIndex reopened(index_dir_, DIM);
  bool loaded = true;
  EXPECT_NO_THROW(loaded = reopened.load());

  // Assert
  EXPECT_FALSE(loaded);
  EXPECT_EQ(reopened.size(), 0);
  EXPECT_EQ(reopened.next_id(), 0);
}

TEST_F(VectorIndexTest, Load_InconsistentNextIdStartsEmpty) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});
  index_->save();

  auto mapping_path = index_dir_ / VectorIndex::MAPPING_FILE_NAME;
  nlohmann::json mapping;
  {
    std::ifstream in(mapping_path);
    in >> mapping;
  }
  mapping["next_id"] = 5;
  {
    std::ofstream out(mapping_path, std::ios::trunc);
    out << mapping.dump();
  }

  VectorIndex reopened(index_dir_, DIM);
  EXPECT_FALSE(reopened.load());
  EXPECT_EQ(reopened.size(), 0);
}

TEST_F(VectorIndexTest, Load_DimensionMismatchThrows) {
  index_->add({axis_vector(DIM, 0)}, {"k0"});
  index_->save();

  VectorIndex wider(index_dir_, DIM * 2);
  EXPECT_THROW(wider.load(), VectorIndexError);
  EXPECT_EQ(wider.size(), 0);
}

TEST_F(VectorIndexTest, Reset_ClearsVectorsAndIds) {
  index_->add({axis_vector(DIM, 0), axis_vector(DIM, 1)}, {"k0", "k1"});

  index_->reset();

  EXPECT_EQ(index_->size(), 0);
  EXPECT_EQ(index_->next_id(), 0);
  EXPECT_FALSE(index_->metadata_key(0).has_value());
  auto ids = index_->add({axis_vector(DIM, 2)}, {"k2"});
  EXPECT_EQ(ids[0], 0);
}

}  // namespace athlete_tests

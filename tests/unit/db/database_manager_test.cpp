#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "athlete_core/db/connection_pool.hpp"
#include "athlete_core/db/pooled_connection.hpp"
#include "athlete_core/db/transaction.hpp"
#include "common/utilities_test.hpp"

namespace athlete_core {

class DatabaseManagerTest : public athlete_tests::StorageTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"chunk_metadata", "source_documents"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  std::vector<std::string> required_indexes = {"idx_chunk_metadata_source",
                                               "idx_chunk_metadata_faiss_id",
                                               "idx_source_documents_athlete"};
  for (const auto& index : required_indexes) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name=?" << index >> count;
    EXPECT_EQ(count, 1) << "Missing index: " << index;
  }

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, CreatesMissingParentDirectory) {
  auto nested = temp_dir_ / "a" / "b" / "metadata.db";

  DatabaseManager manager(nested, 1);

  EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(DatabaseManagerTest, SchemaSetupIsIdempotent) {
  // A second manager over the same file must not fail on existing tables
  EXPECT_NO_THROW(DatabaseManager(config_.metadata_db_path, 1));
}

TEST_F(DatabaseManagerTest, GetConnectionAfterShutdownThrows) {
  db_manager_->shutdown();

  EXPECT_THROW(db_manager_->get_connection(), std::runtime_error);
}

TEST_F(DatabaseManagerTest, WriteTransaction_RollsBackUnlessCommitted) {
  PooledConnection conn(*db_manager_);
  *conn << "CREATE TABLE scratch (value INTEGER);";

  {
    WriteTransaction tx(*conn);
    *conn << "INSERT INTO scratch VALUES (1);";
  }
  {
    WriteTransaction tx(*conn);
    *conn << "INSERT INTO scratch VALUES (2);";
    tx.commit();
  }

  int count = 0;
  int value = 0;
  *conn << "SELECT COUNT(*), MAX(value) FROM scratch;" >> std::tie(count, value);
  EXPECT_EQ(count, 1);
  EXPECT_EQ(value, 2);
}

TEST(ConnectionPoolTest, RejectsNonPositiveSize) {
  auto dir = athlete_tests::TestUtilities::create_temp_dir("athlete_pool_test");
  EXPECT_THROW(ConnectionPool((dir / "pool.db").string(), 0), std::invalid_argument);
  athlete_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(ConnectionPoolTest, BlocksUntilConnectionReturned) {
  auto dir = athlete_tests::TestUtilities::create_temp_dir("athlete_pool_test");
  {
    ConnectionPool pool((dir / "pool.db").string(), 1);
    auto held = pool.get_connection();
    ASSERT_NE(held, nullptr);

    std::thread returner([&pool, conn = std::move(held)]() mutable {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      pool.return_connection(std::move(conn));
    });

    auto next = pool.get_connection();
    EXPECT_NE(next, nullptr);
    returner.join();
    pool.return_connection(std::move(next));
  }
  athlete_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(ConnectionPoolTest, ShutdownFailsLaterCheckoutsAndDropsReturns) {
  auto dir = athlete_tests::TestUtilities::create_temp_dir("athlete_pool_test");
  {
    ConnectionPool pool((dir / "pool.db").string(), 2);
    auto held = pool.get_connection();

    pool.shutdown();

    EXPECT_THROW(pool.get_connection(), std::runtime_error);
    EXPECT_NO_THROW(pool.return_connection(std::move(held)));
    EXPECT_THROW(pool.get_connection(), std::runtime_error);
  }
  athlete_tests::TestUtilities::cleanup_temp_dir(dir);
}

TEST(ConnectionPoolTest, ConnectionsUseWriteAheadLog) {
  auto dir = athlete_tests::TestUtilities::create_temp_dir("athlete_pool_test");
  {
    ConnectionPool pool((dir / "pool.db").string(), 1);
    auto conn = pool.get_connection();
    std::string mode;
    *conn << "PRAGMA journal_mode;" >> mode;
    EXPECT_EQ(mode, "wal");
    pool.return_connection(std::move(conn));
  }
  athlete_tests::TestUtilities::cleanup_temp_dir(dir);
}

}  // namespace athlete_core

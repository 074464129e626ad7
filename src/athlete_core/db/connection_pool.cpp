#include "athlete_core/db/connection_pool.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace athlete_core {

ConnectionPool::ConnectionPool(const std::string &db_path, int pool_size)
    : db_path_(db_path), pool_size_(pool_size) {
  if (pool_size_ <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  idle_.reserve(static_cast<size_t>(pool_size_));
  for (int i = 0; i < pool_size_; ++i) {
    idle_.push_back(open_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  sqlite3 *handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Could not open a pooled connection to " + db_path_);
  }
  sqlite3_busy_timeout(handle, BUSY_TIMEOUT_MS);
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mutex_);
  connection_returned_.wait(lock, [this] { return shut_down_ || !idle_.empty(); });
  if (shut_down_) {
    throw std::runtime_error("Connection pool for " + db_path_ + " is shut down");
  }
  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  connection_returned_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    idle_.clear();
  }
  connection_returned_.notify_all();
}

}  // namespace athlete_core

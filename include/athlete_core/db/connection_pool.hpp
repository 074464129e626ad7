#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace athlete_core {

// Fixed set of connections to one SQLite file, all in WAL mode with a busy
// timeout so pipeline writes and CLI reads can overlap.
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, int pool_size);

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  // Blocks until a connection is idle. Throws std::runtime_error after shutdown().
  std::unique_ptr<sqlite::database> get_connection();

  // Connections handed back after shutdown() are closed instead of pooled
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  int size() const { return pool_size_; }

 private:
  static constexpr int BUSY_TIMEOUT_MS = 5000;

  std::unique_ptr<sqlite::database> open_connection() const;

  std::string db_path_;
  int pool_size_;
  bool shut_down_ = false;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mutex_;
  std::condition_variable connection_returned_;
};

}  // namespace athlete_core

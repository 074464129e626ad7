#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "athlete_core/db/database_manager.hpp"

namespace athlete_core {

// Checks a connection out of the DatabaseManager's pool for the lifetime of
// the object. Every store method opens one of these per call.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &db_manager)
      : db_manager_(db_manager), conn_(db_manager.get_connection()) {}

  ~PooledConnection() { db_manager_.return_connection(std::move(conn_)); }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database &operator*() const { return *conn_; }
  sqlite::database *operator->() const { return conn_.get(); }

 private:
  DatabaseManager &db_manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace athlete_core

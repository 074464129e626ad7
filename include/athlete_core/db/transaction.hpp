#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace athlete_core {

// Write transaction on one pooled connection. BEGIN IMMEDIATE takes the write
// lock at construction; everything since is rolled back on scope exit unless
// commit() ran.
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database &db) : db_(db) { db_ << "BEGIN IMMEDIATE;"; }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  ~WriteTransaction() {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "Warning: Rollback failed: " << e.errstr() << std::endl;
    }
  }

  void commit() {
    db_ << "COMMIT;";
    committed_ = true;
  }

 private:
  sqlite::database &db_;
  bool committed_ = false;
};

}  // namespace athlete_core

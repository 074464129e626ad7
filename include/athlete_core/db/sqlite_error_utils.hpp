#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace athlete_core {

// UNIQUE(athlete_name, source_doc_id, chunk_index) or a primary key clash:
// the chunk is already stored
inline bool is_duplicate_key_error(const sqlite::sqlite_exception &e) {
  const int xcode = e.get_extended_code();
  return xcode == SQLITE_CONSTRAINT_UNIQUE || xcode == SQLITE_CONSTRAINT_PRIMARYKEY;
}

// "<operation> failed: <sqlite description>: <message> [code=N, xcode=M]"
inline std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  std::string msg = operation + " failed: " + sqlite3_errstr(e.get_code()) + ": " + e.errstr();
  if (is_duplicate_key_error(e)) {
    msg += " (chunk already stored)";
  }
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

}  // namespace athlete_core

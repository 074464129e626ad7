#pragma once

#include "athlete_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace athlete_core {

// Owns the schema and the connection pool of one SQLite file. Constructed by
// the composition root and shared with the repositories that need it.
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_shut_down_ = false;
};

} // namespace athlete_core

#pragma once

#include "jobkeep_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace jobkeep_core {

// Owns the job database: creates the schema once, then hands out pooled
// connections. One instance per database file; whoever builds the store owns it.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Must be called before any connection is requested. Repeated calls are no-ops.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    std::unique_ptr<ConnectionPool> pool_;
    std::filesystem::path db_path_;
    bool is_initialized_ = false;
};

} // namespace jobkeep_core

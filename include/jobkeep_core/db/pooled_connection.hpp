#pragma once

#include <memory>
#include <stdexcept>
#include <sqlite_modern_cpp.h>

#include "jobkeep_core/db/database_manager.hpp"
#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

// Borrows one connection from the manager's pool for the guard's lifetime.
// A manager that is shut down, or a pool that is draining, is IO_FAILURE.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager) : manager_(manager) {
    try {
      conn_ = manager_.get_connection();
    } catch (const std::runtime_error& e) {
      throw StoreError(StoreErrorKind::IO_FAILURE, e.what());
    }
    if (!conn_) {
      throw StoreError(StoreErrorKind::IO_FAILURE,
                       "No database connection available: the pool is shutting down");
    }
  }

  ~PooledConnection() {
    manager_.return_connection(std::move(conn_));
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const {
    return *conn_;
  }
  sqlite::database* operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace jobkeep_core

#include "jobkeep_core/db/connection_pool.hpp"
#include <stdexcept>

namespace jobkeep_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("ConnectionPool must hold at least one connection.");
  }
  idle_.reserve(static_cast<std::size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_connection(db_path_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string& db_path) {
  auto db = std::make_unique<sqlite::database>(db_path);
  // Concurrent job writes on other connections: wait for the lock instead of SQLITE_BUSY
  *db << "PRAGMA busy_timeout = 5000;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA synchronous = NORMAL;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw std::runtime_error("Connection pool for " + db_path_ + " is shut down");
  }
  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::vector<std::unique_ptr<sqlite::database>> closing;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    closing.swap(idle_);
  }
  cv_.notify_all();
}

std::size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace jobkeep_core

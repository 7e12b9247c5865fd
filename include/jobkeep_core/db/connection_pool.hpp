#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace jobkeep_core {

// Fixed set of open connections to one database file. Checked-out
// connections are owned by the caller until handed back.
class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, int pool_size);

    // Blocks until a connection is idle. Throws std::runtime_error once the
    // pool is shut down, including for callers already waiting.
    std::unique_ptr<sqlite::database> get_connection();

    // After shutdown the connection is closed instead of kept.
    void return_connection(std::unique_ptr<sqlite::database> conn);

    // Closes idle connections and wakes every waiter.
    void shutdown();

    std::size_t idle_count() const;

private:
    static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path);

    std::string db_path_;
    std::vector<std::unique_ptr<sqlite::database>> idle_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace jobkeep_core

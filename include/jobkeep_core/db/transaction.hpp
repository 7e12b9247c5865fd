#pragma once

#include <iostream>
#include <sqlite_modern_cpp.h>

namespace jobkeep_core {

enum class TransactionMode { Deferred, Immediate };

// Rolls back on scope exit unless commit() was called. Immediate takes the
// write lock up front so a read-then-delete sequence sees a stable table.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Transaction: rollback failed: " << e.errstr() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace jobkeep_core

#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

struct SqliteCodeInfo {
  const char* name;
  StoreErrorKind store_kind;
};

// Damaged or foreign database files are CORRUPT. Everything else, including
// busy/locked and disk-full, is an I/O failure that a later attempt may not see.
inline SqliteCodeInfo sqlite_code_info(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY: return {"busy", StoreErrorKind::IO_FAILURE};
    case SQLITE_LOCKED: return {"locked", StoreErrorKind::IO_FAILURE};
    case SQLITE_READONLY: return {"readonly", StoreErrorKind::IO_FAILURE};
    case SQLITE_IOERR: return {"io", StoreErrorKind::IO_FAILURE};
    case SQLITE_CANTOPEN: return {"cantopen", StoreErrorKind::IO_FAILURE};
    case SQLITE_FULL: return {"full", StoreErrorKind::IO_FAILURE};
    case SQLITE_CONSTRAINT: return {"constraint", StoreErrorKind::IO_FAILURE};
    case SQLITE_SCHEMA:
    case SQLITE_ERROR: return {"schema", StoreErrorKind::IO_FAILURE};
    case SQLITE_CORRUPT: return {"corrupt", StoreErrorKind::CORRUPT};
    case SQLITE_NOTADB: return {"notadb", StoreErrorKind::CORRUPT};
    default: return {"generic", StoreErrorKind::IO_FAILURE};
  }
}

// "<operation> failed: (busy) database is locked [code=5, xcode=5]"
inline StoreError to_store_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const SqliteCodeInfo info = sqlite_code_info(e.get_code());
  return StoreError(info.store_kind,
                    operation + " failed: (" + info.name + ") " + e.errstr() +
                        " [code=" + std::to_string(e.get_code()) +
                        ", xcode=" + std::to_string(e.get_extended_code()) + "]");
}

}  // namespace jobkeep_core

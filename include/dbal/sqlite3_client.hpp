// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::Sqlite3Client -- SQLite3 primitives for Driver<Client>.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Handle is a heap Cursor owning one sqlite3_stmt*; Execute() steps
//     it once so failures surface before a handle is handed out
//   - Affected rows are captured per cursor; read-only statements report 0
//   - No persistent-connect capability
//   - Opens params.database, or params.server when no database is given

#pragma once

#include <cstdint>
#include <cstring>
#include <string>

#include "sqlite3.h"

#include "dbal/client.hpp"
#include "dbal/config.hpp"
#include "dbal/error.hpp"
#include "dbal/limit_rewriter.hpp"
#include "dbal/row.hpp"

namespace dbal {

// ---------------------------------------------------------------------------
// Sqlite3Client
// ---------------------------------------------------------------------------

class Sqlite3Client {
 public:
  struct Cursor {
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = SQLITE_DONE;  // result of the last sqlite3_step()
    int64_t affected = 0;      // rows changed by this statement
  };
  using Handle = Cursor*;

  static constexpr LimitStyle kLimitStyle = LimitStyle::kLimitClause;

  static const char* Name() { return "sqlite3"; }
  static const char* DisplayName() { return "SQLite3"; }
  static const char* VersionQuery() { return "SELECT sqlite_version()"; }
  static const char* VersionCacheKey() { return "sqlite3_version"; }
  static const char* IdentityQuery() { return "SELECT last_insert_rowid()"; }
  static const char* BeginSql() { return "BEGIN TRANSACTION;"; }
  static const char* CommitSql() { return "COMMIT TRANSACTION;"; }
  static const char* RollbackSql() { return "ROLLBACK;"; }

  Sqlite3Client() = default;

  ~Sqlite3Client() { Close(); }

  // Move
  Sqlite3Client(Sqlite3Client&& other) noexcept
      : db_(other.db_), last_error_(other.last_error_) {
    other.db_ = nullptr;
  }

  Sqlite3Client& operator=(Sqlite3Client&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      last_error_ = other.last_error_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Client(const Sqlite3Client&) = delete;
  Sqlite3Client& operator=(const Sqlite3Client&) = delete;

  bool HasCapability(Capability cap) const {
    return cap == Capability::kConnect;
  }

  // --- Open / Close ---

  Error Connect(const std::string& server, const ConnectParams& params) {
    Close();
    const std::string& path =
        params.database.empty() ? server : params.database;
    if (path.empty()) {
      last_error_ = Error::Make(ErrorCode::kNullParam, "path is empty");
      return last_error_;
    }

    int32_t rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
      last_error_ = Error::Make(
          ErrorCode::kError, db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      last_error_.SetNativeCode(static_cast<int64_t>(rc));
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return last_error_;
    }
    last_error_.Clear();
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- Execute ---

  ExecResult<Handle> Execute(const char* sql) {
    if (db_ == nullptr) {
      return Fail(Error::Make(ErrorCode::kNotOpen, "Database not open"));
    }
    if (sql == nullptr) {
      return Fail(Error::Make(ErrorCode::kNullParam, "sql is null"));
    }

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      return Fail(MakeError(rc));
    }
    if (stmt == nullptr) {
      return Fail(Error::Make(ErrorCode::kMisuse, "empty statement"));
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      Error err = MakeError(rc);
      sqlite3_finalize(stmt);
      return Fail(err);
    }

    Cursor* cursor = new Cursor;
    cursor->stmt = stmt;
    cursor->rc = rc;
    cursor->affected = sqlite3_stmt_readonly(stmt)
                           ? 0
                           : static_cast<int64_t>(sqlite3_changes(db_));
    return ExecResult<Handle>::Success(cursor);
  }

  // --- Fetch ---

  bool FetchRow(Handle handle, Row* out) {
    if (handle == nullptr || handle->rc != SQLITE_ROW) { return false; }

    if (out != nullptr) {
      out->Clear();
      sqlite3_stmt* stmt = handle->stmt;
      int32_t cols = sqlite3_column_count(stmt);
      for (int32_t i = 0; i < cols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        out->Append(name != nullptr ? name : "", ColumnValue(stmt, i));
      }
    }

    handle->rc = sqlite3_step(handle->stmt);
    if (handle->rc != SQLITE_ROW && handle->rc != SQLITE_DONE) {
      last_error_ = MakeError(handle->rc);
    }
    return true;
  }

  int64_t AffectedRows(Handle handle) const {
    return (handle != nullptr) ? handle->affected : -1;
  }

  void Free(Handle handle) {
    if (handle == nullptr) { return; }
    if (handle->stmt != nullptr) { sqlite3_finalize(handle->stmt); }
    delete handle;
  }

  const Error& LastError() const { return last_error_; }

 private:
  static Value ColumnValue(sqlite3_stmt* stmt, int32_t col) {
    switch (sqlite3_column_type(stmt, col)) {
      case SQLITE_INTEGER:
        return Value::Integer(sqlite3_column_int64(stmt, col));
      case SQLITE_FLOAT:
        return Value::Real(sqlite3_column_double(stmt, col));
      case SQLITE_TEXT: {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        int32_t len = sqlite3_column_bytes(stmt, col);
        if (text == nullptr) { return Value::Text(std::string()); }
        return Value::Text(std::string(reinterpret_cast<const char*>(text),
                                       static_cast<size_t>(len)));
      }
      case SQLITE_BLOB: {
        const void* blob = sqlite3_column_blob(stmt, col);
        int32_t len = sqlite3_column_bytes(stmt, col);
        return Value::Blob(static_cast<const uint8_t*>(blob),
                           static_cast<size_t>(len));
      }
      default:
        return Value::Null();
    }
  }

  Error MakeError(int32_t rc) const {
    Error err = Error::Make(ErrorCode::kError,
                            db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    err.SetNativeCode(static_cast<int64_t>(rc));
    return err;
  }

  ExecResult<Handle> Fail(const Error& err) {
    last_error_ = err;
    return ExecResult<Handle>::Failure(err);
  }

  sqlite3* db_ = nullptr;
  Error last_error_;
};

}  // namespace dbal

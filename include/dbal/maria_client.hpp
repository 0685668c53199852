// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::MariaClient -- MariaDB/MySQL primitives for Driver<Client>.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Handle is a heap Cursor around a MYSQL_RES* (mysql_store_result);
//     statements without a rowset still get a Cursor with res == nullptr
//   - Field types mapped to Value: integers, reals, binary blobs, text
//   - No persistent-connect capability in the C client
//
// Server string: "host[:port]" as built by BuildServerString(); the port
// is taken from ConnectParams, the host from ConnectParams::server.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include <mysql.h>

#include "dbal/client.hpp"
#include "dbal/config.hpp"
#include "dbal/error.hpp"
#include "dbal/limit_rewriter.hpp"
#include "dbal/row.hpp"

namespace dbal {

// ---------------------------------------------------------------------------
// MariaClient
// ---------------------------------------------------------------------------

class MariaClient {
 public:
  struct Cursor {
    MYSQL_RES* res = nullptr;
    int64_t affected = 0;
  };
  using Handle = Cursor*;

  static constexpr LimitStyle kLimitStyle = LimitStyle::kLimitClause;

  static const char* Name() { return "mariadb"; }
  static const char* DisplayName() { return "MySQL/MariaDB"; }
  static const char* VersionQuery() { return "SELECT VERSION()"; }
  static const char* VersionCacheKey() { return "mariadb_version"; }
  static const char* IdentityQuery() { return "SELECT LAST_INSERT_ID()"; }
  static const char* BeginSql() { return "START TRANSACTION"; }
  static const char* CommitSql() { return "COMMIT"; }
  static const char* RollbackSql() { return "ROLLBACK"; }

  MariaClient() = default;

  ~MariaClient() { Close(); }

  // Move
  MariaClient(MariaClient&& other) noexcept
      : conn_(other.conn_), last_error_(other.last_error_) {
    other.conn_ = nullptr;
  }

  MariaClient& operator=(MariaClient&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      last_error_ = other.last_error_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaClient(const MariaClient&) = delete;
  MariaClient& operator=(const MariaClient&) = delete;

  bool HasCapability(Capability cap) const {
    return cap == Capability::kConnect;
  }

  // --- Open / Close ---

  Error Connect(const std::string& /*server*/, const ConnectParams& params) {
    Close();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      last_error_ = Error::Make(ErrorCode::kError, "mysql_init failed");
      return last_error_;
    }

    const char* host =
        params.server.empty() ? "localhost" : params.server.c_str();
    const char* user = params.user.empty() ? nullptr : params.user.c_str();
    const char* password =
        params.password.empty() ? nullptr : params.password.c_str();
    const char* database =
        params.database.empty() ? nullptr : params.database.c_str();
    unsigned int port = (params.port != 0) ? params.port : 3306;

    if (mysql_real_connect(conn_, host, user, password, database, port,
                           nullptr, 0) == nullptr) {
      last_error_ = MakeError();
      mysql_close(conn_);
      conn_ = nullptr;
      return last_error_;
    }

    // Set UTF-8
    if (mysql_set_character_set(conn_, "utf8mb4") != 0) {
      last_error_ = MakeError();
      mysql_close(conn_);
      conn_ = nullptr;
      return last_error_;
    }

    last_error_.Clear();
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- Execute ---

  ExecResult<Handle> Execute(const char* sql) {
    if (conn_ == nullptr) {
      return Fail(Error::Make(ErrorCode::kNotOpen, "Database not open"));
    }
    if (sql == nullptr) {
      return Fail(Error::Make(ErrorCode::kNullParam, "sql is null"));
    }

    if (mysql_query(conn_, sql) != 0) {
      return Fail(MakeError());
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res == nullptr && mysql_field_count(conn_) > 0) {
      // A rowset was expected but could not be read.
      return Fail(MakeError());
    }

    Cursor* cursor = new Cursor;
    cursor->res = res;
    cursor->affected = static_cast<int64_t>(mysql_affected_rows(conn_));
    return ExecResult<Handle>::Success(cursor);
  }

  // --- Fetch ---

  bool FetchRow(Handle handle, Row* out) {
    if (handle == nullptr || handle->res == nullptr) { return false; }

    MYSQL_ROW row = mysql_fetch_row(handle->res);
    if (row == nullptr) { return false; }

    if (out != nullptr) {
      out->Clear();
      unsigned long* lengths = mysql_fetch_lengths(handle->res);
      MYSQL_FIELD* fields = mysql_fetch_fields(handle->res);
      uint32_t num_fields = mysql_num_fields(handle->res);
      for (uint32_t i = 0; i < num_fields; ++i) {
        size_t len = (lengths != nullptr) ? lengths[i] : 0;
        out->Append(fields[i].name != nullptr ? fields[i].name : "",
                    FieldValue(fields[i], row[i], len));
      }
    }
    return true;
  }

  int64_t AffectedRows(Handle handle) const {
    return (handle != nullptr) ? handle->affected : -1;
  }

  void Free(Handle handle) {
    if (handle == nullptr) { return; }
    if (handle->res != nullptr) { mysql_free_result(handle->res); }
    delete handle;
  }

  const Error& LastError() const { return last_error_; }

 private:
  static Value FieldValue(const MYSQL_FIELD& field, const char* data,
                          size_t len) {
    if (data == nullptr) { return Value::Null(); }
    switch (field.type) {
      case MYSQL_TYPE_TINY:
      case MYSQL_TYPE_SHORT:
      case MYSQL_TYPE_INT24:
      case MYSQL_TYPE_LONG:
      case MYSQL_TYPE_LONGLONG:
      case MYSQL_TYPE_YEAR:
        return Value::Integer(std::strtoll(data, nullptr, 10));
      case MYSQL_TYPE_FLOAT:
      case MYSQL_TYPE_DOUBLE:
        return Value::Real(std::strtod(data, nullptr));
      case MYSQL_TYPE_TINY_BLOB:
      case MYSQL_TYPE_MEDIUM_BLOB:
      case MYSQL_TYPE_LONG_BLOB:
      case MYSQL_TYPE_BLOB:
      case MYSQL_TYPE_STRING:
      case MYSQL_TYPE_VAR_STRING:
        // charsetnr 63 is the binary collation
        if (field.charsetnr == 63) {
          return Value::Blob(reinterpret_cast<const uint8_t*>(data), len);
        }
        return Value::Text(std::string(data, len));
      default:
        return Value::Text(std::string(data, len));
    }
  }

  Error MakeError() const {
    Error err = Error::Make(ErrorCode::kError, mysql_error(conn_));
    err.SetNativeCode(static_cast<int64_t>(mysql_errno(conn_)));
    return err;
  }

  ExecResult<Handle> Fail(const Error& err) {
    last_error_ = err;
    return ExecResult<Handle>::Failure(err);
  }

  MYSQL* conn_ = nullptr;
  Error last_error_;
};

}  // namespace dbal

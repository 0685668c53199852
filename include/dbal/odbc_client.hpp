// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::OdbcClient -- ODBC primitives for Driver<Client>, MSSQL dialect.
//
// Design:
//   - Wraps SQLHENV/SQLHDBC with RAII
//   - Move-only (no copy)
//   - Handle is the SQLHSTMT of one SQLExecDirect() call
//   - Persistent connect maps to driver-manager connection pooling
//   - Row limits use TOP n; identity via @@IDENTITY
//   - Long columns are read in chunks with SQLGetData(); SetLongReadLimit()
//     caps them through SQL_ATTR_MAX_LENGTH
//
// Server string: ODBC data source name, plus ":port"/",port" if given.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include <sql.h>
#include <sqlext.h>

#include "dbal/client.hpp"
#include "dbal/config.hpp"
#include "dbal/error.hpp"
#include "dbal/limit_rewriter.hpp"
#include "dbal/row.hpp"

namespace dbal {

// ---------------------------------------------------------------------------
// OdbcClient
// ---------------------------------------------------------------------------

class OdbcClient {
 public:
  using Handle = SQLHSTMT;

  static constexpr LimitStyle kLimitStyle = LimitStyle::kTop;

  static const char* Name() { return "odbc"; }
  static const char* DisplayName() { return "MSSQL (ODBC)"; }
  static const char* VersionQuery() {
    return "SELECT SERVERPROPERTY('productversion'), "
           "SERVERPROPERTY('productlevel'), SERVERPROPERTY('edition')";
  }
  static const char* VersionCacheKey() { return "mssqlodbc_version"; }
  static const char* IdentityQuery() { return "SELECT @@IDENTITY"; }
  static const char* BeginSql() { return "BEGIN TRANSACTION"; }
  static const char* CommitSql() { return "COMMIT TRANSACTION"; }
  static const char* RollbackSql() { return "ROLLBACK TRANSACTION"; }

  OdbcClient() = default;

  ~OdbcClient() { Close(); }

  // Move
  OdbcClient(OdbcClient&& other) noexcept
      : env_(other.env_),
        dbc_(other.dbc_),
        connected_(other.connected_),
        max_length_mb_(other.max_length_mb_),
        last_error_(other.last_error_) {
    other.env_ = SQL_NULL_HENV;
    other.dbc_ = SQL_NULL_HDBC;
    other.connected_ = false;
  }

  OdbcClient& operator=(OdbcClient&& other) noexcept {
    if (this != &other) {
      Close();
      env_ = other.env_;
      dbc_ = other.dbc_;
      connected_ = other.connected_;
      max_length_mb_ = other.max_length_mb_;
      last_error_ = other.last_error_;
      other.env_ = SQL_NULL_HENV;
      other.dbc_ = SQL_NULL_HDBC;
      other.connected_ = false;
    }
    return *this;
  }

  // No copy
  OdbcClient(const OdbcClient&) = delete;
  OdbcClient& operator=(const OdbcClient&) = delete;

  bool HasCapability(Capability cap) const {
    return cap == Capability::kConnect ||
           cap == Capability::kPersistentConnect;
  }

  /// Cap long column reads, in megabytes (see ParseLongReadLimit()).
  /// 0 keeps the driver default. Applies to statements executed later.
  void SetLongReadLimit(uint32_t mb) { max_length_mb_ = mb; }
  uint32_t LongReadLimit() const { return max_length_mb_; }

  // --- Open / Close ---

  Error Connect(const std::string& server, const ConnectParams& params) {
    Close();

    SQLRETURN rc;
    if (params.persistent) {
      rc = SQLSetEnvAttr(SQL_NULL_HENV, SQL_ATTR_CONNECTION_POOLING,
                         reinterpret_cast<SQLPOINTER>(SQL_CP_ONE_PER_DRIVER),
                         SQL_IS_UINTEGER);
      if (!SQL_SUCCEEDED(rc)) {
        last_error_ = Error::Make(ErrorCode::kError,
                                  "enabling connection pooling failed");
        return last_error_;
      }
    }

    rc = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
    if (!SQL_SUCCEEDED(rc)) {
      env_ = SQL_NULL_HENV;
      last_error_ = Error::Make(ErrorCode::kError, "SQLAllocHandle(ENV) failed");
      return last_error_;
    }

    rc = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                       reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3),
                       SQL_IS_UINTEGER);
    if (!SQL_SUCCEEDED(rc)) {
      last_error_ = Diagnose(SQL_HANDLE_ENV, env_);
      Close();
      return last_error_;
    }

    rc = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
    if (!SQL_SUCCEEDED(rc)) {
      dbc_ = SQL_NULL_HDBC;
      last_error_ = Diagnose(SQL_HANDLE_ENV, env_);
      Close();
      return last_error_;
    }

    rc = SQLConnect(dbc_,
                    AsSqlChar(server.c_str()), SQL_NTS,
                    AsSqlChar(params.user.c_str()), SQL_NTS,
                    AsSqlChar(params.password.c_str()), SQL_NTS);
    if (!SQL_SUCCEEDED(rc)) {
      last_error_ = Diagnose(SQL_HANDLE_DBC, dbc_);
      Close();
      return last_error_;
    }
    connected_ = true;

    if (!params.database.empty()) {
      rc = SQLSetConnectAttr(
          dbc_, SQL_ATTR_CURRENT_CATALOG,
          AsSqlChar(params.database.c_str()), SQL_NTS);
      if (!SQL_SUCCEEDED(rc)) {
        last_error_ = Diagnose(SQL_HANDLE_DBC, dbc_);
        Close();
        return last_error_;
      }
    }

    last_error_.Clear();
    return Error::Ok();
  }

  void Close() {
    if (dbc_ != SQL_NULL_HDBC) {
      if (connected_) { SQLDisconnect(dbc_); }
      SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
      dbc_ = SQL_NULL_HDBC;
    }
    if (env_ != SQL_NULL_HENV) {
      SQLFreeHandle(SQL_HANDLE_ENV, env_);
      env_ = SQL_NULL_HENV;
    }
    connected_ = false;
  }

  bool IsOpen() const { return connected_; }

  // --- Execute ---

  ExecResult<Handle> Execute(const char* sql) {
    if (!connected_) {
      return Fail(Error::Make(ErrorCode::kNotOpen, "Database not open"));
    }
    if (sql == nullptr) {
      return Fail(Error::Make(ErrorCode::kNullParam, "sql is null"));
    }

    SQLHSTMT stmt = SQL_NULL_HSTMT;
    SQLRETURN rc = SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt);
    if (!SQL_SUCCEEDED(rc)) {
      return Fail(Diagnose(SQL_HANDLE_DBC, dbc_));
    }

    if (max_length_mb_ > 0) {
      SQLULEN max_length = static_cast<SQLULEN>(max_length_mb_) * 1048576U;
      rc = SQLSetStmtAttr(stmt, SQL_ATTR_MAX_LENGTH,
                          reinterpret_cast<SQLPOINTER>(max_length),
                          SQL_IS_UINTEGER);
      if (!SQL_SUCCEEDED(rc)) {
        Error err = Diagnose(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        return Fail(err);
      }
    }

    rc = SQLExecDirect(stmt, AsSqlChar(sql), SQL_NTS);
    // SQL_NO_DATA: searched UPDATE/DELETE that touched no rows
    if (!SQL_SUCCEEDED(rc) && rc != SQL_NO_DATA) {
      Error err = Diagnose(SQL_HANDLE_STMT, stmt);
      SQLFreeHandle(SQL_HANDLE_STMT, stmt);
      return Fail(err);
    }
    return ExecResult<Handle>::Success(stmt);
  }

  // --- Fetch ---

  bool FetchRow(Handle stmt, Row* out) {
    if (stmt == SQL_NULL_HSTMT) { return false; }

    SQLSMALLINT cols = 0;
    if (!SQL_SUCCEEDED(SQLNumResultCols(stmt, &cols)) || cols <= 0) {
      return false;
    }

    SQLRETURN rc = SQLFetch(stmt);
    if (rc == SQL_NO_DATA) { return false; }
    if (!SQL_SUCCEEDED(rc)) {
      last_error_ = Diagnose(SQL_HANDLE_STMT, stmt);
      return false;
    }

    if (out == nullptr) { return true; }
    out->Clear();
    for (SQLUSMALLINT col = 1; col <= static_cast<SQLUSMALLINT>(cols); ++col) {
      SQLCHAR name[256];
      SQLSMALLINT name_len = 0;
      SQLSMALLINT type = 0;
      SQLULEN size = 0;
      SQLSMALLINT digits = 0;
      SQLSMALLINT nullable = 0;
      rc = SQLDescribeCol(stmt, col, name, sizeof(name), &name_len, &type,
                          &size, &digits, &nullable);
      if (!SQL_SUCCEEDED(rc)) {
        last_error_ = Diagnose(SQL_HANDLE_STMT, stmt);
        return false;
      }

      Value value;
      if (!ReadColumn(stmt, col, type, &value)) { return false; }
      out->Append(reinterpret_cast<const char*>(name), std::move(value));
    }
    return true;
  }

  int64_t AffectedRows(Handle stmt) const {
    SQLLEN count = -1;
    if (stmt == SQL_NULL_HSTMT || !SQL_SUCCEEDED(SQLRowCount(stmt, &count))) {
      return -1;
    }
    return static_cast<int64_t>(count);
  }

  void Free(Handle stmt) {
    if (stmt != SQL_NULL_HSTMT) { SQLFreeHandle(SQL_HANDLE_STMT, stmt); }
  }

  const Error& LastError() const { return last_error_; }

 private:
  static SQLCHAR* AsSqlChar(const char* s) {
    return reinterpret_cast<SQLCHAR*>(const_cast<char*>(s));
  }

  static bool IsIntegerType(SQLSMALLINT type) {
    return type == SQL_INTEGER || type == SQL_SMALLINT ||
           type == SQL_TINYINT || type == SQL_BIGINT || type == SQL_BIT;
  }

  static bool IsRealType(SQLSMALLINT type) {
    return type == SQL_REAL || type == SQL_FLOAT || type == SQL_DOUBLE;
  }

  static bool IsBinaryType(SQLSMALLINT type) {
    return type == SQL_BINARY || type == SQL_VARBINARY ||
           type == SQL_LONGVARBINARY;
  }

  /// Read one column of the current row, in chunks for long data.
  bool ReadColumn(SQLHSTMT stmt, SQLUSMALLINT col, SQLSMALLINT type,
                  Value* out) {
    const bool binary = IsBinaryType(type);
    const SQLSMALLINT target = binary ? SQL_C_BINARY : SQL_C_CHAR;
    // Text chunks carry a terminating NUL that is not part of the data.
    const size_t terminator = binary ? 0 : 1;

    std::string data;
    char buf[4096];
    for (;;) {
      SQLLEN indicator = 0;
      SQLRETURN rc = SQLGetData(stmt, col, target, buf, sizeof(buf),
                                &indicator);
      if (rc == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(rc)) {
        last_error_ = Diagnose(SQL_HANDLE_STMT, stmt);
        return false;
      }
      if (indicator == SQL_NULL_DATA) {
        *out = Value::Null();
        return true;
      }

      size_t chunk = sizeof(buf) - terminator;
      if (rc == SQL_SUCCESS) {
        if (indicator != SQL_NO_TOTAL) {
          if (static_cast<size_t>(indicator) < chunk) {
            chunk = static_cast<size_t>(indicator);
          }
        } else if (!binary) {
          // Last text chunk of unknown length ends at its NUL.
          chunk = strnlen(buf, chunk);
        }
      }
      data.append(buf, chunk);
      if (rc == SQL_SUCCESS) { break; }
    }

    if (binary) {
      *out = Value::Blob(reinterpret_cast<const uint8_t*>(data.data()),
                         data.size());
    } else if (IsIntegerType(type)) {
      *out = Value::Integer(std::strtoll(data.c_str(), nullptr, 10));
    } else if (IsRealType(type)) {
      *out = Value::Real(std::strtod(data.c_str(), nullptr));
    } else {
      *out = Value::Text(std::move(data));
    }
    return true;
  }

  static Error Diagnose(SQLSMALLINT handle_type, SQLHANDLE handle) {
    SQLCHAR state[SQL_SQLSTATE_SIZE + 1] = {};
    SQLCHAR message[Error::kMaxMessageLen] = {};
    SQLINTEGER native = 0;
    SQLSMALLINT len = 0;

    Error err;
    SQLRETURN rc = SQLGetDiagRec(handle_type, handle, 1, state, &native,
                                 message, sizeof(message), &len);
    if (SQL_SUCCEEDED(rc)) {
      err.Set(ErrorCode::kError, reinterpret_cast<const char*>(message));
      err.SetNativeCode(reinterpret_cast<const char*>(state));
    } else {
      err.Set(ErrorCode::kError, "unknown ODBC error");
    }
    return err;
  }

  ExecResult<Handle> Fail(const Error& err) {
    last_error_ = err;
    return ExecResult<Handle>::Failure(err);
  }

  SQLHENV env_ = SQL_NULL_HENV;
  SQLHDBC dbc_ = SQL_NULL_HDBC;
  bool connected_ = false;
  uint32_t max_length_mb_ = 0;
  Error last_error_;
};

}  // namespace dbal

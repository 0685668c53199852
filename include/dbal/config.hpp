// Copyright (c) 2024 liudegui. MIT License.
//
// dbal configuration -- connection parameters, DSN parsing, driver options.
//
// DSN format: "server:port:user:password:database[:persistent]"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "127.0.0.1:1433:sa::forum:1"    (empty password, persistent)
// Empty fields keep their defaults. Sqlite3Client opens the database field
// as a path; ":memory:" has to be set on ConnectParams directly.

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include "dbal/error.hpp"

namespace dbal {

// ---------------------------------------------------------------------------
// ConnectParams
// ---------------------------------------------------------------------------

struct ConnectParams {
  std::string server = "localhost";
  uint16_t port = 0;
  std::string user;
  std::string password;
  std::string database;
  bool persistent = false;
};

/// Separator between server and port in the server string.
constexpr char PortDelimiter() {
#if defined(_WIN32)
  return ',';
#else
  return ':';
#endif
}

inline std::string BuildServerString(const ConnectParams& params) {
  std::string server = params.server;
  if (params.port != 0) {
    server += PortDelimiter();
    server += std::to_string(params.port);
  }
  return server;
}

namespace detail {

inline bool EqualsNoCase(const char* a, const char* b) {
  while (*a != '\0' && *b != '\0') {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

inline bool IsAllDigits(const char* s) {
  if (s == nullptr || *s == '\0') { return false; }
  for (; *s != '\0'; ++s) {
    if (!std::isdigit(static_cast<unsigned char>(*s))) { return false; }
  }
  return true;
}

}  // namespace detail

/// Parse "server:port:user:password:database[:persistent]".
/// Fields can be empty. Minimal: "localhost:1433:sa::forum"
inline Error ParseDsn(const char* dsn, ConnectParams* out) {
  if (dsn == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "dsn is null");
  }

  char buf[512];
  if (std::strlen(dsn) >= sizeof(buf)) {
    return Error::Make(ErrorCode::kConfiguration, "dsn too long");
  }
  std::strncpy(buf, dsn, sizeof(buf) - 1);
  buf[sizeof(buf) - 1] = '\0';

  char* parts[6] = {};
  int32_t count = 0;
  char* p = buf;
  parts[0] = p;
  count = 1;
  while (*p != '\0' && count < 6) {
    if (*p == ':') {
      *p = '\0';
      parts[count++] = p + 1;
    }
    ++p;
  }

  ConnectParams params;
  if (count >= 1 && parts[0][0] != '\0') { params.server = parts[0]; }
  if (count >= 2 && parts[1][0] != '\0') {
    if (!detail::IsAllDigits(parts[1])) {
      return Error::MakeFormat(ErrorCode::kConfiguration,
                               "invalid port '%s'", parts[1]);
    }
    unsigned long port = std::strtoul(parts[1], nullptr, 10);
    if (port > 65535UL) {
      return Error::MakeFormat(ErrorCode::kConfiguration,
                               "port %lu out of range", port);
    }
    params.port = static_cast<uint16_t>(port);
  }
  if (count >= 3) { params.user = parts[2]; }
  if (count >= 4) { params.password = parts[3]; }
  if (count >= 5) { params.database = parts[4]; }
  if (count >= 6 && parts[5][0] != '\0') {
    const char* flag = parts[5];
    params.persistent = detail::EqualsNoCase(flag, "1") ||
                        detail::EqualsNoCase(flag, "true") ||
                        detail::EqualsNoCase(flag, "yes");
  }

  *out = params;
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// Long-read limit (ODBC SQL_ATTR_MAX_LENGTH)
// ---------------------------------------------------------------------------

static constexpr uint32_t kMinLongReadMb = 8;

/// Normalize a size setting ("512k", "2g", "64m", "16777216") to whole
/// megabytes, never below kMinLongReadMb. Returns 0 for empty input,
/// meaning "leave the client default".
inline uint32_t ParseLongReadLimit(const char* text) {
  if (text == nullptr || *text == '\0') { return 0; }

  size_t len = std::strlen(text);
  char unit = static_cast<char>(
      std::tolower(static_cast<unsigned char>(text[len - 1])));
  uint64_t size = std::strtoull(text, nullptr, 10);
  uint64_t mb = size;

  if (unit == 'k') {
    mb = size / 1024;
  } else if (unit == 'g') {
    mb = size * 1024;
  } else if (std::isdigit(static_cast<unsigned char>(unit))) {
    mb = size / 1048576;
  }

  if (mb < kMinLongReadMb) { mb = kMinLongReadMb; }
  if (mb > UINT32_MAX) { mb = UINT32_MAX; }
  return static_cast<uint32_t>(mb);
}

// ---------------------------------------------------------------------------
// Driver options
// ---------------------------------------------------------------------------

/// Query instrumentation. Explain and timing are mutually exclusive.
enum class InstrumentMode : uint8_t {
  kNone = 0,
  kExplain,  // per-query reports through the QueryReporter
  kTiming,   // accumulate wall time into Driver::SqlTime()
};

struct DriverOptions {
  InstrumentMode instrument = InstrumentMode::kNone;
};

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

enum class TransactionStatus : uint8_t {
  kBegin = 0,
  kCommit,
  kRollback,
};

/// Map "begin" / "commit" / "rollback" to a status. Anything else is a
/// configuration error rather than a silent no-op.
inline Error ParseTransactionStatus(const char* text, TransactionStatus* out) {
  if (text == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "transaction status is null");
  }
  if (detail::EqualsNoCase(text, "begin")) {
    *out = TransactionStatus::kBegin;
  } else if (detail::EqualsNoCase(text, "commit")) {
    *out = TransactionStatus::kCommit;
  } else if (detail::EqualsNoCase(text, "rollback")) {
    *out = TransactionStatus::kRollback;
  } else {
    return Error::MakeFormat(ErrorCode::kConfiguration,
                             "unrecognized transaction status '%s'", text);
  }
  return Error::Ok();
}

}  // namespace dbal

// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer + native backend code
//   - Compatible with -fno-exceptions
//   - kConnectivity / kExecution / kConfiguration classify driver failures

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dbal {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kConnectivity = -12,
  kExecution = -13,
  kConfiguration = -14,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:            return "ok";
    case ErrorCode::kError:         return "error";
    case ErrorCode::kNotOpen:       return "not_open";
    case ErrorCode::kBusy:          return "busy";
    case ErrorCode::kNotFound:      return "not_found";
    case ErrorCode::kConstraint:    return "constraint";
    case ErrorCode::kMismatch:      return "mismatch";
    case ErrorCode::kMisuse:        return "misuse";
    case ErrorCode::kRange:         return "range";
    case ErrorCode::kNullParam:     return "null_param";
    case ErrorCode::kIoError:       return "io_error";
    case ErrorCode::kFull:          return "full";
    case ErrorCode::kConnectivity:  return "connectivity";
    case ErrorCode::kExecution:     return "execution";
    case ErrorCode::kConfiguration: return "configuration";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;
  static constexpr uint32_t kMaxNativeCodeLen = 32;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};
  /// Backend's own code as text (SQLSTATE, errno, sqlite result code).
  char native_code[kMaxNativeCodeLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void SetNativeCode(const char* native) {
    if (native != nullptr) {
      std::strncpy(native_code, native, kMaxNativeCodeLen - 1);
      native_code[kMaxNativeCodeLen - 1] = '\0';
    } else {
      native_code[0] = '\0';
    }
  }

  void SetNativeCode(int64_t native) {
    std::snprintf(native_code, kMaxNativeCodeLen, "%lld",
                  static_cast<long long>(native));
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
    native_code[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error MakeFormat(ErrorCode c, const char* fmt, ...) {
    Error e;
    e.code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(e.message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    }
    return e;
  }
};

}  // namespace dbal

// Copyright (c) 2024 liudegui. MIT License.
//
// dbal client contract -- primitives a backend provides to Driver<Client>.
//
// A Client type supplies:
//   using Handle = <pointer type>;                 // one executed statement
//   bool HasCapability(Capability) const;          // checked before use
//   Error Connect(const std::string& server, const ConnectParams&);
//   ExecResult<Handle> Execute(const char* sql);   // no exceptions
//   bool FetchRow(Handle, Row* out);               // false at end of data
//   int64_t AffectedRows(Handle) const;
//   void Free(Handle);
//   const Error& LastError() const;
//   void Close();
//   bool IsOpen() const;
// and the statics:
//   Name(), DisplayName(), VersionQuery(), VersionCacheKey(),
//   IdentityQuery(), BeginSql(), CommitSql(), RollbackSql(), kLimitStyle.

#pragma once

#include <cstdint>

#include "dbal/error.hpp"

namespace dbal {

enum class Capability : uint8_t {
  kConnect = 0,
  kPersistentConnect,
};

inline const char* CapabilityName(Capability cap) {
  switch (cap) {
    case Capability::kConnect:           return "connect";
    case Capability::kPersistentConnect: return "persistent connect";
  }
  return "unknown";
}

/// Outcome of Client::Execute(): a handle on success, an error otherwise.
template <typename Handle>
struct ExecResult {
  Handle handle = nullptr;
  Error error;

  bool ok() const { return handle != nullptr; }
  explicit operator bool() const { return ok(); }

  static ExecResult Success(Handle h) {
    ExecResult r;
    r.handle = h;
    return r;
  }

  static ExecResult Failure(const Error& e) {
    ExecResult r;
    r.error = e;
    return r;
  }
};

}  // namespace dbal

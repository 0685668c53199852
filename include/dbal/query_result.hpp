// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::ResultId / dbal::QueryResult -- caller-visible result handles.
//
// Design:
//   - Callers never hold a raw client handle, only a QueryResult value
//   - ResultId is the normalized identifier used for registry and cache
//     lookups; live ids come from the handle address, cache ids carry the
//     top bit, so the two spaces never overlap
//   - A freed QueryResult stays a plain value; lookups on it simply miss

#pragma once

#include <cstddef>
#include <cstdint>

namespace dbal {

// ---------------------------------------------------------------------------
// ResultId
// ---------------------------------------------------------------------------

struct ResultId {
  static constexpr uint64_t kCachedBit = 0x8000000000000000ULL;

  uint64_t value = 0;

  bool Valid() const { return value != 0; }
  bool IsCached() const { return (value & kCachedBit) != 0; }

  /// Live id derived from a client handle. User-space addresses never
  /// have the top bit set.
  template <typename Handle>
  static ResultId FromHandle(Handle handle) {
    ResultId id;
    id.value = static_cast<uint64_t>(reinterpret_cast<uintptr_t>(handle)) &
               ~kCachedBit;
    return id;
  }

  /// Cache id from a cache-local sequence number (must be non-zero).
  static ResultId Cached(uint64_t seq) {
    ResultId id;
    id.value = (seq & ~kCachedBit) | kCachedBit;
    return id;
  }

  static ResultId Invalid() { return ResultId{}; }

  bool operator==(const ResultId& other) const { return value == other.value; }
  bool operator!=(const ResultId& other) const { return value != other.value; }
  bool operator<(const ResultId& other) const { return value < other.value; }
};

struct ResultIdHash {
  size_t operator()(const ResultId& id) const {
    return static_cast<size_t>(id.value ^ (id.value >> 32));
  }
};

// ---------------------------------------------------------------------------
// QueryResult
// ---------------------------------------------------------------------------

enum class ResultSource : uint8_t {
  kNone = 0,   // failed or empty query
  kLive,       // registered in the OpenQueryRegistry
  kCached,     // served by the QueryCache
  kStatement,  // succeeded without a rowset, handle already released
};

struct QueryResult {
  ResultId id;
  ResultSource source = ResultSource::kNone;

  bool ok() const { return source != ResultSource::kNone; }
  explicit operator bool() const { return ok(); }

  bool IsLive() const { return source == ResultSource::kLive; }
  bool IsCached() const { return source == ResultSource::kCached; }

  static QueryResult None() { return QueryResult{}; }

  static QueryResult Live(ResultId id) {
    QueryResult r;
    r.id = id;
    r.source = ResultSource::kLive;
    return r;
  }

  static QueryResult Cached(ResultId id) {
    QueryResult r;
    r.id = id;
    r.source = ResultSource::kCached;
    return r;
  }

  static QueryResult Statement() {
    QueryResult r;
    r.source = ResultSource::kStatement;
    return r;
  }
};

}  // namespace dbal

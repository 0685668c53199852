// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::MemoryQueryCache -- in-process QueryCache.
//
// Design:
//   - Rowsets keyed by query text, expiring ttl seconds after SqlSave()
//   - Cursors share the rowset (shared_ptr), so invalidating or expiring a
//     rowset never pulls rows out from under an open cursor
//   - SqlFreeResult() closes the cursor only; the rowset stays until it
//     expires or is invalidated
//   - Clock is injectable for tests
//   - Not thread-safe, same as the driver that uses it

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dbal/query_cache.hpp"

namespace dbal {

class MemoryQueryCache : public QueryCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  MemoryQueryCache() : now_([] { return Clock::now(); }) {}
  explicit MemoryQueryCache(NowFn now) : now_(std::move(now)) {}

  // No copy
  MemoryQueryCache(const MemoryQueryCache&) = delete;
  MemoryQueryCache& operator=(const MemoryQueryCache&) = delete;

  // --- Key/value ---

  bool Get(const std::string& key, std::string* value) override {
    auto it = values_.find(key);
    if (it == values_.end()) { return false; }
    if (value != nullptr) { *value = it->second; }
    return true;
  }

  void Put(const std::string& key, const std::string& value) override {
    values_[key] = value;
  }

  // --- Query results ---

  ResultId SqlLoad(const std::string& query) override {
    auto it = rowsets_.find(query);
    if (it == rowsets_.end()) { return ResultId::Invalid(); }
    if (now_() >= it->second.expires_at) {
      rowsets_.erase(it);
      return ResultId::Invalid();
    }
    return OpenCursor(it->second.rows);
  }

  ResultId SqlSave(const std::string& query, std::vector<Row> rows,
                   uint32_t ttl) override {
    auto shared = std::make_shared<const std::vector<Row>>(std::move(rows));
    if (ttl > 0) {
      Stored& stored = rowsets_[query];
      stored.rows = shared;
      stored.expires_at = now_() + std::chrono::seconds(ttl);
    }
    return OpenCursor(std::move(shared));
  }

  bool SqlExists(ResultId id) const override {
    return cursors_.count(id) != 0;
  }

  bool SqlFetchRow(ResultId id, Row* out) override {
    auto it = cursors_.find(id);
    if (it == cursors_.end()) { return false; }
    Cursor& cursor = it->second;
    if (cursor.position >= cursor.rows->size()) { return false; }
    if (out != nullptr) {
      *out = (*cursor.rows)[static_cast<size_t>(cursor.position)];
    }
    ++cursor.position;
    return true;
  }

  bool SqlRowSeek(ResultId id, uint64_t row) override {
    auto it = cursors_.find(id);
    if (it == cursors_.end()) { return false; }
    // Past the end leaves the cursor exhausted, not where it was.
    if (row >= it->second.rows->size()) {
      it->second.position = it->second.rows->size();
      return false;
    }
    it->second.position = row;
    return true;
  }

  void SqlFreeResult(ResultId id) override { cursors_.erase(id); }

  // --- Invalidation ---

  /// Drop the rowset stored for `key` (query text) and any value under it.
  void Invalidate(const std::string& key) {
    rowsets_.erase(key);
    values_.erase(key);
  }

  /// Drop everything except open cursors.
  void Clear() {
    rowsets_.clear();
    values_.clear();
  }

  size_t NumRowsets() const { return rowsets_.size(); }
  size_t NumOpenCursors() const { return cursors_.size(); }

 private:
  struct Stored {
    std::shared_ptr<const std::vector<Row>> rows;
    Clock::time_point expires_at;
  };

  struct Cursor {
    std::shared_ptr<const std::vector<Row>> rows;
    uint64_t position = 0;
  };

  ResultId OpenCursor(std::shared_ptr<const std::vector<Row>> rows) {
    ResultId id = ResultId::Cached(++next_seq_);
    Cursor cursor;
    cursor.rows = std::move(rows);
    cursors_.emplace(id, std::move(cursor));
    return id;
  }

  NowFn now_;
  uint64_t next_seq_ = 0;
  std::unordered_map<std::string, std::string> values_;
  std::unordered_map<std::string, Stored> rowsets_;
  std::unordered_map<ResultId, Cursor, ResultIdHash> cursors_;
};

}  // namespace dbal

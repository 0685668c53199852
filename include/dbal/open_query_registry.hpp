// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::OpenQueryRegistry<Handle> -- live result handles of one connection.
//
// Design:
//   - ResultId -> {handle, cursor position}
//   - Every key refers to a handle not yet released at the client layer;
//     Remove() hands the handle back so the caller releases it exactly once
//   - Drain() releases whatever is left when the connection closes
//   - No locking: scoped to a single connection

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>

#include "dbal/query_result.hpp"

namespace dbal {

template <typename Handle>
class OpenQueryRegistry {
 public:
  struct Entry {
    Handle handle = nullptr;
    uint64_t position = 0;  // rows already fetched
    std::string query;      // statement text, for re-execution on seek
  };

  OpenQueryRegistry() = default;

  OpenQueryRegistry(OpenQueryRegistry&&) = default;
  OpenQueryRegistry& operator=(OpenQueryRegistry&&) = default;

  // No copy
  OpenQueryRegistry(const OpenQueryRegistry&) = delete;
  OpenQueryRegistry& operator=(const OpenQueryRegistry&) = delete;

  /// Returns false if the id is already registered or the handle is null.
  bool Add(ResultId id, Handle handle, std::string query = std::string()) {
    if (!id.Valid() || handle == nullptr) { return false; }
    Entry entry;
    entry.handle = handle;
    entry.query = std::move(query);
    return entries_.emplace(id, std::move(entry)).second;
  }

  Entry* Find(ResultId id) {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  const Entry* Find(ResultId id) const {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  bool Contains(ResultId id) const { return entries_.count(id) != 0; }

  void Advance(ResultId id) {
    Entry* entry = Find(id);
    if (entry != nullptr) { ++entry->position; }
  }

  /// Unregister and return the handle, or nullptr if not registered.
  Handle Remove(ResultId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) { return nullptr; }
    Handle handle = it->second.handle;
    entries_.erase(it);
    return handle;
  }

  /// Unregister everything, passing each handle to release(handle).
  template <typename Release>
  void Drain(Release&& release) {
    auto entries = std::move(entries_);
    entries_.clear();
    for (auto& kv : entries) {
      release(kv.second.handle);
    }
  }

  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

 private:
  std::unordered_map<ResultId, Entry, ResultIdHash> entries_;
};

}  // namespace dbal

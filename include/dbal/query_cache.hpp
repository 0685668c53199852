// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::QueryCache -- optional result cache consumed by Driver<Client>.
//
// Design:
//   - Abstract collaborator injected into the driver as a nullable pointer;
//     the driver works unchanged when none is given
//   - Rowsets are stored by exact query text with a TTL (seconds)
//   - Served rowsets are read through cursor ids (ResultId::Cached), each
//     SqlLoad/SqlSave opening a fresh cursor
//   - Get/Put is a plain key/value side channel (e.g. server version)

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dbal/query_result.hpp"
#include "dbal/row.hpp"

namespace dbal {

class QueryCache {
 public:
  virtual ~QueryCache() = default;

  // --- Key/value ---

  virtual bool Get(const std::string& key, std::string* value) = 0;
  virtual void Put(const std::string& key, const std::string& value) = 0;

  // --- Query results ---

  /// Open a cursor over the rowset stored for `query`.
  /// Returns ResultId::Invalid() on a miss or an expired entry.
  virtual ResultId SqlLoad(const std::string& query) = 0;

  /// Store `rows` for `query` and open a cursor over them. The cache
  /// decides retention; the returned cursor is always readable until freed.
  virtual ResultId SqlSave(const std::string& query, std::vector<Row> rows,
                           uint32_t ttl) = 0;

  virtual bool SqlExists(ResultId id) const = 0;
  virtual bool SqlFetchRow(ResultId id, Row* out) = 0;
  /// Position the cursor so the next fetch returns row `row` (0-based).
  virtual bool SqlRowSeek(ResultId id, uint64_t row) = 0;
  virtual void SqlFreeResult(ResultId id) = 0;
};

}  // namespace dbal

// Copyright (c) 2024 liudegui. MIT License.
//
// dbal SQLite3 demo -- queries, paging, caching and transactions.
//
// Usage:
//   ./dbal_sqlite3_demo

#include <cstdio>
#include <cstring>

#include <spdlog/spdlog.h>

#include "dbal/db.hpp"

static void PrintRows(dbal::Db& db, dbal::QueryResult res) {
  dbal::Row row;
  while (db.FetchRow(res, &row)) {
    std::printf("  empno=%lld  empname=%s\n",
                static_cast<long long>(row.GetInt64("empno")),
                row.GetString("empname", "(null)").c_str());
  }
  db.FreeResult(res);
}

int main() {
  spdlog::set_level(spdlog::level::info);

  dbal::MemoryQueryCache cache;
  dbal::LogReporter reporter;
  dbal::DriverOptions options;
  options.instrument = dbal::InstrumentMode::kExplain;
  dbal::Db db(&cache, &reporter, options);

  // Open in-memory database
  dbal::ConnectParams params;
  params.database = ":memory:";
  dbal::Error err = db.Connect(params);
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s\n", err.message);
    return 1;
  }
  std::printf("Server: %s\n", db.ServerInfo().c_str());

  // Create and fill table in one transaction
  db.ExecQuery("CREATE TABLE emp(empno INTEGER PRIMARY KEY, empname TEXT);");
  db.BeginTransaction();
  for (int32_t i = 1; i <= 10; ++i) {
    char sql[96];
    std::snprintf(sql, sizeof(sql),
                  "INSERT INTO emp(empname) VALUES('Employee%02d');", i);
    if (!db.ExecQuery(sql)) {
      std::fprintf(stderr, "Insert failed: %s\n", db.ReportError().message);
      db.Rollback();
      return 1;
    }
  }
  db.Commit();
  std::printf("Last inserted id: %lld\n",
              static_cast<long long>(db.LastInsertedId()));

  // Page 2 of 3 rows each
  std::printf("\n--- Page 2 ---\n");
  PrintRows(db, db.ExecQueryLimit("SELECT * FROM emp ORDER BY empno", 3, 3));

  // Cached for 60 seconds; the second run is served from the cache
  std::printf("\n--- Cached ---\n");
  const char* sql = "SELECT * FROM emp WHERE empno > 8 ORDER BY empno";
  PrintRows(db, db.ExecQuery(sql, 60));
  PrintRows(db, db.ExecQuery(sql, 60));
  std::printf("Queries: %u (cached %u)\n", db.NumQueries(),
              db.NumQueries(true));

  // Update
  db.ExecQuery("UPDATE emp SET empname = 'Boss' WHERE empno = 1;");
  std::printf("\nUpdated %lld row(s)\n",
              static_cast<long long>(db.AffectedRows()));

  // Error path
  if (!db.ExecQuery("SELECT * FROM nonexistent;")) {
    dbal::Error e = db.ReportError();
    std::printf("Expected error [%s]: %s\n", e.native_code, e.message);
  }

  db.Close();
  std::printf("\nDone.\n");
  return 0;
}

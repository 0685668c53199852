// Copyright (c) 2024 liudegui. MIT License.
//
// dbal ODBC demo -- MSSQL through a unixODBC data source.
//
// Usage:
//   export DBAL_ODBC_DSN="mssql_dsn:1433:sa:secret:dbal_test:1"
//   export DBAL_ODBC_LONG_READ="16m"     # optional, long column cap
//   ./dbal_odbc_demo
//
// The server field names the ODBC data source; the trailing 1 asks for a
// pooled (persistent) connection.

#include <cstdio>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "dbal/db.hpp"

int main() {
  spdlog::set_level(spdlog::level::debug);

  const char* dsn = std::getenv("DBAL_ODBC_DSN");
  if (dsn == nullptr) {
    dsn = "dbal_mssql::sa::dbal_test";
  }

  dbal::ConnectParams params;
  dbal::Error err = dbal::ParseDsn(dsn, &params);
  if (!err.ok()) {
    std::fprintf(stderr, "Bad DSN: %s\n", err.message);
    return 1;
  }

  dbal::MemoryQueryCache cache;
  dbal::OdbcDb db(&cache);
  db.Impl().SetLongReadLimit(
      dbal::ParseLongReadLimit(std::getenv("DBAL_ODBC_LONG_READ")));

  err = db.Connect(params);
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed [%s]: %s\n", err.native_code,
                 err.message);
    return 1;
  }
  std::printf("Connected: %s\n", db.ServerInfo().c_str());

  db.ExecQuery("IF OBJECT_ID('emp', 'U') IS NOT NULL DROP TABLE emp;");
  db.ExecQuery("CREATE TABLE emp(empno INT IDENTITY(1,1) PRIMARY KEY, "
               "empname NVARCHAR(64));");

  db.BeginTransaction();
  db.ExecQuery("INSERT INTO emp(empname) VALUES('Alice');");
  db.ExecQuery("INSERT INTO emp(empname) VALUES('Bob');");
  db.ExecQuery("INSERT INTO emp(empname) VALUES('Charlie');");
  db.Commit();
  std::printf("Last identity: %lld\n",
              static_cast<long long>(db.LastInsertedId()));

  // SELECT DISTINCT TOP 3 ..., skipping the first row
  dbal::QueryResult res = db.ExecQueryLimit(
      "SELECT DISTINCT empname FROM emp ORDER BY empname", 2, 1, 30);
  dbal::Row row;
  while (db.FetchRow(res, &row)) {
    std::printf("  %s\n", row.GetString(0).c_str());
  }
  db.FreeResult(res);

  db.Close();
  std::printf("Done.\n");
  return 0;
}

// Copyright (c) 2024 liudegui. MIT License.
//
// dbal MariaDB demo -- same driver contract over the MySQL C client.
//
// Usage:
//   export DBAL_MARIA_DSN="localhost:3306:root:pass:dbal_test"
//   ./dbal_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS dbal_test;"

#include <cstdio>
#include <cstdlib>

#include "dbal/db.hpp"

int main() {
  const char* dsn = std::getenv("DBAL_MARIA_DSN");
  if (dsn == nullptr) {
    dsn = "localhost:3306:root::dbal_test";
  }

  dbal::ConnectParams params;
  dbal::Error err = dbal::ParseDsn(dsn, &params);
  if (!err.ok()) {
    std::fprintf(stderr, "Bad DSN: %s\n", err.message);
    return 1;
  }

  dbal::MariaDb db;
  err = db.Connect(params);
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s\n", err.message);
    return 1;
  }
  std::printf("Connected: %s\n", db.ServerInfo().c_str());

  db.ExecQuery("DROP TABLE IF EXISTS emp;");
  db.ExecQuery("CREATE TABLE emp(empno INT AUTO_INCREMENT PRIMARY KEY, "
               "empname VARCHAR(64));");
  db.ExecQuery("INSERT INTO emp(empname) VALUES('Alice'), ('Bob'), "
               "('Charlie');");
  std::printf("Inserted %lld row(s), last id %lld\n",
              static_cast<long long>(db.AffectedRows()),
              static_cast<long long>(db.LastInsertedId()));

  dbal::QueryResult res =
      db.ExecQueryLimit("SELECT * FROM emp ORDER BY empno", 2, 1);
  dbal::Row row;
  while (db.FetchRow(res, &row)) {
    std::printf("  %lld | %s\n", static_cast<long long>(row.GetInt64(0)),
                row.GetString(1).c_str());
  }
  db.FreeResult(res);

  db.Close();
  std::printf("Done.\n");
  return 0;
}

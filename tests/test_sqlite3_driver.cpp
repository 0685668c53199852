// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbal::Driver<Sqlite3Client> on an in-memory database.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstring>
#include <string>

#include "dbal/db.hpp"

using namespace dbal;

static ConnectParams MemoryParams() {
  ConnectParams params;
  params.database = ":memory:";
  return params;
}

// Helper: open an in-memory db with emp table and three rows
static void OpenTestDb(Db& db) {
  REQUIRE(db.Connect(MemoryParams()).ok());
  REQUIRE(db.ExecQuery("CREATE TABLE emp(empno INTEGER PRIMARY KEY, "
                       "empname TEXT, salary REAL, photo BLOB);"));
  REQUIRE(db.ExecQuery("INSERT INTO emp VALUES(1, 'Alice', 10.5, x'0102');"));
  REQUIRE(db.ExecQuery("INSERT INTO emp VALUES(2, 'Bob', 20.0, NULL);"));
  REQUIRE(db.ExecQuery("INSERT INTO emp VALUES(3, NULL, NULL, NULL);"));
}

TEST_CASE("Sqlite3Driver: connect and close", "[sqlite3_driver]") {
  Db db;
  REQUIRE_FALSE(db.IsConnected());

  REQUIRE(db.Connect(MemoryParams()).ok());
  REQUIRE(db.IsConnected());
  REQUIRE(db.Database() == ":memory:");

  REQUIRE(db.Close());
  REQUIRE_FALSE(db.IsConnected());
}

TEST_CASE("Sqlite3Driver: no persistent connect", "[sqlite3_driver]") {
  Db db;
  ConnectParams params = MemoryParams();
  params.persistent = true;

  Error err = db.Connect(params);
  REQUIRE(err.code == ErrorCode::kConnectivity);
  REQUIRE(std::strcmp(err.message,
                      "persistent connect capability does not exist, is the "
                      "sqlite3 client installed?") == 0);
  REQUIRE(db.ReportError().code == ErrorCode::kConnectivity);
}

TEST_CASE("Sqlite3Driver: statements and affected rows",
          "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res = db.ExecQuery("UPDATE emp SET salary = 1.0 WHERE empno < 3;");
  REQUIRE(res.source == ResultSource::kStatement);
  REQUIRE(db.AffectedRows() == 2);
  REQUIRE(db.OpenQueries().Empty());
}

TEST_CASE("Sqlite3Driver: select reports zero affected rows",
          "[sqlite3_driver]") {
  Db db;
  REQUIRE(db.Connect(MemoryParams()).ok());
  REQUIRE(db.ExecQuery("CREATE TABLE t(a INTEGER);"));
  REQUIRE(db.ExecQuery("INSERT INTO t VALUES(1), (2), (3);"));
  REQUIRE(db.AffectedRows() == 3);

  QueryResult res = db.ExecQuery("SELECT a FROM t WHERE a > 10;");
  REQUIRE(res.IsLive());
  REQUIRE(db.AffectedRows() == 0);
  REQUIRE_FALSE(db.FetchRow(res, nullptr));
  db.FreeResult(res);
}

TEST_CASE("Sqlite3Driver: typed rows", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res = db.ExecQuery("SELECT * FROM emp ORDER BY empno;");
  REQUIRE(res.IsLive());

  Row row;
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.NumFields() == 4);
  REQUIRE(row.GetInt64("empno") == 1);
  REQUIRE(row.GetString("empname") == "Alice");
  REQUIRE(row.GetDouble(2) == Catch::Approx(10.5));
  REQUIRE(row.Field("photo")->Type() == ValueType::kBlob);
  REQUIRE(row.Field("photo")->Bytes() == std::string("\x01\x02", 2));

  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.FieldIsNull(3));

  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.FieldIsNull(1));
  REQUIRE(row.GetString("empname", "none") == "none");

  REQUIRE_FALSE(db.FetchRow(res, &row));
  db.FreeResult(res);
  REQUIRE_FALSE(db.FetchRow(res, &row));
}

TEST_CASE("Sqlite3Driver: limit with offset", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res =
      db.ExecQueryLimit("SELECT empno FROM emp ORDER BY empno;", 1, 1);
  REQUIRE(res);
  REQUIRE(db.LastQueryText() == "SELECT empno FROM emp ORDER BY empno LIMIT 2");

  Row row;
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.GetInt64(0) == 2);
  REQUIRE_FALSE(db.FetchRow(res, &row));
  db.FreeResult(res);
}

TEST_CASE("Sqlite3Driver: seek backwards", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res = db.ExecQuery("SELECT empno FROM emp ORDER BY empno;");
  Row row;
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.GetInt64(0) == 2);

  REQUIRE(db.RowSeek(0, &res));
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.GetInt64(0) == 1);
  REQUIRE_FALSE(db.RowSeek(10, &res));
  db.FreeResult(res);
}

TEST_CASE("Sqlite3Driver: query error", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res = db.ExecQuery("SELECT * FROM nonexistent;");
  REQUIRE_FALSE(res);
  REQUIRE(db.LastError().code == ErrorCode::kExecution);
  REQUIRE(std::strstr(db.LastError().message, "nonexistent") != nullptr);
  REQUIRE(std::strcmp(db.LastError().native_code, "1") == 0);

  Error reported = db.ReportError();
  REQUIRE(std::strstr(reported.message, "nonexistent") != nullptr);
}

TEST_CASE("Sqlite3Driver: last inserted id", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);
  REQUIRE(db.LastInsertedId() == 3);

  db.ExecQuery("INSERT INTO emp(empname) VALUES('Dave');");
  REQUIRE(db.LastInsertedId() == 4);
}

TEST_CASE("Sqlite3Driver: server info", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  std::string raw = db.ServerInfo(true);
  REQUIRE(raw == sqlite3_libversion());
  REQUIRE(db.ServerInfo() == "SQLite3 " + raw);
}

TEST_CASE("Sqlite3Driver: transaction rollback", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  REQUIRE(db.BeginTransaction());
  REQUIRE(db.InTransaction());
  db.ExecQuery("DELETE FROM emp;");
  REQUIRE(db.Rollback());
  REQUIRE_FALSE(db.InTransaction());

  QueryResult res = db.ExecQuery("SELECT count(*) FROM emp;");
  Row row;
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.GetInt64(0) == 3);
  db.FreeResult(res);
}

TEST_CASE("Sqlite3Driver: transaction commit", "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  REQUIRE(db.BeginTransaction());
  db.ExecQuery("DELETE FROM emp WHERE empno = 3;");
  REQUIRE(db.Commit());

  QueryResult res = db.ExecQuery("SELECT count(*) FROM emp;");
  Row row;
  REQUIRE(db.FetchRow(res, &row));
  REQUIRE(row.GetInt64(0) == 2);
  db.FreeResult(res);

  // Commit without an open transaction is rejected by the engine.
  REQUIRE_FALSE(db.Commit());
  REQUIRE(db.LastError().code == ErrorCode::kExecution);
}

TEST_CASE("Sqlite3Driver: cached query", "[sqlite3_driver][cache]") {
  MemoryQueryCache cache;
  Db db(&cache);
  OpenTestDb(db);

  const char* sql = "SELECT empname FROM emp WHERE empno = 1;";
  QueryResult first = db.ExecQuery(sql, 60);
  REQUIRE(first.IsCached());
  REQUIRE(db.OpenQueries().Empty());
  db.FreeResult(first);

  // Change the table; the cached rowset still answers.
  db.ExecQuery("UPDATE emp SET empname = 'Alicia' WHERE empno = 1;");

  QueryResult second = db.ExecQuery(sql, 60);
  REQUIRE(second.IsCached());
  Row row;
  REQUIRE(db.FetchRow(second, &row));
  REQUIRE(row.GetString(0) == "Alice");
  db.FreeResult(second);

  cache.Invalidate(sql);
  QueryResult third = db.ExecQuery(sql, 60);
  REQUIRE(db.FetchRow(third, &row));
  REQUIRE(row.GetString(0) == "Alicia");
  db.FreeResult(third);
  REQUIRE(db.NumQueries(true) == 1);
}

TEST_CASE("Sqlite3Driver: close finalizes open results",
          "[sqlite3_driver]") {
  Db db;
  OpenTestDb(db);

  QueryResult res = db.ExecQuery("SELECT * FROM emp;");
  REQUIRE(db.OpenQueries().Size() == 1);
  REQUIRE(db.Close());
  REQUIRE(db.OpenQueries().Empty());

  Row row;
  REQUIRE_FALSE(db.FetchRow(res, &row));
}

TEST_CASE("Sqlite3Driver: move semantics", "[sqlite3_driver]") {
  Db db1;
  REQUIRE(db1.Connect(MemoryParams()).ok());

  Db db2(std::move(db1));
  REQUIRE(db2.IsConnected());
  REQUIRE_FALSE(db1.IsConnected());

  Db db3;
  db3 = std::move(db2);
  REQUIRE(db3.IsConnected());
  REQUIRE_FALSE(db2.IsConnected());
}

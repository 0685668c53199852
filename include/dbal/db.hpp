// Copyright (c) 2024 liudegui. MIT License.
//
// dbal -- single-include facade and per-backend driver aliases.
//
// Design:
//   - Driver<Client> is the contract; each backend only supplies a Client
//   - Users include this single header and use dbal::Db (default SQLite3)
//   - To switch backend: using MyDb = dbal::Driver<dbal::OdbcClient>;
//   - Move-only, RAII, no exceptions
//
// Usage (SQLite3, default):
//   #include "dbal/db.hpp"
//   dbal::Db db;
//   dbal::ConnectParams params;
//   params.database = ":memory:";
//   db.Connect(params);
//   db.ExecQuery("CREATE TABLE t(id INTEGER);");
//
// Usage (MSSQL over ODBC, requires DBAL_HAS_ODBC=1):
//   #include "dbal/db.hpp"
//   dbal::ConnectParams params;
//   dbal::ParseDsn("forum_dsn:1433:sa:secret:forum:1", &params);
//   dbal::OdbcDb db(&cache);
//   db.Connect(params);
//   auto res = db.ExecQueryLimit("SELECT id FROM posts", 10, 20);

#pragma once

#include "dbal/client.hpp"
#include "dbal/config.hpp"
#include "dbal/driver.hpp"
#include "dbal/error.hpp"
#include "dbal/limit_rewriter.hpp"
#include "dbal/memory_query_cache.hpp"
#include "dbal/query_cache.hpp"
#include "dbal/query_reporter.hpp"
#include "dbal/query_result.hpp"
#include "dbal/row.hpp"
#include "dbal/sqlite3_client.hpp"

#if defined(DBAL_HAS_MARIADB) && DBAL_HAS_MARIADB
#include "dbal/maria_client.hpp"
#endif

#if defined(DBAL_HAS_ODBC) && DBAL_HAS_ODBC
#include "dbal/odbc_client.hpp"
#endif

namespace dbal {

// ---------------------------------------------------------------------------
// Default type aliases -- users just use dbal::Db
// ---------------------------------------------------------------------------

using Sqlite3Db = Driver<Sqlite3Client>;
using Db        = Sqlite3Db;

#if defined(DBAL_HAS_MARIADB) && DBAL_HAS_MARIADB
using MariaDb = Driver<MariaClient>;
#endif

#if defined(DBAL_HAS_ODBC) && DBAL_HAS_ODBC
using OdbcDb = Driver<OdbcClient>;
#endif

}  // namespace dbal

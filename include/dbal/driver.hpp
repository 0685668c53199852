// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::Driver<Client> -- the driver contract, written once per client.
//
// Design:
//   - Client supplies raw primitives (see client.hpp); Driver owns the
//     query-result lifecycle on top of them
//   - A result is either live (OpenQueryRegistry), cached (QueryCache) or
//     a finished statement; never both live and cached
//   - Cache and reporter are optional collaborators, nullable pointers
//     that the caller keeps alive
//   - Failures return a falsy value; detail via ReportError()/LastError().
//     Each failure is reported and logged exactly once
//   - Move-only, RAII: the destructor releases open handles and closes
//   - No locking: one driver per thread
//
// State machine: disconnected -> connected -> [querying <-> idle] -> closed

#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "dbal/client.hpp"
#include "dbal/config.hpp"
#include "dbal/error.hpp"
#include "dbal/limit_rewriter.hpp"
#include "dbal/open_query_registry.hpp"
#include "dbal/query_cache.hpp"
#include "dbal/query_reporter.hpp"
#include "dbal/query_result.hpp"
#include "dbal/row.hpp"

namespace dbal {

namespace detail {

inline double NowSeconds() {
  using Seconds = std::chrono::duration<double>;
  return std::chrono::duration_cast<Seconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

inline std::string Trim(const std::string& s) {
  size_t begin = SkipSpace(s, 0);
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

/// Releases a temporary client handle on every exit path.
template <typename Client>
class ScopedHandle {
 public:
  using Handle = typename Client::Handle;

  ScopedHandle(Client& client, Handle handle)
      : client_(client), handle_(handle) {}
  ~ScopedHandle() {
    if (handle_ != nullptr) { client_.Free(handle_); }
  }

  ScopedHandle(const ScopedHandle&) = delete;
  ScopedHandle& operator=(const ScopedHandle&) = delete;

  Handle Get() const { return handle_; }

 private:
  Client& client_;
  Handle handle_;
};

}  // namespace detail

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

template <typename Client>
class Driver {
 public:
  using ClientType = Client;
  using Handle = typename Client::Handle;
  using Registry = OpenQueryRegistry<Handle>;

  explicit Driver(QueryCache* cache = nullptr,
                  QueryReporter* reporter = nullptr,
                  DriverOptions options = DriverOptions{})
      : cache_(cache),
        reporter_(reporter),
        options_(options),
        logger_(spdlog::default_logger()) {}

  ~Driver() { Close(); }

  // Move
  Driver(Driver&& other) noexcept
      : client_(std::move(other.client_)),
        registry_(std::move(other.registry_)),
        cache_(other.cache_),
        reporter_(other.reporter_),
        options_(other.options_),
        logger_(std::move(other.logger_)),
        server_(std::move(other.server_)),
        user_(std::move(other.user_)),
        database_(std::move(other.database_)),
        persistent_(other.persistent_),
        connected_once_(other.connected_once_),
        in_transaction_(other.in_transaction_),
        connect_error_(other.connect_error_),
        last_error_(other.last_error_),
        query_result_(other.query_result_),
        last_query_text_(std::move(other.last_query_text_)),
        affected_rows_(other.affected_rows_),
        num_queries_(other.num_queries_),
        num_cached_queries_(other.num_cached_queries_),
        sql_time_(other.sql_time_) {
    other.cache_ = nullptr;
    other.reporter_ = nullptr;
    other.logger_ = spdlog::default_logger();
    other.connected_once_ = false;
    other.in_transaction_ = false;
    other.query_result_ = QueryResult::None();
  }

  Driver& operator=(Driver&& other) noexcept {
    if (this != &other) {
      Close();
      client_ = std::move(other.client_);
      registry_ = std::move(other.registry_);
      cache_ = other.cache_;
      reporter_ = other.reporter_;
      options_ = other.options_;
      logger_ = std::move(other.logger_);
      server_ = std::move(other.server_);
      user_ = std::move(other.user_);
      database_ = std::move(other.database_);
      persistent_ = other.persistent_;
      connected_once_ = other.connected_once_;
      in_transaction_ = other.in_transaction_;
      connect_error_ = other.connect_error_;
      last_error_ = other.last_error_;
      query_result_ = other.query_result_;
      last_query_text_ = std::move(other.last_query_text_);
      affected_rows_ = other.affected_rows_;
      num_queries_ = other.num_queries_;
      num_cached_queries_ = other.num_cached_queries_;
      sql_time_ = other.sql_time_;
      other.cache_ = nullptr;
      other.reporter_ = nullptr;
      other.logger_ = spdlog::default_logger();
      other.connected_once_ = false;
      other.in_transaction_ = false;
      other.query_result_ = QueryResult::None();
    }
    return *this;
  }

  // No copy
  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  // --- Collaborators ---

  void SetCache(QueryCache* cache) { cache_ = cache; }
  void SetReporter(QueryReporter* reporter) { reporter_ = reporter; }
  void SetOptions(const DriverOptions& options) { options_ = options; }
  void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    logger_ = std::move(logger);
  }

  QueryCache* Cache() const { return cache_; }
  const DriverOptions& Options() const { return options_; }

  // --- Connect / Close ---

  /// Connect in persistent or non-persistent mode per params.persistent.
  /// The matching client capability is checked first.
  Error Connect(const ConnectParams& params) {
    Close();

    persistent_ = params.persistent;
    user_ = params.user;
    database_ = params.database;
    server_ = BuildServerString(params);

    Capability cap = params.persistent ? Capability::kPersistentConnect
                                       : Capability::kConnect;
    if (!client_.HasCapability(cap)) {
      connect_error_ = Error::MakeFormat(
          ErrorCode::kConnectivity,
          "%s capability does not exist, is the %s client installed?",
          CapabilityName(cap), Client::Name());
      last_error_ = connect_error_;
      logger_->error("[{}] {}", Client::Name(), connect_error_.message);
      return connect_error_;
    }

    Error err = client_.Connect(server_, params);
    if (!err.ok()) {
      connect_error_ = err;
      connect_error_.code = ErrorCode::kConnectivity;
      last_error_ = connect_error_;
      logger_->error("[{}] connect to '{}' failed: {}", Client::Name(),
                     server_, connect_error_.message);
      return connect_error_;
    }

    connected_once_ = true;
    connect_error_.Clear();
    logger_->info("[{}] connected to '{}'{}", Client::Name(), server_,
                  persistent_ ? " (persistent)" : "");
    return Error::Ok();
  }

  bool IsConnected() const { return client_.IsOpen(); }

  /// Release every open handle and the connection. Always succeeds.
  bool Close() {
    if (!registry_.Empty()) {
      logger_->debug("[{}] releasing {} open result(s) on close",
                     Client::Name(), registry_.Size());
      registry_.Drain([this](Handle h) { client_.Free(h); });
    }
    if (client_.IsOpen()) {
      client_.Close();
      logger_->info("[{}] closed '{}'", Client::Name(), server_);
    }
    in_transaction_ = false;
    query_result_ = QueryResult::None();
    return true;
  }

  // --- Server info ---

  /// Version string of the server. With a cache and use_cache, the value
  /// is memoized under Client::VersionCacheKey() and never expired here.
  std::string ServerInfo(bool raw = false, bool use_cache = true) {
    std::string version;
    bool cached = use_cache && cache_ != nullptr &&
                  cache_->Get(Client::VersionCacheKey(), &version);

    if (!cached) {
      version = QueryVersion();
      if (use_cache && cache_ != nullptr) {
        cache_->Put(Client::VersionCacheKey(), version);
      }
    }

    if (raw) { return version; }
    if (version.empty() || version == "0") { return Client::DisplayName(); }
    return std::string(Client::DisplayName()) + " " + version;
  }

  // --- Query ---

  /// Execute `sql`. With cache_ttl > 0 and a cache, a SELECT rowset is
  /// served from / stored into the cache. Returns a falsy result on failure.
  QueryResult ExecQuery(const std::string& sql, uint32_t cache_ttl = 0) {
    if (sql.empty()) { return QueryResult::None(); }

    last_query_text_ = sql;

    QueryResult result;
    // Only rowsets are cached; a statement always reaches the server.
    bool use_cache =
        cache_ != nullptr && cache_ttl > 0 && IsRowProducing(sql);
    if (use_cache) {
      ResultId id = cache_->SqlLoad(sql);
      if (id.Valid()) { result = QueryResult::Cached(id); }
    }
    AddNumQueries(result.IsCached());

    if (result.IsCached()) {
      logger_->debug("[{}] served from cache: {}", Client::Name(), sql);
      if (options_.instrument == InstrumentMode::kExplain) {
        ReportFromCache(sql);
      }
      query_result_ = result;
      return result;
    }

    double start = 0.0;
    if (options_.instrument == InstrumentMode::kExplain) {
      start = detail::NowSeconds();
      if (reporter_ != nullptr) {
        reporter_->Report(ReportMode::kStart, sql, start);
      }
    } else if (options_.instrument == InstrumentMode::kTiming) {
      start = detail::NowSeconds();
    }

    logger_->debug("[{}] query: {}", Client::Name(), sql);
    ExecResult<Handle> exec = client_.Execute(sql.c_str());
    if (!exec.ok()) {
      Fail(ErrorCode::kExecution, sql, exec.error);
    }

    if (options_.instrument == InstrumentMode::kExplain) {
      if (reporter_ != nullptr) {
        reporter_->Report(ReportMode::kStop, sql, start,
                          detail::NowSeconds());
      }
    } else if (options_.instrument == InstrumentMode::kTiming) {
      sql_time_ += detail::NowSeconds() - start;
    }

    if (!exec.ok()) {
      query_result_ = QueryResult::None();
      return query_result_;
    }

    affected_rows_ = client_.AffectedRows(exec.handle);
    ResultId id = ResultId::FromHandle(exec.handle);

    if (use_cache) {
      // Drain into the cache; the live handle does not outlive this call.
      if (!Register(id, exec.handle, sql)) {
        query_result_ = QueryResult::None();
        return query_result_;
      }
      std::vector<Row> rows = DrainLive(id);
      result = QueryResult::Cached(
          cache_->SqlSave(sql, std::move(rows), cache_ttl));
    } else if (IsRowProducing(sql)) {
      if (!Register(id, exec.handle, sql)) {
        query_result_ = QueryResult::None();
        return query_result_;
      }
      result = QueryResult::Live(id);
    } else {
      client_.Free(exec.handle);
      result = QueryResult::Statement();
    }

    query_result_ = result;
    return result;
  }

  /// Execute with at most `total` rows after skipping `offset` rows.
  /// total == 0 returns all rows (no rewrite).
  QueryResult ExecQueryLimit(const std::string& sql, uint64_t total,
                             uint64_t offset = 0, uint32_t cache_ttl = 0) {
    query_result_ = QueryResult::None();
    if (sql.empty()) { return query_result_; }

    std::string limited;
    uint64_t rows = (total > 0) ? SaturatingRowCount(total, offset) : 0;
    Error err = RewriteRowLimit(sql, rows, Client::kLimitStyle, &limited);
    if (!err.ok()) {
      Fail(ErrorCode::kConfiguration, sql, err);
      return query_result_;
    }

    QueryResult result = ExecQuery(limited, cache_ttl);
    if (result && offset > 0) {
      if (!RowSeek(offset, &result)) {
        // Fewer rows than offset: the page is empty for every source.
        Row skipped;
        while (FetchRow(result, &skipped)) {}
        logger_->debug("[{}] seek to row {} ran past the end: {}",
                       Client::Name(), offset, limited);
      }
      query_result_ = result;
    }
    return result;
  }

  /// Position `result` so the next fetch returns row `row` (0-based).
  /// A live cursor already past `row` is re-executed from the start.
  bool RowSeek(uint64_t row, QueryResult* result) {
    if (result == nullptr) { return false; }

    if (result->IsCached()) {
      return cache_ != nullptr && cache_->SqlRowSeek(result->id, row);
    }
    if (!result->IsLive()) { return false; }

    typename Registry::Entry* entry = registry_.Find(result->id);
    if (entry == nullptr) { return false; }

    if (entry->position > row) {
      std::string query = entry->query;
      FreeResult(*result);
      *result = ExecQuery(query);
      if (!result->IsLive()) { return false; }
      entry = registry_.Find(result->id);
      if (entry == nullptr) { return false; }
    }

    Row skipped;
    while (entry->position < row) {
      if (!FetchRow(*result, &skipped)) { return false; }
    }
    return true;
  }

  // --- Fetch ---

  /// Fetch the next row of the most recent result.
  bool FetchRow(Row* out) { return FetchRow(query_result_, out); }

  /// Fetch the next row. Returns false at end of data and for freed or
  /// invalid results.
  bool FetchRow(const QueryResult& result, Row* out) {
    Row scratch;
    Row* target = (out != nullptr) ? out : &scratch;

    if (result.IsCached()) {
      return cache_ != nullptr && cache_->SqlExists(result.id) &&
             cache_->SqlFetchRow(result.id, target);
    }
    if (!result.IsLive()) { return false; }

    typename Registry::Entry* entry = registry_.Find(result.id);
    if (entry == nullptr) { return false; }
    if (!client_.FetchRow(entry->handle, target)) { return false; }
    registry_.Advance(result.id);
    return true;
  }

  /// Rows changed by the most recent statement; -1 when disconnected.
  int64_t AffectedRows() const {
    return client_.IsOpen() ? affected_rows_ : -1;
  }

  /// Identity generated by the last insert on this connection, -1 if
  /// unavailable. The temporary handle is always released.
  int64_t LastInsertedId() {
    if (!client_.IsOpen()) { return -1; }

    ExecResult<Handle> exec = client_.Execute(Client::IdentityQuery());
    if (!exec.ok()) { return -1; }
    detail::ScopedHandle<Client> guard(client_, exec.handle);

    Row row;
    if (!client_.FetchRow(guard.Get(), &row) || row.FieldIsNull(0)) {
      return -1;
    }
    return row.GetInt64(0, -1);
  }

  // --- Free ---

  void FreeResult() { FreeResult(query_result_); }

  /// Idempotent: freeing twice or freeing an unknown result is a no-op.
  void FreeResult(const QueryResult& result) {
    if (result.IsCached()) {
      if (cache_ != nullptr && cache_->SqlExists(result.id)) {
        cache_->SqlFreeResult(result.id);
      }
      return;
    }
    if (result.IsLive()) {
      Handle handle = registry_.Remove(result.id);
      if (handle != nullptr) { client_.Free(handle); }
    }
  }

  // --- Transaction ---

  /// Issue the begin/commit/rollback statement. A status outside the
  /// three known values is a no-op that reports success.
  bool Transaction(TransactionStatus status) {
    const char* sql = nullptr;
    switch (status) {
      case TransactionStatus::kBegin:    sql = Client::BeginSql(); break;
      case TransactionStatus::kCommit:   sql = Client::CommitSql(); break;
      case TransactionStatus::kRollback: sql = Client::RollbackSql(); break;
    }
    if (sql == nullptr) { return true; }

    ExecResult<Handle> exec = client_.Execute(sql);
    if (!exec.ok()) {
      Fail(ErrorCode::kExecution, sql, exec.error);
      return false;
    }
    client_.Free(exec.handle);
    in_transaction_ = (status == TransactionStatus::kBegin);
    return true;
  }

  bool BeginTransaction() { return Transaction(TransactionStatus::kBegin); }
  bool Commit() { return Transaction(TransactionStatus::kCommit); }
  bool Rollback() { return Transaction(TransactionStatus::kRollback); }
  bool InTransaction() const { return in_transaction_; }

  // --- Errors ---

  /// Last backend-reported error. Before a successful connect this is
  /// the failure captured by Connect().
  Error ReportError() const {
    if (!connected_once_) { return connect_error_; }
    return client_.LastError();
  }

  /// Last failure seen by this driver, including rewrite errors.
  const Error& LastError() const { return last_error_; }

  // --- Statistics ---

  uint32_t NumQueries(bool cached = false) const {
    return cached ? num_cached_queries_ : num_queries_;
  }

  /// Seconds accumulated in InstrumentMode::kTiming.
  double SqlTime() const { return sql_time_; }

  const std::string& LastQueryText() const { return last_query_text_; }
  const QueryResult& CurrentResult() const { return query_result_; }

  const std::string& Server() const { return server_; }
  const std::string& User() const { return user_; }
  const std::string& Database() const { return database_; }
  bool Persistent() const { return persistent_; }

  const Registry& OpenQueries() const { return registry_; }

  /// Access the underlying client.
  Client& Impl() { return client_; }
  const Client& Impl() const { return client_; }

 private:
  void AddNumQueries(bool cached) {
    ++num_queries_;
    if (cached) { ++num_cached_queries_; }
  }

  void Fail(ErrorCode code, const std::string& sql, const Error& detail) {
    last_error_ = detail;
    last_error_.code = code;
    if (last_error_.message[0] == '\0') {
      const Error& client_error = client_.LastError();
      std::strncpy(last_error_.message, client_error.message,
                   Error::kMaxMessageLen - 1);
      std::strncpy(last_error_.native_code, client_error.native_code,
                   Error::kMaxNativeCodeLen - 1);
    }
    logger_->error("[{}] {} [{}]: {}", Client::Name(), last_error_.message,
                   last_error_.native_code, sql);
  }

  bool Register(ResultId id, Handle handle, const std::string& sql) {
    if (registry_.Add(id, handle, sql)) { return true; }
    client_.Free(handle);
    Fail(ErrorCode::kMisuse, sql,
         Error::Make(ErrorCode::kMisuse, "result id already registered"));
    return false;
  }

  /// Fetch every remaining row of a registered handle, then release it.
  std::vector<Row> DrainLive(ResultId id) {
    std::vector<Row> rows;
    Row row;
    while (FetchRow(QueryResult::Live(id), &row)) {
      rows.push_back(std::move(row));
      row.Clear();
    }
    FreeResult(QueryResult::Live(id));
    return rows;
  }

  /// Explain mode: time a live run of a query the cache just served.
  void ReportFromCache(const std::string& sql) {
    if (reporter_ == nullptr) { return; }
    reporter_->Report(ReportMode::kFromCache, sql);

    double start = detail::NowSeconds();
    ExecResult<Handle> exec = client_.Execute(sql.c_str());
    if (exec.ok()) {
      detail::ScopedHandle<Client> guard(client_, exec.handle);
      Row row;
      while (client_.FetchRow(guard.Get(), &row)) {
        row.Clear();
      }
    }
    reporter_->Report(ReportMode::kRecordFromCache, sql, start,
                      detail::NowSeconds());
  }

  std::string QueryVersion() {
    ExecResult<Handle> exec = client_.Execute(Client::VersionQuery());
    if (!exec.ok()) { return "0"; }
    detail::ScopedHandle<Client> guard(client_, exec.handle);

    Row row;
    if (!client_.FetchRow(guard.Get(), &row)) { return "0"; }

    std::string version;
    for (int32_t i = 0; i < row.NumFields(); ++i) {
      if (row.FieldIsNull(i)) { continue; }
      std::string part = detail::Trim(row.GetString(i));
      if (part.empty()) { continue; }
      if (!version.empty()) { version += ' '; }
      version += part;
    }
    return version.empty() ? "0" : version;
  }

  Client client_;
  Registry registry_;
  QueryCache* cache_ = nullptr;
  QueryReporter* reporter_ = nullptr;
  DriverOptions options_;
  std::shared_ptr<spdlog::logger> logger_;

  std::string server_;
  std::string user_;
  std::string database_;
  bool persistent_ = false;
  bool connected_once_ = false;
  bool in_transaction_ = false;

  Error connect_error_;
  Error last_error_;

  QueryResult query_result_;
  std::string last_query_text_;
  int64_t affected_rows_ = 0;

  uint32_t num_queries_ = 0;
  uint32_t num_cached_queries_ = 0;
  double sql_time_ = 0.0;
};

}  // namespace dbal

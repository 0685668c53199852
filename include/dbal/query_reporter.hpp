// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::QueryReporter -- explain-mode profiling hook.
//
// Driver calls, in explain mode:
//   kStart            before a live execution      (start)
//   kStop             after it                     (start, split)
//   kFromCache        when the cache served it
//   kRecordFromCache  timing of a live re-run of a cached query
//                                                  (start, split)
// Times are seconds on std::chrono::steady_clock.

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace dbal {

enum class ReportMode : uint8_t {
  kStart = 0,
  kStop,
  kFromCache,
  kRecordFromCache,
};

inline const char* ReportModeName(ReportMode mode) {
  switch (mode) {
    case ReportMode::kStart:           return "start";
    case ReportMode::kStop:            return "stop";
    case ReportMode::kFromCache:       return "fromcache";
    case ReportMode::kRecordFromCache: return "record_fromcache";
  }
  return "unknown";
}

class QueryReporter {
 public:
  virtual ~QueryReporter() = default;

  virtual void Report(ReportMode mode, const std::string& query,
                      double start = 0.0, double split = 0.0) = 0;
};

// ---------------------------------------------------------------------------
// LogReporter -- writes reports to an spdlog logger and keeps totals
// ---------------------------------------------------------------------------

class LogReporter : public QueryReporter {
 public:
  LogReporter() : logger_(spdlog::default_logger()) {}
  explicit LogReporter(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  void Report(ReportMode mode, const std::string& query, double start,
              double split) override {
    switch (mode) {
      case ReportMode::kStart:
        logger_->debug("[explain] start: {}", query);
        break;

      case ReportMode::kStop: {
        double elapsed = split - start;
        ++num_queries_;
        sql_time_ += elapsed;
        logger_->info("[explain] {:.6f}s: {}", elapsed, query);
        break;
      }

      case ReportMode::kFromCache:
        ++num_queries_;
        ++num_cached_;
        logger_->info("[explain] served from cache: {}", query);
        break;

      case ReportMode::kRecordFromCache: {
        double elapsed = split - start;
        saved_time_ += elapsed;
        logger_->info("[explain] cache saved {:.6f}s: {}", elapsed, query);
        break;
      }
    }
  }

  uint32_t NumQueries() const { return num_queries_; }
  uint32_t NumCached() const { return num_cached_; }
  /// Seconds spent in live executions.
  double SqlTime() const { return sql_time_; }
  /// Seconds the cache saved, measured by re-running cached queries.
  double SavedTime() const { return saved_time_; }

 private:
  std::shared_ptr<spdlog::logger> logger_;
  uint32_t num_queries_ = 0;
  uint32_t num_cached_ = 0;
  double sql_time_ = 0.0;
  double saved_time_ = 0.0;
};

}  // namespace dbal

// Copyright (c) 2024 liudegui. MIT License.
//
// dbal row-limit rewriter -- "limit N, skip M" as text rewrite + seek.
//
// Design:
//   - Pure functions, no backend state
//   - The rewrite asks for total + offset rows; the driver then seeks
//     forward offset rows so the cursor lands on the first wanted row
//   - kTop inserts "TOP n" after SELECT (after SELECT DISTINCT when present)
//   - kLimitClause appends "LIMIT n"
//   - rows == 0 means "all rows" and leaves the text untouched

#pragma once

#include <cctype>
#include <cstdint>
#include <string>

#include "dbal/error.hpp"

namespace dbal {

enum class LimitStyle : uint8_t {
  kTop = 0,      // SELECT [DISTINCT] TOP n ...
  kLimitClause,  // SELECT ... LIMIT n
};

/// total + offset, saturating at UINT64_MAX.
inline uint64_t SaturatingRowCount(uint64_t total, uint64_t offset) {
  return (offset > UINT64_MAX - total) ? UINT64_MAX : total + offset;
}

namespace detail {

inline size_t SkipSpace(const std::string& s, size_t pos) {
  while (pos < s.size() &&
         std::isspace(static_cast<unsigned char>(s[pos]))) {
    ++pos;
  }
  return pos;
}

/// Matches keyword at pos (case-insensitive) followed by a word boundary.
/// Returns the position just past the keyword, or npos.
inline size_t MatchKeyword(const std::string& s, size_t pos,
                           const char* keyword) {
  size_t i = pos;
  for (const char* k = keyword; *k != '\0'; ++k, ++i) {
    if (i >= s.size() ||
        std::toupper(static_cast<unsigned char>(s[i])) != *k) {
      return std::string::npos;
    }
  }
  if (i < s.size()) {
    unsigned char next = static_cast<unsigned char>(s[i]);
    if (std::isalnum(next) || next == '_') { return std::string::npos; }
  }
  return i;
}

}  // namespace detail

/// True when the statement starts with SELECT (ignoring case and leading
/// whitespace). Used to decide whether a live handle carries a rowset.
inline bool IsRowProducing(const std::string& sql) {
  return detail::MatchKeyword(sql, detail::SkipSpace(sql, 0), "SELECT") !=
         std::string::npos;
}

/// Rewrite a single SELECT [DISTINCT] statement to return at most `rows`
/// rows. rows == 0 copies the statement verbatim.
inline Error RewriteRowLimit(const std::string& sql, uint64_t rows,
                             LimitStyle style, std::string* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "output is null");
  }
  if (rows == 0) {
    *out = sql;
    return Error::Ok();
  }

  size_t start = detail::SkipSpace(sql, 0);
  size_t after_select = detail::MatchKeyword(sql, start, "SELECT");
  if (after_select == std::string::npos) {
    return Error::Make(ErrorCode::kConfiguration,
                       "row limit requires a SELECT statement");
  }

  std::string count = std::to_string(rows);

  if (style == LimitStyle::kLimitClause) {
    size_t end = sql.size();
    while (end > start &&
           (sql[end - 1] == ';' ||
            std::isspace(static_cast<unsigned char>(sql[end - 1])))) {
      --end;
    }
    *out = sql.substr(0, end) + " LIMIT " + count;
    return Error::Ok();
  }

  // kTop: keep "SELECT" / "SELECT DISTINCT" as written, then TOP n.
  size_t head_end = after_select;
  size_t distinct_pos = detail::SkipSpace(sql, after_select);
  size_t after_distinct = detail::MatchKeyword(sql, distinct_pos, "DISTINCT");
  if (after_distinct != std::string::npos) {
    head_end = after_distinct;
  }
  size_t rest = detail::SkipSpace(sql, head_end);

  std::string rewritten = sql.substr(0, head_end);
  rewritten += " TOP ";
  rewritten += count;
  if (rest < sql.size()) {
    rewritten += ' ';
    rewritten.append(sql, rest, std::string::npos);
  }
  *out = rewritten;
  return Error::Ok();
}

}  // namespace dbal

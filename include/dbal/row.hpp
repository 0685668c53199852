// Copyright (c) 2024 liudegui. MIT License.
//
// dbal::Value / dbal::Row -- owned snapshot of one fetched row.
//
// Design:
//   - Row keeps columns in the order the engine returned them
//   - Value keeps the engine's storage class (null/integer/real/text/blob)
//   - Owning copies, so rows outlive the handle they came from and can be
//     stored by a QueryCache

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace dbal {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kInteger,
  kReal,
  kText,
  kBlob,
};

class Value {
 public:
  Value() = default;

  static Value Null() { return Value{}; }

  static Value Integer(int64_t v) {
    Value out;
    out.type_ = ValueType::kInteger;
    out.int_ = v;
    return out;
  }

  static Value Real(double v) {
    Value out;
    out.type_ = ValueType::kReal;
    out.real_ = v;
    return out;
  }

  static Value Text(std::string v) {
    Value out;
    out.type_ = ValueType::kText;
    out.bytes_ = std::move(v);
    return out;
  }

  static Value Blob(const uint8_t* data, size_t len) {
    Value out;
    out.type_ = ValueType::kBlob;
    if (data != nullptr && len > 0) {
      out.bytes_.assign(reinterpret_cast<const char*>(data), len);
    }
    return out;
  }

  ValueType Type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  int64_t AsInt64(int64_t null_value = 0) const {
    switch (type_) {
      case ValueType::kInteger: return int_;
      case ValueType::kReal:    return static_cast<int64_t>(real_);
      case ValueType::kText:    return std::strtoll(bytes_.c_str(), nullptr, 10);
      default:                  return null_value;
    }
  }

  double AsDouble(double null_value = 0.0) const {
    switch (type_) {
      case ValueType::kInteger: return static_cast<double>(int_);
      case ValueType::kReal:    return real_;
      case ValueType::kText:    return std::strtod(bytes_.c_str(), nullptr);
      default:                  return null_value;
    }
  }

  /// Text rendering. Integers and reals are formatted, blobs are returned raw.
  std::string AsString(const char* null_value = "") const {
    switch (type_) {
      case ValueType::kNull:
        return null_value != nullptr ? null_value : "";
      case ValueType::kInteger:
        return std::to_string(int_);
      case ValueType::kReal: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", real_);
        return buf;
      }
      default:
        return bytes_;
    }
  }

  const std::string& Bytes() const { return bytes_; }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull:    return true;
      case ValueType::kInteger: return int_ == other.int_;
      case ValueType::kReal:    return real_ == other.real_;
      default:                  return bytes_ == other.bytes_;
    }
  }
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double real_ = 0.0;
  std::string bytes_;
};

// ---------------------------------------------------------------------------
// Row
// ---------------------------------------------------------------------------

class Row {
 public:
  Row() = default;

  void Clear() {
    names_.clear();
    values_.clear();
  }

  void Append(std::string name, Value value) {
    names_.push_back(std::move(name));
    values_.push_back(std::move(value));
  }

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }
  bool Empty() const { return values_.empty(); }

  int32_t FieldIndex(const char* name) const {
    if (name == nullptr) { return -1; }
    for (size_t i = 0; i < names_.size(); ++i) {
      if (names_[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return names_[static_cast<size_t>(col)].c_str();
  }

  /// Returns nullptr for an out-of-range column.
  const Value* Field(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return &values_[static_cast<size_t>(col)];
  }

  const Value* Field(const char* name) const {
    return Field(FieldIndex(name));
  }

  bool FieldIsNull(int32_t col) const {
    const Value* v = Field(col);
    return v == nullptr || v->IsNull();
  }

  // --- Typed accessors ---

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    const Value* v = Field(col);
    return (v != nullptr && !v->IsNull()) ? v->AsInt64(null_value)
                                          : null_value;
  }

  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    return GetInt64(FieldIndex(name), null_value);
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    const Value* v = Field(col);
    return (v != nullptr && !v->IsNull()) ? v->AsDouble(null_value)
                                          : null_value;
  }

  std::string GetString(int32_t col, const char* null_value = "") const {
    const Value* v = Field(col);
    if (v == nullptr) { return null_value != nullptr ? null_value : ""; }
    return v->AsString(null_value);
  }

  std::string GetString(const char* name, const char* null_value = "") const {
    return GetString(FieldIndex(name), null_value);
  }

  bool operator==(const Row& other) const {
    return names_ == other.names_ && values_ == other.values_;
  }
  bool operator!=(const Row& other) const { return !(*this == other); }

 private:
  std::vector<std::string> names_;
  std::vector<Value> values_;
};

}  // namespace dbal

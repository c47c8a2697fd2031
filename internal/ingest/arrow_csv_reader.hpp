#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"

namespace cadence::ingest {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Loads a communication log from CSV into a RawTable.

  The mapped timestamp / counterparty / direction columns are read as utf8
  so values reach validation exactly as written; other columns are rendered
  through their Arrow scalar representation. Null cells become "".
*/
class ArrowCsvReader {
 public:
  // Throws util::NotFound when the file does not exist, std::runtime_error
  // on a parse failure.
  static RawTable Read(const std::string& path, const ColumnMapping& mapping = {});
};

} // namespace cadence::ingest

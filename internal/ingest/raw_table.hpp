#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cadence::ingest {

struct RawColumn {
  std::string              name;
  std::vector<std::string> values;
};

/*
  Column-oriented table of string cells.

  Neutral form produced by the CSV loader and the gRPC transport before any
  typing or validation happens.
*/
class RawTable {
 public:
  // Replaces an existing column with the same name.
  void AddColumn(std::string name, std::vector<std::string> values) {
    for (auto& column : columns_) {
      if (column.name == name) {
        column.values = std::move(values);
        return;
      }
    }
    columns_.push_back(RawColumn{std::move(name), std::move(values)});
  }

  const RawColumn* FindColumn(std::string_view name) const {
    for (const auto& column : columns_) {
      if (column.name == name) {
        return &column;
      }
    }
    return nullptr;
  }

  std::size_t RowCount() const {
    std::size_t rows = 0;
    for (const auto& column : columns_) {
      rows = std::max(rows, column.values.size());
    }
    return rows;
  }

  bool Empty() const {
    return RowCount() == 0;
  }

  const std::vector<RawColumn>& columns() const {
    return columns_;
  }

 private:
  std::vector<RawColumn> columns_;
};

} // namespace cadence::ingest

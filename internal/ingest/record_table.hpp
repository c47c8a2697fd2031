#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"
#include "internal/model/record.hpp"

namespace cadence::ingest {

/*
  Validated, typed record set. Records keep their input order; positions are
  their identity. Sorting is exposed as stable index views so ties keep
  input order.
*/
class RecordTable {
 public:
  RecordTable() = default;
  explicit RecordTable(std::vector<cadence::model::Record> records);

  const std::vector<cadence::model::Record>& records() const {
    return records_;
  }

  const cadence::model::Record& operator[](std::size_t index) const {
    return records_[index];
  }

  std::size_t size() const {
    return records_.size();
  }

  bool empty() const {
    return records_.empty();
  }

  std::vector<std::size_t> SortedByTime() const;
  std::vector<std::size_t> SortedByCounterpartyThenTime() const;

  // Time-sorted positions of one counterparty's records.
  std::vector<std::size_t> IndicesFor(std::string_view counterparty) const;

  // Distinct counterparties in lexical order.
  std::vector<std::string> Counterparties() const;

 private:
  std::vector<cadence::model::Record> records_;
};

class RecordTableBuilder {
 public:
  // Throws util::ValidationError describing the first failed check.
  static RecordTable Build(const RawTable& table, const ColumnMapping& mapping);
};

} // namespace cadence::ingest

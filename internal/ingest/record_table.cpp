#include "internal/ingest/record_table.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cadence::ingest {
namespace {

using cadence::model::Direction;
using cadence::model::Record;
using cadence::util::ValidationError;

const std::string& CellAt(const RawColumn& column, std::size_t row) {
  static const std::string kEmpty;
  return row < column.values.size() ? column.values[row] : kEmpty;
}

std::string JoinNames(const std::vector<std::string>& names, std::string_view open, std::string_view close) {
  std::string out(open);
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += names[i];
  }
  out += close;
  return out;
}

} // namespace

RecordTable::RecordTable(std::vector<Record> records) : records_(std::move(records)) {
}

std::vector<std::size_t> RecordTable::SortedByTime() const {
  std::vector<std::size_t> order(records_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) { return records_[a].timestamp < records_[b].timestamp; });
  return order;
}

std::vector<std::size_t> RecordTable::SortedByCounterpartyThenTime() const {
  std::vector<std::size_t> order(records_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
    const auto& lhs = records_[a];
    const auto& rhs = records_[b];
    if (lhs.counterparty != rhs.counterparty) {
      return lhs.counterparty < rhs.counterparty;
    }
    return lhs.timestamp < rhs.timestamp;
  });
  return order;
}

std::vector<std::size_t> RecordTable::IndicesFor(std::string_view counterparty) const {
  std::vector<std::size_t> out;
  for (auto index : SortedByTime()) {
    if (records_[index].counterparty == counterparty) {
      out.push_back(index);
    }
  }
  return out;
}

std::vector<std::string> RecordTable::Counterparties() const {
  std::set<std::string> distinct;
  for (const auto& record : records_) {
    distinct.insert(record.counterparty);
  }
  return {distinct.begin(), distinct.end()};
}

// ------------------------------------------------------------
// RecordTableBuilder
// ------------------------------------------------------------

RecordTable RecordTableBuilder::Build(const RawTable& table, const ColumnMapping& mapping) {
  const auto rows = table.RowCount();
  if (rows == 0) {
    throw ValidationError("empty data provided for analysis");
  }

  const RawColumn* timestamp_column    = table.FindColumn(mapping.timestamp_column());
  const RawColumn* counterparty_column = table.FindColumn(mapping.counterparty_column());
  const RawColumn* direction_column    = table.FindColumn(mapping.direction_column());

  std::vector<std::string> missing;
  if (timestamp_column == nullptr) {
    missing.emplace_back(ColumnMapping::kTimestamp);
  }
  if (counterparty_column == nullptr) {
    missing.emplace_back(ColumnMapping::kCounterparty);
  }
  if (direction_column == nullptr) {
    missing.emplace_back(ColumnMapping::kDirection);
  }
  if (!missing.empty()) {
    throw ValidationError("missing required columns: " + JoinNames(missing, "[", "]"));
  }

  std::vector<Direction> directions(rows, Direction::kSent);
  std::set<std::string>  invalid_directions;
  for (std::size_t row = 0; row < rows; ++row) {
    const auto& raw    = CellAt(*direction_column, row);
    auto        parsed = cadence::model::ParseDirection(raw);
    if (!parsed) {
      invalid_directions.insert(raw);
      continue;
    }
    directions[row] = *parsed;
  }
  if (!invalid_directions.empty()) {
    throw ValidationError("invalid direction value(s): " +
                          JoinNames(std::vector<std::string>(invalid_directions.begin(), invalid_directions.end()), "{", "}"));
  }

  std::vector<Record> records;
  records.reserve(rows);
  for (std::size_t row = 0; row < rows; ++row) {
    const auto& raw_time = CellAt(*timestamp_column, row);
    auto        parsed   = cadence::util::ParseTimestamp(raw_time);
    if (!parsed) {
      throw ValidationError("invalid timestamp format: '" + raw_time + "' at row " + std::to_string(row));
    }
    records.push_back(Record{*parsed, CellAt(*counterparty_column, row), directions[row]});
  }

  return RecordTable(std::move(records));
}

} // namespace cadence::ingest

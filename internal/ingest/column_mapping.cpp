#include "internal/ingest/column_mapping.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace cadence::ingest {

ColumnMapping ColumnMapping::FromMap(const std::map<std::string, std::string>& aliases) {
  ColumnMapping mapping;
  for (const auto& [key, column] : aliases) {
    mapping.Set(key, column);
  }
  return mapping;
}

void ColumnMapping::Set(std::string_view key, std::string column) {
  if (column.empty()) {
    throw cadence::util::InvalidArgument("column mapping for '" + std::string(key) + "' is empty");
  }

  if (key == kTimestamp) {
    timestamp_ = std::move(column);
  } else if (key == kCounterparty || key == "phone_number") {
    counterparty_ = std::move(column);
  } else if (key == kDirection || key == "message_type") {
    direction_ = std::move(column);
  } else {
    throw cadence::util::InvalidArgument("unknown column mapping key: " + std::string(key));
  }
}

std::map<std::string, std::string> ColumnMapping::ToMap() const {
  return {
      {std::string(kTimestamp), timestamp_},
      {std::string(kCounterparty), counterparty_},
      {std::string(kDirection), direction_},
  };
}

} // namespace cadence::ingest

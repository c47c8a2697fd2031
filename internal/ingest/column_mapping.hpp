#pragma once

#include <map>
#include <string>
#include <string_view>

namespace cadence::ingest {

/*
  Maps the standard field names onto the column names of a concrete source.

  Standard keys are timestamp, counterparty_id and direction; the legacy keys
  phone_number and message_type are accepted as aliases. A key that is not
  mapped resolves to its own standard name.
*/
class ColumnMapping {
 public:
  static constexpr std::string_view kTimestamp    = "timestamp";
  static constexpr std::string_view kCounterparty = "counterparty_id";
  static constexpr std::string_view kDirection    = "direction";

  ColumnMapping() = default;

  // Throws util::InvalidArgument on an unknown key or an empty column name.
  static ColumnMapping FromMap(const std::map<std::string, std::string>& aliases);

  void Set(std::string_view key, std::string column);

  const std::string& timestamp_column() const {
    return timestamp_;
  }
  const std::string& counterparty_column() const {
    return counterparty_;
  }
  const std::string& direction_column() const {
    return direction_;
  }

  // Standard key -> column name, every key present.
  std::map<std::string, std::string> ToMap() const;

 private:
  std::string timestamp_{kTimestamp};
  std::string counterparty_{kCounterparty};
  std::string direction_{kDirection};
};

} // namespace cadence::ingest

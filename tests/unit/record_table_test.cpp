#include "internal/ingest/record_table.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"
#include "internal/util/errors.hpp"

namespace {

using cadence::ingest::ColumnMapping;
using cadence::ingest::RawTable;
using cadence::ingest::RecordTableBuilder;
using cadence::model::Direction;

RawTable MakeTable(std::vector<std::string> times, std::vector<std::string> counterparties, std::vector<std::string> directions) {
  RawTable table;
  table.AddColumn("timestamp", std::move(times));
  table.AddColumn("counterparty_id", std::move(counterparties));
  table.AddColumn("direction", std::move(directions));
  return table;
}

std::string BuildError(const RawTable& table, const ColumnMapping& mapping = {}) {
  try {
    (void)RecordTableBuilder::Build(table, mapping);
  } catch (const cadence::util::ValidationError& e) {
    return e.what();
  }
  return "";
}

void TestBuildParsesRecordsInInputOrder() {
  const auto table = RecordTableBuilder::Build(
      MakeTable({"2023-01-01 10:05:00", "2023-01-01 10:00:00", "2023-01-01 10:00:00"}, {"b", "a", "a"}, {"sent", "received", "sent"}), {});

  assert(table.size() == 3);
  assert(table[0].counterparty == "b");
  assert(table[1].direction == Direction::kReceived);

  // Identical timestamps keep input order.
  assert(table.SortedByTime() == std::vector<std::size_t>({1, 2, 0}));
  assert(table.SortedByCounterpartyThenTime() == std::vector<std::size_t>({1, 2, 0}));
  assert(table.IndicesFor("a") == std::vector<std::size_t>({1, 2}));
  assert(table.IndicesFor("missing").empty());
  assert(table.Counterparties() == std::vector<std::string>({"a", "b"}));
}

void TestBuildRejectsEmptyInput() {
  assert(BuildError(RawTable{}) == "empty data provided for analysis");
  assert(BuildError(MakeTable({}, {}, {})) == "empty data provided for analysis");
}

void TestBuildReportsMissingColumnsByStandardName() {
  RawTable table;
  table.AddColumn("timestamp", {"2023-01-01"});
  assert(BuildError(table) == "missing required columns: [counterparty_id, direction]");
}

void TestBuildRejectsDirectionsOtherThanExactSentReceived() {
  const auto table = MakeTable({"2023-01-01", "2023-01-01", "2023-01-01", "2023-01-01"}, {"a", "a", "a", "a"}, {"Sent", "sent", "outgoing", "Sent"});
  assert(BuildError(table) == "invalid direction value(s): {Sent, outgoing}");
}

void TestBuildReportsFirstUnparsableTimestamp() {
  const auto table = MakeTable({"2023-01-01 10:00", "yesterday", "also bad"}, {"a", "a", "a"}, {"sent", "sent", "received"});
  assert(BuildError(table) == "invalid timestamp format: 'yesterday' at row 1");
}

void TestMappingResolvesAliasesAndLegacyKeys() {
  RawTable table;
  table.AddColumn("time", {"2023-01-01 09:00"});
  table.AddColumn("phone", {"555-0100"});
  table.AddColumn("kind", {"received"});

  const auto mapping = ColumnMapping::FromMap({{"timestamp", "time"}, {"phone_number", "phone"}, {"message_type", "kind"}});
  assert(mapping.counterparty_column() == "phone");
  assert(mapping.ToMap().at("direction") == "kind");

  const auto records = RecordTableBuilder::Build(table, mapping);
  assert(records.size() == 1);
  assert(records[0].counterparty == "555-0100");

  bool threw = false;
  try {
    (void)ColumnMapping::FromMap({{"contact", "phone"}});
  } catch (const cadence::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildParsesRecordsInInputOrder();
  TestBuildRejectsEmptyInput();
  TestBuildReportsMissingColumnsByStandardName();
  TestBuildRejectsDirectionsOtherThanExactSentReceived();
  TestBuildReportsFirstUnparsableTimestamp();
  TestMappingResolvesAliasesAndLegacyKeys();

  std::cout << "cadence_unit_ingest: pass\n";
  return 0;
}

#include "internal/ingest/arrow_csv_reader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/ingest/record_table.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteCsv(const std::string& test_name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cadence_arrow_csv_reader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".csv");
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

void TestReadKeepsMappedColumnsAsWrittenText() {
  const auto path = WriteCsv("mapped", "when,contact,kind,length\n"
                                       "2023-01-01 10:00:00,0100,received,12\n"
                                       "2023-01-01 10:02:00,0100,sent,\n");

  const auto mapping = cadence::ingest::ColumnMapping::FromMap({{"timestamp", "when"}, {"counterparty_id", "contact"}, {"direction", "kind"}});
  const auto raw     = cadence::ingest::ArrowCsvReader::Read(path.string(), mapping);

  assert(raw.RowCount() == 2);
  const auto* contact = raw.FindColumn("contact");
  assert(contact != nullptr);
  // Leading zeros survive because mapped columns are never inferred as numbers.
  assert(contact->values[0] == "0100");
  assert(raw.FindColumn("when")->values[1] == "2023-01-01 10:02:00");

  const auto* length = raw.FindColumn("length");
  assert(length != nullptr);
  assert(length->values[0] == "12");
  assert(length->values[1].empty());

  const auto records = cadence::ingest::RecordTableBuilder::Build(raw, mapping);
  assert(records.size() == 2);
  assert(records[1].direction == cadence::model::Direction::kSent);
}

void TestMissingFileIsNotFound() {
  bool threw = false;
  try {
    (void)cadence::ingest::ArrowCsvReader::Read("/nonexistent/cadence/log.csv");
  } catch (const cadence::util::NotFound& e) {
    threw = std::string(e.what()).find("csv file not found") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReadKeepsMappedColumnsAsWrittenText();
  TestMissingFileIsNotFound();

  std::cout << "cadence_unit_arrow_csv_reader: pass\n";
  return 0;
}

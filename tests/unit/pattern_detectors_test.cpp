#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/patterns/contact_pattern_detector.hpp"
#include "internal/patterns/time_pattern_detector.hpp"

namespace {

using cadence::ingest::RecordTable;
using cadence::model::Direction;
using cadence::model::Record;

Record MakeRecord(std::string_view time, std::string counterparty, Direction direction) {
  auto parsed = cadence::util::ParseTimestamp(time);
  assert(parsed.has_value());
  return Record{*parsed, std::move(counterparty), direction};
}

void AddRecords(std::vector<Record>& out, const std::string& counterparty, int sent, int received) {
  for (int i = 0; i < sent + received; ++i) {
    const auto time = "2023-01-02 1" + std::to_string(i % 10) + ":00:00";
    out.push_back(MakeRecord(time, counterparty, i < sent ? Direction::kSent : Direction::kReceived));
  }
}

void TestTimeOfDayBuckets() {
  using cadence::patterns::TimeOfDay;
  assert(TimeOfDay(4) == "night");
  assert(TimeOfDay(5) == "morning");
  assert(TimeOfDay(12) == "afternoon");
  assert(TimeOfDay(17) == "evening");
  assert(TimeOfDay(22) == "night");
}

// Monday 2023-01-02 and Saturday 2023-01-07, ten records.
void TestTimePatterns() {
  const RecordTable table({
      MakeRecord("2023-01-02 10:00:00", "a", Direction::kSent),
      MakeRecord("2023-01-02 10:10:00", "a", Direction::kReceived),
      MakeRecord("2023-01-02 10:20:00", "a", Direction::kSent),
      MakeRecord("2023-01-02 10:30:00", "a", Direction::kReceived),
      MakeRecord("2023-01-02 15:00:00", "b", Direction::kSent),
      MakeRecord("2023-01-07 08:00:00", "b", Direction::kSent),
      MakeRecord("2023-01-07 09:00:00", "b", Direction::kSent),
      MakeRecord("2023-01-07 11:00:00", "b", Direction::kSent),
      MakeRecord("2023-01-07 13:00:00", "b", Direction::kSent),
      MakeRecord("2023-01-07 20:00:00", "b", Direction::kSent),
  });

  cadence::patterns::TimePatternDetector detector;
  assert(detector.Name() == "TimePatternDetector");

  const auto output = detector.Analyze(table);
  assert(!output.error);
  assert(output.anomalies.empty());
  assert(output.patterns.size() == 4);

  const auto& hour = output.patterns[0];
  assert(hour.pattern_type == "time");
  assert(hour.subtype == "hour");
  assert(hour.occurrences == 4);
  assert(std::abs(*hour.confidence - 0.6) < 1e-9);
  assert(hour.metadata.at("hour") == 10.0);
  assert(hour.description == "Frequent communication during the morning (around 10:00)");

  const auto& monday = output.patterns[1];
  assert(monday.subtype == "day");
  assert(monday.metadata.at("day") == 0.0);
  assert(monday.metadata.at("is_weekend") == 0.0);
  assert(*monday.confidence == 1.0);
  assert(monday.description == "Frequent communication on Mondays");

  const auto& saturday = output.patterns[2];
  assert(saturday.metadata.at("day") == 5.0);
  assert(saturday.metadata.at("is_weekend") == 1.0);

  const auto& slot = output.patterns[3];
  assert(slot.subtype == "day_hour");
  assert(slot.occurrences == 4);
  assert(slot.metadata.at("hour") == 10.0);
}

void TestTimePatternsOnEmptyInput() {
  cadence::patterns::TimePatternDetector detector;
  assert(detector.Analyze(RecordTable{}).patterns.empty());
}

void TestContactDirectionDominance() {
  std::vector<Record> records;
  AddRecords(records, "a", 6, 1);
  AddRecords(records, "b", 4, 0);
  AddRecords(records, "c", 3, 2);
  AddRecords(records, "d", 1, 4);
  AddRecords(records, "e", 7, 3);

  cadence::patterns::ContactPatternDetector detector;
  assert(detector.Name() == "ContactPatternDetector");

  const auto output = detector.Analyze(RecordTable(std::move(records)));
  assert(output.patterns.size() == 3);

  const auto& a = output.patterns[0];
  assert(a.pattern_type == "interaction");
  assert(a.subtype == "direction");
  assert(a.counterparty == "a");
  assert(a.occurrences == 6);
  assert(std::abs(*a.confidence - 6.0 / 7.0) < 1e-9);
  assert(a.description == "Mostly outgoing communication with a");

  const auto& d = output.patterns[1];
  assert(d.counterparty == "d");
  assert(d.occurrences == 4);
  assert(d.description == "Mostly incoming communication with d");

  // A share of exactly 0.7 counts as dominant.
  const auto& e = output.patterns[2];
  assert(e.counterparty == "e");
  assert(e.occurrences == 7);
  assert(*e.confidence == 0.7);
}

} // namespace

int main() {
  TestTimeOfDayBuckets();
  TestTimePatterns();
  TestTimePatternsOnEmptyInput();
  TestContactDirectionDominance();

  std::cout << "cadence_unit_pattern_detectors: pass\n";
  return 0;
}

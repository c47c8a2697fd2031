#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::collaborators {

struct DetectorOutput {
  std::vector<cadence::model::Pattern> patterns;
  std::vector<cadence::model::Anomaly> anomalies;
  std::optional<std::string>           error;
};

/*
  A pattern source run next to the response analyzer (gap, overlap,
  seasonality, time-of-day, contact behaviour, ...). The orchestrator
  isolates each one: a thrown exception or a set error becomes an entry in
  the report's error list and never aborts detection.
*/
class SiblingDetector {
 public:
  virtual ~SiblingDetector() = default;

  virtual std::string_view Name() const = 0;

  virtual DetectorOutput Analyze(const cadence::ingest::RecordTable& records) = 0;
};

} // namespace cadence::collaborators

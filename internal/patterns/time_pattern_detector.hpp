#pragma once

#include <string_view>

#include "internal/collaborators/sibling_detector.hpp"

namespace cadence::patterns {

/*
  Peaks in when communication happens: busy hours, busy weekdays and busy
  weekday/hour slots over all records.
*/
class TimePatternDetector final : public cadence::collaborators::SiblingDetector {
 public:
  std::string_view Name() const override {
    return "TimePatternDetector";
  }

  cadence::collaborators::DetectorOutput Analyze(const cadence::ingest::RecordTable& records) override;
};

// morning [5,12), afternoon [12,17), evening [17,22), night otherwise.
std::string_view TimeOfDay(int hour);

} // namespace cadence::patterns

#pragma once

#include <string_view>

#include "internal/collaborators/sibling_detector.hpp"

namespace cadence::patterns {

/*
  Per-counterparty direction dominance: with at least five records, a share
  of 0.7 or more in one direction is reported as mostly outgoing or mostly
  incoming communication.
*/
class ContactPatternDetector final : public cadence::collaborators::SiblingDetector {
 public:
  std::string_view Name() const override {
    return "ContactPatternDetector";
  }

  cadence::collaborators::DetectorOutput Analyze(const cadence::ingest::RecordTable& records) override;
};

} // namespace cadence::patterns

#include "internal/patterns/contact_pattern_detector.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace cadence::patterns {
namespace {

constexpr std::size_t kMinRecords    = 5;
constexpr double      kDominantShare = 0.7;

struct DirectionCounts {
  std::size_t sent{0};
  std::size_t received{0};
};

} // namespace

cadence::collaborators::DetectorOutput ContactPatternDetector::Analyze(const cadence::ingest::RecordTable& records) {
  std::map<std::string, DirectionCounts> counts;
  for (const auto& record : records.records()) {
    auto& entry = counts[record.counterparty];
    if (record.direction == cadence::model::Direction::kSent) {
      ++entry.sent;
    } else {
      ++entry.received;
    }
  }

  cadence::collaborators::DetectorOutput output;
  for (const auto& [counterparty, entry] : counts) {
    const auto total = entry.sent + entry.received;
    if (total < kMinRecords) {
      continue;
    }

    const double sent_share     = static_cast<double>(entry.sent) / static_cast<double>(total);
    const double received_share = static_cast<double>(entry.received) / static_cast<double>(total);

    cadence::model::Pattern pattern;
    pattern.pattern_type = "interaction";
    pattern.subtype      = "direction";
    pattern.counterparty = counterparty;
    if (sent_share >= kDominantShare) {
      pattern.description = fmt::format("Mostly outgoing communication with {}", counterparty);
      pattern.confidence  = sent_share;
      pattern.occurrences = entry.sent;
    } else if (received_share >= kDominantShare) {
      pattern.description = fmt::format("Mostly incoming communication with {}", counterparty);
      pattern.confidence  = received_share;
      pattern.occurrences = entry.received;
    } else {
      continue;
    }
    pattern.metadata["sent_share"]     = sent_share;
    pattern.metadata["received_share"] = received_share;
    output.patterns.push_back(std::move(pattern));
  }
  return output;
}

} // namespace cadence::patterns

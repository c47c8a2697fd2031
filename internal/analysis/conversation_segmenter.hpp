#pragma once

#include <cstddef>
#include <vector>

#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::analysis {

/*
  Splits a time-ordered record sequence into conversations.

  A record opens a new conversation when it is the first one or when the gap
  to its predecessor is strictly greater than the timeout. An infinite
  timeout yields a single conversation for any non-empty input.
*/
class ConversationSegmenter {
 public:
  // Throws util::InvalidArgument unless timeout_seconds > 0.
  explicit ConversationSegmenter(double timeout_seconds = 3600.0);

  // order holds table positions sorted by time (optionally one counterparty).
  std::vector<cadence::model::Conversation> Segment(const cadence::ingest::RecordTable& table, const std::vector<std::size_t>& order) const;

  double timeout_seconds() const {
    return timeout_seconds_;
  }

 private:
  double timeout_seconds_;
};

} // namespace cadence::analysis

#include "internal/analysis/conversation_segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace cadence::analysis {
namespace {

void Close(cadence::model::Conversation& conversation, const cadence::ingest::RecordTable& table) {
  const auto& first = table[conversation.record_indices.front()];
  const auto& last  = table[conversation.record_indices.back()];

  conversation.start_time           = first.timestamp;
  conversation.end_time             = last.timestamp;
  conversation.duration_seconds     = cadence::util::SecondsBetween(first.timestamp, last.timestamp);
  conversation.message_count        = conversation.record_indices.size();
  conversation.initiator_direction  = first.direction;
  conversation.terminator_direction = last.direction;
}

} // namespace

ConversationSegmenter::ConversationSegmenter(double timeout_seconds) : timeout_seconds_(timeout_seconds) {
  if (std::isnan(timeout_seconds) || timeout_seconds <= 0.0) {
    throw cadence::util::InvalidArgument("conversation timeout must be positive");
  }
}

std::vector<cadence::model::Conversation> ConversationSegmenter::Segment(const cadence::ingest::RecordTable& table,
                                                                         const std::vector<std::size_t>& order) const {
  std::vector<cadence::model::Conversation> conversations;

  const cadence::model::Record* previous = nullptr;
  for (auto index : order) {
    const auto& record = table[index];

    const bool starts_new = previous == nullptr || cadence::util::SecondsBetween(previous->timestamp, record.timestamp) > timeout_seconds_;
    if (starts_new) {
      if (!conversations.empty()) {
        Close(conversations.back(), table);
      }
      cadence::model::Conversation next;
      next.id = conversations.size() + 1;
      conversations.push_back(std::move(next));
    }

    auto& current = conversations.back();
    current.record_indices.push_back(index);
    if (std::find(current.counterparties.begin(), current.counterparties.end(), record.counterparty) == current.counterparties.end()) {
      current.counterparties.push_back(record.counterparty);
    }
    previous = &record;
  }

  if (!conversations.empty()) {
    Close(conversations.back(), table);
  }
  return conversations;
}

} // namespace cadence::analysis

#include "internal/analysis/reciprocity_analyzer.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "internal/analysis/conversation_segmenter.hpp"
#include "internal/observability/logging.hpp"

namespace cadence::analysis {

using cadence::model::Direction;
using cadence::model::RelationshipBalance;

RelationshipBalance ClassifyBalance(std::size_t sent, std::size_t received, double balance_low, double balance_high) {
  const auto total = sent + received;
  if (total == 0) {
    return RelationshipBalance::kNoMessages;
  }
  if (received == 0) {
    return RelationshipBalance::kOnlySent;
  }
  if (sent == 0) {
    return RelationshipBalance::kOnlyReceived;
  }

  const double sent_ratio = static_cast<double>(sent) / static_cast<double>(total);
  if (sent_ratio < balance_low) {
    return RelationshipBalance::kMostlyReceived;
  }
  if (sent_ratio > balance_high) {
    return RelationshipBalance::kMostlySent;
  }
  return RelationshipBalance::kBalanced;
}

double MessageRatio(std::size_t sent, std::size_t received) {
  if (received == 0 && sent > 0) {
    return std::numeric_limits<double>::infinity();
  }
  if (sent == 0 && received > 0) {
    return 0.0;
  }
  if (sent == 0 && received == 0) {
    return 1.0;
  }
  return static_cast<double>(sent) / static_cast<double>(received);
}

ReciprocityAnalyzer::ReciprocityAnalyzer(AnalysisOptions options) : options_(std::move(options)) {
}

cadence::model::ReciprocityAnalysis ReciprocityAnalyzer::Analyze(const cadence::ingest::RecordTable& table) const {
  cadence::model::ReciprocityAnalysis result;
  ConversationSegmenter               segmenter(options_.initiation_timeout_seconds);

  std::size_t user_initiations         = 0;
  std::size_t counterparty_initiations = 0;

  const auto  order = table.SortedByCounterpartyThenTime();
  std::size_t begin = 0;
  while (begin < order.size()) {
    const auto& counterparty = table[order[begin]].counterparty;
    std::size_t end          = begin;
    while (end < order.size() && table[order[end]].counterparty == counterparty) {
      ++end;
    }
    const std::vector<std::size_t> timeline(order.begin() + static_cast<std::ptrdiff_t>(begin), order.begin() + static_cast<std::ptrdiff_t>(end));

    cadence::model::ReciprocitySummary summary;
    summary.counterparty = counterparty;
    for (auto index : timeline) {
      if (table[index].direction == Direction::kSent) {
        ++summary.sent_count;
      } else {
        ++summary.received_count;
      }
    }
    summary.total = summary.sent_count + summary.received_count;
    if (summary.total > 0) {
      summary.sent_ratio     = static_cast<double>(summary.sent_count) / static_cast<double>(summary.total);
      summary.received_ratio = static_cast<double>(summary.received_count) / static_cast<double>(summary.total);
    }
    summary.relationship_balance = ClassifyBalance(summary.sent_count, summary.received_count, options_.balance_low, options_.balance_high);
    summary.message_ratio        = MessageRatio(summary.sent_count, summary.received_count);

    for (const auto& conversation : segmenter.Segment(table, timeline)) {
      if (conversation.initiator_direction == Direction::kSent) {
        ++summary.user_initiations;
      } else {
        ++summary.counterparty_initiations;
      }
    }
    summary.total_initiations = summary.user_initiations + summary.counterparty_initiations;
    if (summary.total_initiations > 0) {
      summary.user_initiation_ratio = static_cast<double>(summary.user_initiations) / static_cast<double>(summary.total_initiations);
    }

    user_initiations += summary.user_initiations;
    counterparty_initiations += summary.counterparty_initiations;
    result.counterparties.emplace(counterparty, std::move(summary));
    begin = end;
  }

  if (user_initiations + counterparty_initiations > 0) {
    result.overall_initiation_ratio = static_cast<double>(user_initiations) / static_cast<double>(user_initiations + counterparty_initiations);
  }

  CADENCE_LOG_DEBUG("reciprocity analyzed", {cadence::observability::IntField("counterparties", static_cast<std::int64_t>(result.counterparties.size()))});
  return result;
}

} // namespace cadence::analysis

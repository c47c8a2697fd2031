#include "internal/analysis/conversation_flow.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/analysis/conversation_segmenter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/stats.hpp"
#include "internal/util/time.hpp"

namespace cadence::analysis {
namespace {

using cadence::model::Direction;

constexpr std::size_t kMinSequenceRecords = 3;
constexpr std::size_t kSequenceLength     = 3;
constexpr std::size_t kTopSequences       = 5;
constexpr std::size_t kMonologueTurn      = 5;

struct TurnLengths {
  std::vector<double> user;
  std::vector<double> counterparty;
};

void CollectTurns(const std::vector<Direction>& directions, TurnLengths& turns) {
  std::size_t run = 0;
  for (std::size_t i = 0; i < directions.size(); ++i) {
    ++run;
    const bool last = i + 1 == directions.size();
    if (last || directions[i + 1] != directions[i]) {
      (directions[i] == Direction::kSent ? turns.user : turns.counterparty).push_back(static_cast<double>(run));
      run = 0;
    }
  }
}

std::optional<std::size_t> MaxTurn(const std::vector<double>& lengths) {
  if (lengths.empty()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(*std::max_element(lengths.begin(), lengths.end()));
}

} // namespace

ConversationFlowAnalyzer::ConversationFlowAnalyzer(AnalysisOptions options) : options_(std::move(options)) {
}

cadence::model::ConversationFlowAnalysis ConversationFlowAnalyzer::Analyze(const cadence::ingest::RecordTable& table) const {
  cadence::model::ConversationFlowAnalysis flows;

  ConversationSegmenter segmenter(options_.conversation_timeout_seconds);
  flows.conversations      = segmenter.Segment(table, table.SortedByTime());
  flows.conversation_count = flows.conversations.size();
  if (flows.conversations.empty()) {
    return flows;
  }

  std::vector<double> durations;
  std::vector<double> message_counts;

  // Sequences in first-seen order so the stable sort below breaks ties by it.
  std::vector<cadence::model::DirectionSequence> sequences;
  TurnLengths                                    turns;

  for (const auto& conversation : flows.conversations) {
    durations.push_back(conversation.duration_seconds);
    message_counts.push_back(static_cast<double>(conversation.message_count));
    ++flows.distribution_by_hour[cadence::util::HourOfDay(conversation.start_time)];
    ++flows.distribution_by_day[std::string(cadence::util::DayName(cadence::util::DayOfWeek(conversation.start_time)))];

    if (conversation.record_indices.size() < kMinSequenceRecords) {
      continue;
    }

    std::vector<Direction> directions;
    directions.reserve(conversation.record_indices.size());
    for (auto index : conversation.record_indices) {
      directions.push_back(table[index].direction);
    }

    for (std::size_t i = 0; i + kSequenceLength <= directions.size(); ++i) {
      std::vector<Direction> window(directions.begin() + static_cast<std::ptrdiff_t>(i),
                                    directions.begin() + static_cast<std::ptrdiff_t>(i + kSequenceLength));
      auto it = std::find_if(sequences.begin(), sequences.end(), [&](const auto& s) { return s.sequence == window; });
      if (it == sequences.end()) {
        sequences.push_back({std::move(window), 1});
      } else {
        ++it->count;
      }
    }

    CollectTurns(directions, turns);
  }

  flows.average_duration_seconds = cadence::util::Mean(durations);
  flows.average_message_count    = cadence::util::Mean(message_counts);

  std::stable_sort(sequences.begin(), sequences.end(), [](const auto& a, const auto& b) { return a.count > b.count; });
  if (sequences.size() > kTopSequences) {
    sequences.resize(kTopSequences);
  }
  flows.common_sequences = std::move(sequences);

  auto& tt                        = flows.turn_taking;
  tt.avg_user_turn_length         = cadence::util::Mean(turns.user);
  tt.avg_counterparty_turn_length = cadence::util::Mean(turns.counterparty);
  tt.max_user_turn_length         = MaxTurn(turns.user);
  tt.max_counterparty_turn_length = MaxTurn(turns.counterparty);
  for (const auto* lengths : {&turns.user, &turns.counterparty}) {
    tt.monologue_count += static_cast<std::size_t>(
        std::count_if(lengths->begin(), lengths->end(), [](double length) { return length >= static_cast<double>(kMonologueTurn); }));
  }

  CADENCE_LOG_DEBUG("conversation flows analyzed", {cadence::observability::IntField("conversations", static_cast<std::int64_t>(flows.conversation_count))});
  return flows;
}

} // namespace cadence::analysis

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace cadence::model {

// ------------------------------------------------------------
// Segmentation
// ------------------------------------------------------------

struct Conversation {
  std::uint64_t            id{0};
  cadence::util::TimePoint start_time;
  cadence::util::TimePoint end_time;
  double                   duration_seconds{0.0};
  std::size_t              message_count{0};
  std::vector<std::string> counterparties;
  Direction                initiator_direction{Direction::kSent};
  Direction                terminator_direction{Direction::kSent};

  // Positions in the owning RecordTable, in time order.
  std::vector<std::size_t> record_indices;
};

// ------------------------------------------------------------
// Response timing
// ------------------------------------------------------------

struct ResponsePair {
  std::string              counterparty;
  cadence::util::TimePoint received_at;
  cadence::util::TimePoint sent_at;
  double                   latency_seconds{0.0};
  bool                     is_outlier{false};
  bool                     is_quick{false};
  bool                     is_delayed{false};
};

struct LatencyDistribution {
  std::size_t              count{0};
  double                   mean{0.0};
  double                   std_dev{0.0};
  double                   min{0.0};
  double                   max{0.0};
  std::map<int, double>    percentiles;
  std::vector<double>      bin_edges;
  std::vector<std::size_t> bin_counts;
};

struct TimeOfDayEffects {
  std::optional<double> morning_seconds;
  std::optional<double> afternoon_seconds;
  std::optional<double> evening_seconds;
};

struct TimingStatistics {
  std::optional<double>         average_seconds;
  std::optional<double>         median_seconds;
  LatencyDistribution           distribution;
  std::map<std::string, double> per_counterparty_average;
  std::map<int, double>         by_hour_average;
  std::map<std::string, double> by_day_average;
  std::size_t                   quick_count{0};
  std::size_t                   delayed_count{0};
  std::size_t                   total_pairs{0};
  std::vector<ResponsePair>     pairs;
  std::vector<ResponsePair>     outliers;
  std::optional<int>            best_hour;
  TimeOfDayEffects              time_of_day;
};

// ------------------------------------------------------------
// Reciprocity
// ------------------------------------------------------------

enum class RelationshipBalance : std::uint8_t {
  kNoMessages,
  kBalanced,
  kMostlySent,
  kMostlyReceived,
  kOnlySent,
  kOnlyReceived,
};

constexpr std::string_view ToString(RelationshipBalance balance) {
  switch (balance) {
    case RelationshipBalance::kNoMessages:
      return "no_messages";
    case RelationshipBalance::kBalanced:
      return "balanced";
    case RelationshipBalance::kMostlySent:
      return "mostly_sent";
    case RelationshipBalance::kMostlyReceived:
      return "mostly_received";
    case RelationshipBalance::kOnlySent:
      return "only_sent";
    case RelationshipBalance::kOnlyReceived:
      return "only_received";
  }
  return "no_messages";
}

struct ReciprocitySummary {
  std::string           counterparty;
  std::size_t           sent_count{0};
  std::size_t           received_count{0};
  std::size_t           total{0};
  double                sent_ratio{0.0};
  double                received_ratio{0.0};
  RelationshipBalance   relationship_balance{RelationshipBalance::kNoMessages};
  std::size_t           user_initiations{0};
  std::size_t           counterparty_initiations{0};
  std::size_t           total_initiations{0};
  std::optional<double> user_initiation_ratio;
  double                message_ratio{1.0};
};

struct ReciprocityAnalysis {
  std::optional<double>                     overall_initiation_ratio;
  std::map<std::string, ReciprocitySummary> counterparties;
};

// ------------------------------------------------------------
// Conversation flow
// ------------------------------------------------------------

struct DirectionSequence {
  std::vector<Direction> sequence;
  std::size_t            count{0};
};

struct TurnTaking {
  std::optional<double>      avg_user_turn_length;
  std::optional<double>      avg_counterparty_turn_length;
  std::optional<std::size_t> max_user_turn_length;
  std::optional<std::size_t> max_counterparty_turn_length;
  std::size_t                monologue_count{0};
};

struct ConversationFlowAnalysis {
  std::size_t                        conversation_count{0};
  std::optional<double>              average_duration_seconds;
  std::optional<double>              average_message_count;
  std::map<int, std::size_t>         distribution_by_hour;
  std::map<std::string, std::size_t> distribution_by_day;
  std::vector<DirectionSequence>     common_sequences;
  TurnTaking                         turn_taking;
  std::vector<Conversation>          conversations;
};

// ------------------------------------------------------------
// Anomalies and patterns
// ------------------------------------------------------------

struct Anomaly {
  std::string                             type;
  std::string                             counterparty;
  std::optional<cadence::util::TimePoint> timestamp;
  double                                  severity{0.0};
  std::string                             description;
  std::map<std::string, std::string>      details;
};

/*
  Uniform pattern record.

  significance is the first-stage, per-source score (scale differs by
  source). pattern_significance is the second-stage [0, 1] score assigned
  by the orchestrator before ranking.
*/
struct Pattern {
  std::string                   pattern_type;
  std::string                   subtype;
  std::string                   description;
  std::optional<double>         significance;
  std::optional<double>         confidence;
  std::size_t                   occurrences{0};
  std::string                   counterparty;
  std::map<std::string, double> metadata;
  double                        pattern_significance{0.0};
};

// ------------------------------------------------------------
// ML augmentation
// ------------------------------------------------------------

struct Prediction {
  std::string counterparty;
  double      expected_response_seconds{0.0};
  double      confidence{0.0};
};

struct MlAugmentation {
  std::string             model_name;
  std::vector<Prediction> predictions;
  std::vector<Anomaly>    anomalies;
};

// ------------------------------------------------------------
// Reports
// ------------------------------------------------------------

struct ResponseAnalysis {
  cadence::util::Result<TimingStatistics>         response_times;
  cadence::util::Result<ReciprocityAnalysis>      reciprocity;
  cadence::util::Result<ConversationFlowAnalysis> conversation_flows;
  std::vector<Anomaly>                            anomalies;
  std::optional<std::string>                      anomalies_error;
  std::optional<MlAugmentation>                   ml_enhanced;
  std::optional<std::string>                      ml_error;
  std::vector<std::string>                        collaborator_errors;

  // Set on validation failure (nothing else computed) or when the core
  // timing stage fails (other fields may be partially populated).
  std::optional<std::string> error;
};

struct PatternReport {
  std::vector<Pattern>     detected_patterns;
  std::vector<Anomaly>     anomalies;
  ResponseAnalysis         response_analysis;
  std::vector<std::string> errors;
  std::optional<std::string> error;
};

struct ResponsePrediction {
  std::optional<double>      expected_response_seconds;
  double                     confidence{0.0};
  std::string                method;
  std::string                model_name;
  std::optional<std::string> error;
};

} // namespace cadence::model

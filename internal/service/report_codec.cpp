#include "report_codec.hpp"

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace cadence::service {

using namespace cadence::analysis::v1;

namespace {

cadence::analysis::v1::Direction ToProto(cadence::model::Direction direction) {
  switch (direction) {
    case cadence::model::Direction::kSent:
      return DIRECTION_SENT;
    case cadence::model::Direction::kReceived:
      return DIRECTION_RECEIVED;
  }
  return DIRECTION_UNSPECIFIED;
}

void FillPair(const cadence::model::ResponsePair& src, ResponsePair* dst) {
  dst->set_counterparty(src.counterparty);
  *dst->mutable_received_at() = cadence::util::ToProto(src.received_at);
  *dst->mutable_sent_at()     = cadence::util::ToProto(src.sent_at);
  dst->set_latency_seconds(src.latency_seconds);
  dst->set_is_outlier(src.is_outlier);
  dst->set_is_quick(src.is_quick);
  dst->set_is_delayed(src.is_delayed);
}

void FillTiming(const cadence::model::TimingStatistics& src, TimingStatistics* dst) {
  if (src.average_seconds) {
    dst->set_average_seconds(*src.average_seconds);
  }
  if (src.median_seconds) {
    dst->set_median_seconds(*src.median_seconds);
  }

  auto* dist = dst->mutable_distribution();
  dist->set_count(src.distribution.count);
  dist->set_mean(src.distribution.mean);
  dist->set_std_dev(src.distribution.std_dev);
  dist->set_min(src.distribution.min);
  dist->set_max(src.distribution.max);
  for (const auto& [p, value] : src.distribution.percentiles) {
    (*dist->mutable_percentiles())[static_cast<uint32_t>(p)] = value;
  }
  for (double edge : src.distribution.bin_edges) {
    dist->add_bin_edges(edge);
  }
  for (auto count : src.distribution.bin_counts) {
    dist->add_bin_counts(count);
  }

  for (const auto& [counterparty, avg] : src.per_counterparty_average) {
    (*dst->mutable_per_counterparty_average())[counterparty] = avg;
  }
  for (const auto& [hour, avg] : src.by_hour_average) {
    (*dst->mutable_by_hour_average())[static_cast<uint32_t>(hour)] = avg;
  }
  for (const auto& [day, avg] : src.by_day_average) {
    (*dst->mutable_by_day_average())[day] = avg;
  }

  dst->set_quick_count(src.quick_count);
  dst->set_delayed_count(src.delayed_count);
  dst->set_total_pairs(src.total_pairs);
  for (const auto& pair : src.outliers) {
    FillPair(pair, dst->add_outliers());
  }
  for (const auto& pair : src.pairs) {
    FillPair(pair, dst->add_pairs());
  }
  if (src.best_hour) {
    dst->set_best_hour(static_cast<uint32_t>(*src.best_hour));
  }

  auto* tod = dst->mutable_time_of_day();
  if (src.time_of_day.morning_seconds) {
    tod->set_morning_seconds(*src.time_of_day.morning_seconds);
  }
  if (src.time_of_day.afternoon_seconds) {
    tod->set_afternoon_seconds(*src.time_of_day.afternoon_seconds);
  }
  if (src.time_of_day.evening_seconds) {
    tod->set_evening_seconds(*src.time_of_day.evening_seconds);
  }
}

void FillReciprocity(const cadence::model::ReciprocityAnalysis& src, ReciprocityAnalysis* dst) {
  if (src.overall_initiation_ratio) {
    dst->set_overall_initiation_ratio(*src.overall_initiation_ratio);
  }
  for (const auto& [counterparty, summary] : src.counterparties) {
    auto* out = dst->add_counterparties();
    out->set_counterparty(counterparty);
    out->set_sent_count(summary.sent_count);
    out->set_received_count(summary.received_count);
    out->set_total(summary.total);
    out->set_sent_ratio(summary.sent_ratio);
    out->set_received_ratio(summary.received_ratio);
    out->set_relationship_balance(std::string(cadence::model::ToString(summary.relationship_balance)));
    out->set_user_initiations(summary.user_initiations);
    out->set_counterparty_initiations(summary.counterparty_initiations);
    out->set_total_initiations(summary.total_initiations);
    if (summary.user_initiation_ratio) {
      out->set_user_initiation_ratio(*summary.user_initiation_ratio);
    }
    out->set_message_ratio(summary.message_ratio);
  }
}

void FillFlows(const cadence::model::ConversationFlowAnalysis& src, ConversationFlowAnalysis* dst) {
  dst->set_conversation_count(src.conversation_count);
  if (src.average_duration_seconds) {
    dst->set_average_duration_seconds(*src.average_duration_seconds);
  }
  if (src.average_message_count) {
    dst->set_average_message_count(*src.average_message_count);
  }
  for (const auto& [hour, count] : src.distribution_by_hour) {
    (*dst->mutable_distribution_by_hour())[static_cast<uint32_t>(hour)] = count;
  }
  for (const auto& [day, count] : src.distribution_by_day) {
    (*dst->mutable_distribution_by_day())[day] = count;
  }
  for (const auto& seq : src.common_sequences) {
    auto* out = dst->add_common_sequences();
    for (auto direction : seq.sequence) {
      out->add_sequence(ToProto(direction));
    }
    out->set_count(seq.count);
  }

  const auto& turns = src.turn_taking;
  auto*       tt    = dst->mutable_turn_taking();
  if (turns.avg_user_turn_length) {
    tt->set_avg_user_turn_length(*turns.avg_user_turn_length);
  }
  if (turns.avg_counterparty_turn_length) {
    tt->set_avg_counterparty_turn_length(*turns.avg_counterparty_turn_length);
  }
  if (turns.max_user_turn_length) {
    tt->set_max_user_turn_length(*turns.max_user_turn_length);
  }
  if (turns.max_counterparty_turn_length) {
    tt->set_max_counterparty_turn_length(*turns.max_counterparty_turn_length);
  }
  tt->set_monologue_count(turns.monologue_count);

  for (const auto& conversation : src.conversations) {
    auto* out = dst->add_conversations();
    out->set_id(conversation.id);
    *out->mutable_start_time() = cadence::util::ToProto(conversation.start_time);
    *out->mutable_end_time()   = cadence::util::ToProto(conversation.end_time);
    out->set_duration_seconds(conversation.duration_seconds);
    out->set_message_count(conversation.message_count);
    for (const auto& counterparty : conversation.counterparties) {
      out->add_counterparties(counterparty);
    }
    out->set_initiator_direction(ToProto(conversation.initiator_direction));
    out->set_terminator_direction(ToProto(conversation.terminator_direction));
  }
}

void FillAnomaly(const cadence::model::Anomaly& src, Anomaly* dst) {
  dst->set_type(src.type);
  dst->set_counterparty(src.counterparty);
  if (src.timestamp) {
    *dst->mutable_timestamp() = cadence::util::ToProto(*src.timestamp);
  }
  dst->set_severity(src.severity);
  dst->set_description(src.description);
  for (const auto& [key, value] : src.details) {
    (*dst->mutable_details())[key] = value;
  }
}

void FillPattern(const cadence::model::Pattern& src, Pattern* dst) {
  dst->set_pattern_type(src.pattern_type);
  dst->set_subtype(src.subtype);
  dst->set_description(src.description);
  if (src.significance) {
    dst->set_significance(*src.significance);
  }
  dst->set_confidence(src.confidence.value_or(0.0));
  dst->set_occurrences(src.occurrences);
  dst->set_counterparty(src.counterparty);
  for (const auto& [key, value] : src.metadata) {
    (*dst->mutable_metadata())[key] = value;
  }
  dst->set_pattern_significance(src.pattern_significance);
}

} // namespace

cadence::ingest::RawTable FromProto(const RecordBatch& batch) {
  cadence::ingest::RawTable table;
  for (const auto& column : batch.columns()) {
    table.AddColumn(column.name(), std::vector<std::string>(column.values().begin(), column.values().end()));
  }
  return table;
}

RecordBatch ToProto(const cadence::ingest::RawTable& table) {
  RecordBatch batch;
  for (const auto& column : table.columns()) {
    auto* out = batch.add_columns();
    out->set_name(column.name);
    for (const auto& value : column.values) {
      out->add_values(value);
    }
  }
  return batch;
}

cadence::ingest::ColumnMapping MergeMapping(const cadence::ingest::ColumnMapping&                  defaults,
                                            const google::protobuf::Map<std::string, std::string>& overrides) {
  cadence::ingest::ColumnMapping mapping = defaults;
  for (const auto& [key, column] : overrides) {
    mapping.Set(key, column);
  }
  return mapping;
}

ResponseAnalysisReport ToProto(const cadence::model::ResponseAnalysis& analysis) {
  ResponseAnalysisReport report;

  if (analysis.response_times) {
    FillTiming(*analysis.response_times, report.mutable_response_times());
  } else if (!analysis.response_times.error.empty()) {
    report.set_response_times_error(analysis.response_times.error);
  }

  if (analysis.reciprocity) {
    FillReciprocity(*analysis.reciprocity, report.mutable_reciprocity_patterns());
  } else if (!analysis.reciprocity.error.empty()) {
    report.set_reciprocity_error(analysis.reciprocity.error);
  }

  if (analysis.conversation_flows) {
    FillFlows(*analysis.conversation_flows, report.mutable_conversation_flows());
  } else if (!analysis.conversation_flows.error.empty()) {
    report.set_conversation_flows_error(analysis.conversation_flows.error);
  }

  for (const auto& anomaly : analysis.anomalies) {
    FillAnomaly(anomaly, report.add_anomalies());
  }
  if (analysis.anomalies_error) {
    report.set_anomalies_error(*analysis.anomalies_error);
  }

  if (analysis.ml_enhanced) {
    auto* ml = report.mutable_ml_enhanced();
    ml->set_model_name(analysis.ml_enhanced->model_name);
    for (const auto& prediction : analysis.ml_enhanced->predictions) {
      auto* out = ml->add_predictions();
      out->set_counterparty(prediction.counterparty);
      out->set_expected_response_seconds(prediction.expected_response_seconds);
      out->set_confidence(prediction.confidence);
    }
  }
  if (analysis.ml_error) {
    report.set_ml_error(*analysis.ml_error);
  }
  for (const auto& error : analysis.collaborator_errors) {
    report.add_collaborator_errors(error);
  }
  if (analysis.error) {
    report.set_error(*analysis.error);
  }
  return report;
}

PatternReport ToProto(const cadence::model::PatternReport& report) {
  PatternReport out;
  for (const auto& pattern : report.detected_patterns) {
    FillPattern(pattern, out.add_detected_patterns());
  }
  for (const auto& anomaly : report.anomalies) {
    FillAnomaly(anomaly, out.add_anomalies());
  }
  *out.mutable_response_analysis() = ToProto(report.response_analysis);
  for (const auto& error : report.errors) {
    out.add_errors(error);
  }
  if (report.error) {
    out.set_error(*report.error);
  }
  return out;
}

PredictResponseReply ToProto(const cadence::model::ResponsePrediction& prediction) {
  PredictResponseReply reply;
  if (prediction.expected_response_seconds) {
    reply.set_expected_response_seconds(*prediction.expected_response_seconds);
  }
  reply.set_confidence(prediction.confidence);
  reply.set_method(prediction.method);
  reply.set_model_name(prediction.model_name);
  if (prediction.error) {
    reply.set_error(*prediction.error);
  }
  return reply;
}

} // namespace cadence::service

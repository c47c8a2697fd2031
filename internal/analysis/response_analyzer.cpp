#include "internal/analysis/response_analyzer.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/analysis/anomaly_detector.hpp"
#include "internal/analysis/conversation_flow.hpp"
#include "internal/analysis/reciprocity_analyzer.hpp"
#include "internal/analysis/response_timing.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace cadence::analysis {
namespace {

using cadence::model::ResponseAnalysis;
using cadence::observability::StringField;
using cadence::util::Result;

constexpr std::string_view kCacheOperation = "response_patterns";

/*
  Runs one sub-analysis behind a span; exceptions stay inside and become an
  error stub.
*/
template <typename Fn>
auto RunStage(std::string_view stage, Fn&& fn) -> Result<decltype(fn())> {
  using T = decltype(fn());
  auto span = cadence::observability::StageSpan(stage);
  try {
    return Result<T>::Ok(fn());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    cadence::observability::Metrics::Instance().RecordStageFailure(stage);
    CADENCE_LOG_STAGE_FAILURE("analysis stage failed", stage, e.what());
    return Result<T>::Err(e.what());
  }
}

// Builds the typed table or returns the lowercased validation message.
Result<cadence::ingest::RecordTable> BuildRecords(const cadence::ingest::RawTable& table, const cadence::ingest::ColumnMapping& mapping) {
  try {
    return Result<cadence::ingest::RecordTable>::Ok(cadence::ingest::RecordTableBuilder::Build(table, mapping));
  } catch (const cadence::util::ValidationError& e) {
    CADENCE_LOG_ERROR("input validation failed", {StringField("error", e.what())});
    return Result<cadence::ingest::RecordTable>::Err(cadence::util::ToLower(e.what()));
  }
}

template <typename T>
Result<T> Forward(const Result<cadence::ingest::RecordTable>& records) {
  return Result<T>::Err(records.error);
}

} // namespace

ResponseAnalyzer::ResponseAnalyzer(AnalysisOptions options, std::shared_ptr<cadence::cache::ResultCache> cache,
                                   std::shared_ptr<cadence::collaborators::MlService> ml_service,
                                   std::shared_ptr<const AnomalyDetector>             anomaly_detector)
    : options_(std::move(options)),
      cache_(std::move(cache)),
      ml_service_(std::move(ml_service)),
      anomaly_detector_(anomaly_detector ? std::move(anomaly_detector) : std::make_shared<const AnomalyDetector>()) {
}

// ------------------------------------------------------------
// Full analysis
// ------------------------------------------------------------

ResponseAnalysis ResponseAnalyzer::Analyze(const cadence::ingest::RawTable& table, const cadence::ingest::ColumnMapping& mapping) const {
  auto records = BuildRecords(table, mapping);
  if (!records) {
    ResponseAnalysis result;
    result.error = records.error;
    return result;
  }
  return Analyze(*records, mapping);
}

ResponseAnalysis ResponseAnalyzer::Analyze(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping) const {
  if (records.empty()) {
    CADENCE_LOG_ERROR("input validation failed", {StringField("error", "empty data provided for analysis")});
    ResponseAnalysis result;
    result.error = "empty data provided for analysis";
    return result;
  }

  std::vector<std::string> cache_errors;
  std::string              cache_key;
  if (cache_) {
    cache_key = cadence::cache::Fingerprint(kCacheOperation, records, options_);
    try {
      if (auto cached = cache_->Get(cache_key)) {
        CADENCE_LOG_DEBUG("response analysis served from cache", {StringField("key", cache_key)});
        return *cached;
      }
    } catch (const std::exception& e) {
      CADENCE_LOG_STAGE_FAILURE("cache lookup failed", "cache_get", e.what());
      cache_errors.push_back(std::string("cache get failed: ") + e.what());
    }
  }

  auto result                = Compute(records, mapping);
  result.collaborator_errors = std::move(cache_errors);

  // Degraded results (ml_error, failed cache lookup) are never stored.
  const bool degraded = result.ml_error.has_value() || !result.collaborator_errors.empty();
  if (cache_ && degraded && !result.error) {
    CADENCE_LOG_DEBUG("degraded response analysis not cached", {StringField("key", cache_key)});
  } else if (cache_ && !result.error) {
    try {
      cache_->Put(cache_key, result);
    } catch (const std::exception& e) {
      CADENCE_LOG_STAGE_FAILURE("cache store failed", "cache_put", e.what());
      result.collaborator_errors.push_back(std::string("cache put failed: ") + e.what());
    }
  }
  return result;
}

ResponseAnalysis ResponseAnalyzer::Compute(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping) const {
  cadence::observability::SpanScope span("cadence.analyze_responses");
  span.SetAttribute("records", static_cast<std::int64_t>(records.size()));

  ResponseAnalysis result;

  result.response_times = RunStage("response_times", [&] { return ResponseTimingAnalyzer(options_).Analyze(records); });
  if (!result.response_times) {
    result.error = cadence::util::ToLower("Error during response pattern analysis: " + result.response_times.error);
    CADENCE_LOG_ERROR("response analysis aborted", {StringField("error", *result.error)});
    return result;
  }

  result.reciprocity        = RunStage("reciprocity", [&] { return ReciprocityAnalyzer(options_).Analyze(records); });
  result.conversation_flows = RunStage("conversation_flows", [&] { return ConversationFlowAnalyzer(options_).Analyze(records); });

  auto anomalies = RunStage("anomalies", [&] { return anomaly_detector_->Detect(result.response_times, result.reciprocity); });
  if (anomalies) {
    result.anomalies = *anomalies;
  } else {
    result.anomalies_error = anomalies.error;
  }

  if (options_.ml_enabled && ml_service_) {
    try {
      if (auto augmentation = ml_service_->Predict(options_.ml_model_name, records, mapping)) {
        result.anomalies.insert(result.anomalies.end(), augmentation->anomalies.begin(), augmentation->anomalies.end());
        result.ml_enhanced = std::move(*augmentation);
      }
    } catch (const std::exception& e) {
      CADENCE_LOG_STAGE_FAILURE("ml augmentation failed, using standard analysis only", "ml", e.what());
      result.ml_error = e.what();
    }
  }

  CADENCE_LOG_INFO("response pattern analysis completed",
                   {cadence::observability::IntField("records", static_cast<std::int64_t>(records.size())),
                    cadence::observability::IntField("pairs", static_cast<std::int64_t>(result.response_times->total_pairs)),
                    cadence::observability::IntField("anomalies", static_cast<std::int64_t>(result.anomalies.size()))});
  return result;
}

// ------------------------------------------------------------
// Single-stage entry points
// ------------------------------------------------------------

Result<cadence::model::TimingStatistics> ResponseAnalyzer::AnalyzeResponseTimes(const cadence::ingest::RawTable&      table,
                                                                                const cadence::ingest::ColumnMapping& mapping) const {
  auto records = BuildRecords(table, mapping);
  if (!records) {
    return Forward<cadence::model::TimingStatistics>(records);
  }
  return RunStage("response_times", [&] { return ResponseTimingAnalyzer(options_).Analyze(*records); });
}

Result<cadence::model::ReciprocityAnalysis> ResponseAnalyzer::DetectReciprocityPatterns(const cadence::ingest::RawTable&      table,
                                                                                       const cadence::ingest::ColumnMapping& mapping) const {
  auto records = BuildRecords(table, mapping);
  if (!records) {
    return Forward<cadence::model::ReciprocityAnalysis>(records);
  }
  return RunStage("reciprocity", [&] { return ReciprocityAnalyzer(options_).Analyze(*records); });
}

Result<cadence::model::ConversationFlowAnalysis> ResponseAnalyzer::AnalyzeConversationFlows(const cadence::ingest::RawTable&      table,
                                                                                           const cadence::ingest::ColumnMapping& mapping) const {
  auto records = BuildRecords(table, mapping);
  if (!records) {
    return Forward<cadence::model::ConversationFlowAnalysis>(records);
  }
  return RunStage("conversation_flows", [&] { return ConversationFlowAnalyzer(options_).Analyze(*records); });
}

// ------------------------------------------------------------
// Prediction
// ------------------------------------------------------------

cadence::model::ResponsePrediction ResponseAnalyzer::PredictResponseBehavior(const cadence::ingest::RawTable& table, const std::string& counterparty,
                                                                             const cadence::ingest::ColumnMapping& mapping) const {
  cadence::model::ResponsePrediction prediction;
  if (counterparty.empty()) {
    prediction.error = "contact identifier cannot be empty";
    return prediction;
  }
  if (table.Empty()) {
    prediction.error = "cannot predict with empty data";
    return prediction;
  }
  auto records = BuildRecords(table, mapping);
  if (!records) {
    prediction.error = records.error;
    return prediction;
  }
  return PredictResponseBehavior(*records, counterparty, mapping);
}

cadence::model::ResponsePrediction ResponseAnalyzer::PredictResponseBehavior(const cadence::ingest::RecordTable& records, const std::string& counterparty,
                                                                             const cadence::ingest::ColumnMapping& mapping) const {
  cadence::model::ResponsePrediction prediction;
  if (counterparty.empty()) {
    prediction.error = "contact identifier cannot be empty";
    return prediction;
  }
  if (records.empty()) {
    prediction.error = "cannot predict with empty data";
    return prediction;
  }

  const auto indices = records.IndicesFor(counterparty);
  if (indices.empty()) {
    prediction.error = "no data found for contact: " + counterparty;
    return prediction;
  }

  std::vector<cadence::model::Record> subset;
  subset.reserve(indices.size());
  for (auto index : indices) {
    subset.push_back(records[index]);
  }
  const cadence::ingest::RecordTable counterparty_records(std::move(subset));

  const auto timing = ResponseTimingAnalyzer(options_).Analyze(counterparty_records);
  if (!timing.average_seconds) {
    prediction.confidence = 0.1;
    prediction.method     = "statistical";
    prediction.error      = "insufficient data for prediction";
    return prediction;
  }

  if (options_.ml_enabled && ml_service_) {
    try {
      auto augmentation = ml_service_->Predict(options_.ml_model_name, records, mapping);
      if (augmentation) {
        auto it = std::find_if(augmentation->predictions.begin(), augmentation->predictions.end(),
                               [&](const auto& p) { return p.counterparty == counterparty; });
        if (it != augmentation->predictions.end()) {
          prediction.expected_response_seconds = it->expected_response_seconds;
          prediction.confidence                = std::clamp(it->confidence, 0.0, 1.0);
          prediction.method                    = "ml";
          prediction.model_name                = augmentation->model_name.empty() ? options_.ml_model_name : augmentation->model_name;
          return prediction;
        }
      }
    } catch (const std::exception& e) {
      CADENCE_LOG_STAGE_FAILURE("ml prediction failed, using statistical prediction", "ml_predict", e.what());
    }
  }

  const double message_count           = static_cast<double>(counterparty_records.size());
  prediction.expected_response_seconds = timing.average_seconds;
  prediction.confidence                = std::min(0.1 + (message_count / 100.0) * 0.4, 0.5);
  prediction.method                    = "statistical";
  return prediction;
}

} // namespace cadence::analysis

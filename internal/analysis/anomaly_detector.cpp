#include "internal/analysis/anomaly_detector.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace cadence::analysis {
namespace {

using cadence::model::Anomaly;
using cadence::model::RelationshipBalance;

constexpr double kReciprocitySeverity = 0.6;

template <typename Fn>
void AppendGuarded(std::vector<Anomaly>& out, const char* stage, Fn&& fn) {
  try {
    auto found = fn();
    out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  } catch (const std::exception& e) {
    cadence::observability::Metrics::Instance().RecordStageFailure(stage);
    CADENCE_LOG_STAGE_FAILURE("anomaly detection step failed", stage, e.what());
  }
}

} // namespace

std::vector<Anomaly> AnomalyDetector::Detect(const cadence::util::Result<cadence::model::TimingStatistics>&    timing,
                                             const cadence::util::Result<cadence::model::ReciprocityAnalysis>& reciprocity) const {
  std::vector<Anomaly> anomalies;
  if (timing) {
    AppendGuarded(anomalies, "response_time_anomalies", [&] { return ResponseTimeStep(*timing); });
  }
  if (reciprocity) {
    AppendGuarded(anomalies, "reciprocity_anomalies", [&] { return ReciprocityStep(*reciprocity); });
  }
  return anomalies;
}

std::vector<Anomaly> AnomalyDetector::ResponseTimeStep(const cadence::model::TimingStatistics& timing) const {
  return ResponseTimeAnomalies(timing);
}

std::vector<Anomaly> AnomalyDetector::ReciprocityStep(const cadence::model::ReciprocityAnalysis& reciprocity) const {
  return ReciprocityAnomalies(reciprocity);
}

std::vector<Anomaly> AnomalyDetector::ResponseTimeAnomalies(const cadence::model::TimingStatistics& timing) {
  std::vector<Anomaly> anomalies;
  const auto           average = timing.average_seconds;

  for (const auto& pair : timing.pairs) {
    if (!pair.is_outlier) {
      continue;
    }

    double severity = 1.0;
    if (average && *average > 0.0) {
      severity = std::min(1.0, std::abs(pair.latency_seconds / *average - 1.0));
    }

    Anomaly anomaly;
    anomaly.type         = "response_time_outlier";
    anomaly.counterparty = pair.counterparty;
    anomaly.timestamp    = pair.sent_at;
    anomaly.severity     = severity;
    anomaly.description  = fmt::format("Response time outlier ({:.0f}s) for contact {}", pair.latency_seconds, pair.counterparty);
    anomaly.details      = {
        {"response_time_seconds", fmt::format("{}", pair.latency_seconds)},
        {"received_timestamp", cadence::util::FormatIso8601(pair.received_at)},
        {"sent_timestamp", cadence::util::FormatIso8601(pair.sent_at)},
    };
    anomalies.push_back(std::move(anomaly));
  }
  return anomalies;
}

std::vector<Anomaly> AnomalyDetector::ReciprocityAnomalies(const cadence::model::ReciprocityAnalysis& reciprocity) {
  std::vector<Anomaly> anomalies;
  for (const auto& [counterparty, summary] : reciprocity.counterparties) {
    const auto balance = summary.relationship_balance;
    if (balance != RelationshipBalance::kOnlySent && balance != RelationshipBalance::kOnlyReceived) {
      continue;
    }

    Anomaly anomaly;
    anomaly.type         = "reciprocity_imbalance";
    anomaly.counterparty = counterparty;
    anomaly.severity     = kReciprocitySeverity;
    anomaly.description  = fmt::format("Communication with {} is highly unbalanced ({}).", counterparty, cadence::model::ToString(balance));
    anomaly.details      = {
        {"sent_count", std::to_string(summary.sent_count)},
        {"received_count", std::to_string(summary.received_count)},
        {"total", std::to_string(summary.total)},
        {"relationship_balance", std::string(cadence::model::ToString(balance))},
    };
    anomalies.push_back(std::move(anomaly));
  }
  return anomalies;
}

} // namespace cadence::analysis

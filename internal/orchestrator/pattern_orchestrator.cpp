#include "internal/orchestrator/pattern_orchestrator.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/patterns/pattern_converter.hpp"
#include "internal/patterns/significance.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace cadence::orchestrator {
namespace {

using cadence::model::PatternReport;
using cadence::observability::StringField;

constexpr const char* kAnalyzerName = "ResponseAnalyzer";

void RecordError(PatternReport& report, std::string_view source, const std::string& message) {
  CADENCE_LOG_STAGE_FAILURE("pattern source degraded", source, message);
  report.errors.push_back(std::string(source) + ": " + message);
}

template <typename T>
void CollectStageError(PatternReport& report, std::string_view stage, const cadence::util::Result<T>& result) {
  if (!result && !result.error.empty()) {
    report.errors.push_back(std::string(kAnalyzerName) + " " + std::string(stage) + ": " + result.error);
  }
}

} // namespace

PatternOrchestrator::PatternOrchestrator(std::shared_ptr<const cadence::analysis::ResponseAnalyzer>           analyzer,
                                         std::vector<std::shared_ptr<cadence::collaborators::SiblingDetector>> siblings)
    : analyzer_(std::move(analyzer)), siblings_(std::move(siblings)) {
  if (!analyzer_) {
    throw cadence::util::InvalidArgument("pattern orchestrator requires a response analyzer");
  }
}

PatternReport PatternOrchestrator::DetectPatterns(const cadence::ingest::RawTable& table, const cadence::ingest::ColumnMapping& mapping) const {
  try {
    return DetectPatterns(cadence::ingest::RecordTableBuilder::Build(table, mapping), mapping);
  } catch (const cadence::util::ValidationError& e) {
    CADENCE_LOG_ERROR("input validation failed", {StringField("error", e.what())});
    PatternReport report;
    report.error                   = cadence::util::ToLower(e.what());
    report.response_analysis.error = report.error;
    return report;
  }
}

PatternReport PatternOrchestrator::DetectPatterns(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping) const {
  cadence::observability::SpanScope span("cadence.detect_patterns");
  PatternReport                     report;

  if (records.empty()) {
    report.error                   = "empty data provided for analysis";
    report.response_analysis.error = report.error;
    CADENCE_LOG_ERROR("input validation failed", {StringField("error", *report.error)});
    return report;
  }

  // Response analyzer, isolated like any other source.
  try {
    report.response_analysis = analyzer_->Analyze(records, mapping);
    const auto& analysis     = report.response_analysis;

    if (analysis.error) {
      RecordError(report, kAnalyzerName, *analysis.error);
    }
    CollectStageError(report, "reciprocity", analysis.reciprocity);
    CollectStageError(report, "conversation_flows", analysis.conversation_flows);
    if (analysis.anomalies_error) {
      report.errors.push_back(std::string(kAnalyzerName) + " anomalies: " + *analysis.anomalies_error);
    }
    for (const auto& error : analysis.collaborator_errors) {
      RecordError(report, kAnalyzerName, error);
    }
    if (analysis.ml_error) {
      RecordError(report, kAnalyzerName, "ml augmentation failed: " + *analysis.ml_error);
    }

    auto converted = cadence::patterns::ConvertResponseAnalysis(analysis);
    report.detected_patterns.insert(report.detected_patterns.end(), converted.begin(), converted.end());
    report.anomalies.insert(report.anomalies.end(), analysis.anomalies.begin(), analysis.anomalies.end());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RecordError(report, kAnalyzerName, e.what());
  }

  for (const auto& sibling : siblings_) {
    if (!sibling) {
      continue;
    }
    const std::string name(sibling->Name());
    try {
      auto output = sibling->Analyze(records);
      if (output.error) {
        RecordError(report, name, *output.error);
      }
      report.detected_patterns.insert(report.detected_patterns.end(), output.patterns.begin(), output.patterns.end());
      report.anomalies.insert(report.anomalies.end(), output.anomalies.begin(), output.anomalies.end());
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      RecordError(report, name, e.what());
    }
  }

  cadence::patterns::ScoreAndRank(report.detected_patterns, records.size());

  span.SetAttribute("patterns", static_cast<std::int64_t>(report.detected_patterns.size()));
  CADENCE_LOG_INFO("pattern detection completed", {cadence::observability::IntField("patterns", static_cast<std::int64_t>(report.detected_patterns.size())),
                                                   cadence::observability::IntField("anomalies", static_cast<std::int64_t>(report.anomalies.size())),
                                                   cadence::observability::IntField("errors", static_cast<std::int64_t>(report.errors.size()))});
  return report;
}

} // namespace cadence::orchestrator

#include "internal/orchestrator/pattern_orchestrator.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/patterns/contact_pattern_detector.hpp"
#include "internal/patterns/time_pattern_detector.hpp"
#include "internal/util/errors.hpp"

namespace {

using cadence::analysis::AnalysisOptions;
using cadence::analysis::ResponseAnalyzer;
using cadence::collaborators::DetectorOutput;
using cadence::collaborators::SiblingDetector;
using cadence::ingest::RawTable;
using cadence::ingest::RecordTable;
using cadence::orchestrator::PatternOrchestrator;

RawTable TwoBlockDay() {
  RawTable table;
  table.AddColumn("timestamp", {"2023-01-02 10:00:00", "2023-01-02 10:02:00", "2023-01-02 10:05:00", "2023-01-02 10:07:00", "2023-01-02 14:00:00",
                                "2023-01-02 15:00:00", "2023-01-02 15:30:00", "2023-01-02 17:00:00"});
  table.AddColumn("counterparty_id", {"a", "a", "a", "a", "b", "b", "b", "b"});
  table.AddColumn("direction", {"sent", "received", "sent", "received", "received", "sent", "received", "sent"});
  return table;
}

class DegradedDetector final : public SiblingDetector {
 public:
  std::string_view Name() const override {
    return "SeasonalityDetector";
  }

  DetectorOutput Analyze(const RecordTable&) override {
    DetectorOutput output;
    output.error = "not enough history";

    cadence::model::Anomaly anomaly;
    anomaly.type     = "gap";
    anomaly.severity = 0.4;
    output.anomalies.push_back(anomaly);
    return output;
  }
};

class ThrowingDetector final : public SiblingDetector {
 public:
  std::string_view Name() const override {
    return "OverlapDetector";
  }

  DetectorOutput Analyze(const RecordTable&) override {
    throw std::runtime_error("index out of range");
  }
};

class UntrainedModel final : public cadence::collaborators::MlService {
 public:
  std::optional<cadence::model::MlAugmentation> Predict(const std::string&, const RecordTable&, const cadence::ingest::ColumnMapping&) override {
    throw std::runtime_error("model not trained");
  }
};

class CrashingAnomalyDetector final : public cadence::analysis::AnomalyDetector {
 public:
  std::vector<cadence::model::Anomaly> Detect(const cadence::util::Result<cadence::model::TimingStatistics>&,
                                              const cadence::util::Result<cadence::model::ReciprocityAnalysis>&) const override {
    throw std::runtime_error("severity overflow");
  }
};

std::shared_ptr<const ResponseAnalyzer> DefaultAnalyzer() {
  return std::make_shared<const ResponseAnalyzer>(AnalysisOptions{});
}

bool Contains(const std::vector<std::string>& errors, const std::string& expected) {
  return std::find(errors.begin(), errors.end(), expected) != errors.end();
}

void TestEmptyInputReturnsOnlyError() {
  const PatternOrchestrator orchestrator(DefaultAnalyzer());

  const auto report = orchestrator.DetectPatterns(RawTable{});
  assert(report.error);
  assert(!report.error->empty());
  assert(report.detected_patterns.empty());
  assert(report.anomalies.empty());
  assert(report.errors.empty());
  assert(!report.response_analysis.response_times);

  const auto typed = orchestrator.DetectPatterns(RecordTable{});
  assert(typed.error);
  assert(*typed.error == "empty data provided for analysis");
}

void TestValidationFailureIsLowercased() {
  RawTable table = TwoBlockDay();
  table.AddColumn("direction", {"SENT", "received", "sent", "received", "received", "sent", "received", "sent"});

  const auto report = PatternOrchestrator(DefaultAnalyzer()).DetectPatterns(table);
  assert(report.error);
  assert(*report.error == "invalid direction value(s): {sent}");
  assert(report.response_analysis.error == report.error);
}

void TestPatternsFromEverySourceAreRanked() {
  const PatternOrchestrator orchestrator(DefaultAnalyzer(), {std::make_shared<cadence::patterns::TimePatternDetector>(),
                                                             std::make_shared<cadence::patterns::ContactPatternDetector>()});

  const auto report = orchestrator.DetectPatterns(TwoBlockDay());
  assert(!report.error);
  assert(report.errors.empty());
  assert(report.response_analysis.response_times);

  bool has_response = false;
  bool has_time     = false;
  for (const auto& pattern : report.detected_patterns) {
    has_response = has_response || pattern.pattern_type == "response_time";
    has_time     = has_time || pattern.pattern_type == "time";
    assert(pattern.confidence.has_value());
    assert(pattern.pattern_significance >= 0.0);
    assert(pattern.pattern_significance <= 1.0);
  }
  assert(has_response);
  assert(has_time);

  for (std::size_t i = 1; i < report.detected_patterns.size(); ++i) {
    assert(report.detected_patterns[i - 1].pattern_significance >= report.detected_patterns[i].pattern_significance);
  }
}

void TestSiblingFailuresAreIsolated() {
  const PatternOrchestrator orchestrator(DefaultAnalyzer(), {std::make_shared<ThrowingDetector>(), std::make_shared<DegradedDetector>(),
                                                             std::make_shared<cadence::patterns::TimePatternDetector>()});

  const auto report = orchestrator.DetectPatterns(TwoBlockDay());
  assert(!report.error);
  assert(report.errors.size() == 2);
  assert(report.errors[0] == "OverlapDetector: index out of range");
  assert(report.errors[1] == "SeasonalityDetector: not enough history");
  assert(!report.detected_patterns.empty());
  assert(std::any_of(report.anomalies.begin(), report.anomalies.end(), [](const auto& a) { return a.type == "gap"; }));
}

void TestMlFailureIsReportedAsError() {
  AnalysisOptions options;
  options.ml_enabled = true;
  auto analyzer      = std::make_shared<const ResponseAnalyzer>(options, nullptr, std::make_shared<UntrainedModel>());

  const auto report = PatternOrchestrator(analyzer).DetectPatterns(TwoBlockDay());
  assert(!report.error);
  assert(Contains(report.errors, "ResponseAnalyzer: ml augmentation failed: model not trained"));
  assert(!report.detected_patterns.empty());
}

void TestAnomalyStageFailureIsReportedAsError() {
  auto analyzer = std::make_shared<const ResponseAnalyzer>(AnalysisOptions{}, nullptr, nullptr, std::make_shared<CrashingAnomalyDetector>());

  const auto report = PatternOrchestrator(analyzer).DetectPatterns(TwoBlockDay());
  assert(!report.error);
  assert(report.errors.size() == 1);
  assert(report.errors[0] == "ResponseAnalyzer anomalies: severity overflow");
  assert(report.response_analysis.anomalies_error);
  assert(!report.detected_patterns.empty());
}

void TestNullAnalyzerIsRejected() {
  bool threw = false;
  try {
    PatternOrchestrator orchestrator(nullptr);
  } catch (const cadence::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyInputReturnsOnlyError();
  TestValidationFailureIsLowercased();
  TestPatternsFromEverySourceAreRanked();
  TestSiblingFailuresAreIsolated();
  TestMlFailureIsReportedAsError();
  TestAnomalyStageFailureIsReportedAsError();
  TestNullAnalyzerIsRejected();

  std::cout << "cadence_unit_pattern_orchestrator: pass\n";
  return 0;
}

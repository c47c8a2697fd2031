#include "internal/analysis/response_analyzer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using cadence::analysis::AnalysisOptions;
using cadence::analysis::ResponseAnalyzer;
using cadence::ingest::RawTable;
using cadence::ingest::RecordTable;
using cadence::model::MlAugmentation;
using cadence::model::ResponseAnalysis;

RawTable MakeTable(std::vector<std::string> times, std::vector<std::string> counterparties, std::vector<std::string> directions) {
  RawTable table;
  table.AddColumn("timestamp", std::move(times));
  table.AddColumn("counterparty_id", std::move(counterparties));
  table.AddColumn("direction", std::move(directions));
  return table;
}

RawTable TwoBlockDay() {
  return MakeTable({"2023-01-02 10:00:00", "2023-01-02 10:02:00", "2023-01-02 10:05:00", "2023-01-02 10:07:00", "2023-01-02 14:00:00",
                    "2023-01-02 15:00:00", "2023-01-02 15:30:00", "2023-01-02 17:00:00"},
                   {"a", "a", "a", "a", "b", "b", "b", "b"},
                   {"sent", "received", "sent", "received", "received", "sent", "received", "sent"});
}

class FakeMlService final : public cadence::collaborators::MlService {
 public:
  std::optional<MlAugmentation> Predict(const std::string& model_name, const RecordTable&, const cadence::ingest::ColumnMapping&) override {
    ++calls;
    if (fail || calls <= fail_first) {
      throw std::runtime_error("model not trained");
    }
    MlAugmentation augmentation;
    augmentation.model_name  = model_name;
    augmentation.predictions = {{"b", 1200.0, 1.5}};

    cadence::model::Anomaly anomaly;
    anomaly.type         = "ml_anomaly";
    anomaly.counterparty = "b";
    anomaly.severity     = 0.3;
    augmentation.anomalies.push_back(anomaly);
    return augmentation;
  }

  int  calls{0};
  int  fail_first{0};
  bool fail{false};
};

class BrokenCache final : public cadence::cache::ResultCache {
 public:
  std::optional<ResponseAnalysis> Get(const std::string&) override {
    if (fail_get) {
      throw std::runtime_error("backend down");
    }
    return std::nullopt;
  }
  void Put(const std::string&, const ResponseAnalysis&) override {
    throw std::runtime_error("backend down");
  }

  bool fail_get{true};
};

class ThrowingAnomalyDetector final : public cadence::analysis::AnomalyDetector {
 public:
  std::vector<cadence::model::Anomaly> Detect(const cadence::util::Result<cadence::model::TimingStatistics>&,
                                              const cadence::util::Result<cadence::model::ReciprocityAnalysis>&) const override {
    throw std::runtime_error("detector crashed");
  }
};

AnalysisOptions MlOptions() {
  AnalysisOptions options;
  options.ml_enabled = true;
  return options;
}

void TestFullAnalysisPopulatesEveryStage() {
  const auto result = ResponseAnalyzer({}).Analyze(TwoBlockDay());

  assert(!result.error);
  assert(result.response_times);
  assert(result.response_times->total_pairs == 3);
  assert(std::abs(*result.response_times->average_seconds - 3060.0) < 1e-9);
  assert(result.reciprocity);
  assert(result.reciprocity->counterparties.size() == 2);
  assert(result.conversation_flows);
  assert(result.conversation_flows->conversation_count > 0);
  assert(!result.ml_enhanced);
  assert(!result.ml_error);
  assert(result.collaborator_errors.empty());
}

void TestValidationFailureSetsOnlyError() {
  RawTable table;
  table.AddColumn("timestamp", {"2023-01-02 10:00:00"});

  const auto result = ResponseAnalyzer({}).Analyze(table);
  assert(result.error);
  assert(*result.error == "missing required columns: [counterparty_id, direction]");
  assert(!result.response_times);
  assert(!result.reciprocity);
  assert(!result.conversation_flows);
  assert(result.anomalies.empty());

  const auto bad_direction = ResponseAnalyzer({}).Analyze(MakeTable({"2023-01-02 10:00:00"}, {"a"}, {"Sent"}));
  assert(bad_direction.error);
  assert(*bad_direction.error == "invalid direction value(s): {sent}");
}

void TestEmptyRecordTableIsRejected() {
  const auto result = ResponseAnalyzer({}).Analyze(RecordTable{});
  assert(result.error);
  assert(*result.error == "empty data provided for analysis");
}

void TestMlAugmentationIsMergedWhenEnabled() {
  auto ml = std::make_shared<FakeMlService>();

  const auto result = ResponseAnalyzer(MlOptions(), nullptr, ml).Analyze(TwoBlockDay());
  assert(ml->calls == 1);
  assert(result.ml_enhanced);
  assert(result.ml_enhanced->model_name == "ResponsePatternModel");
  assert(!result.anomalies.empty());
  assert(result.anomalies.back().type == "ml_anomaly");

  const auto disabled = ResponseAnalyzer({}, nullptr, ml).Analyze(TwoBlockDay());
  assert(ml->calls == 1);
  assert(!disabled.ml_enhanced);
}

void TestMlFailureIsRecordedNotFatal() {
  auto ml  = std::make_shared<FakeMlService>();
  ml->fail = true;

  const auto result = ResponseAnalyzer(MlOptions(), nullptr, ml).Analyze(TwoBlockDay());
  assert(!result.error);
  assert(result.response_times);
  assert(!result.ml_enhanced);
  assert(result.ml_error);
  assert(*result.ml_error == "model not trained");
}

void TestCacheServesRepeatedCalls() {
  auto ml    = std::make_shared<FakeMlService>();
  auto cache = std::make_shared<cadence::cache::MemoryResultCache>();

  const ResponseAnalyzer analyzer(MlOptions(), cache, ml);
  const auto             first  = analyzer.Analyze(TwoBlockDay());
  const auto             second = analyzer.Analyze(TwoBlockDay());

  assert(ml->calls == 1);
  assert(cache->Size() == 1);
  assert(second.response_times->total_pairs == first.response_times->total_pairs);
  assert(second.ml_enhanced);
}

void TestFailedAnalysisIsNotCached() {
  auto cache = std::make_shared<cadence::cache::MemoryResultCache>();
  (void)ResponseAnalyzer({}, cache).Analyze(RecordTable{});
  assert(cache->Size() == 0);
}

void TestCacheFailuresAreCollaboratorErrors() {
  // A failed lookup already degrades the result, so no store is attempted.
  const auto get_failed = ResponseAnalyzer({}, std::make_shared<BrokenCache>()).Analyze(TwoBlockDay());
  assert(!get_failed.error);
  assert(get_failed.response_times);
  assert(get_failed.collaborator_errors.size() == 1);
  assert(get_failed.collaborator_errors[0] == "cache get failed: backend down");

  auto cache      = std::make_shared<BrokenCache>();
  cache->fail_get = false;

  const auto put_failed = ResponseAnalyzer({}, cache).Analyze(TwoBlockDay());
  assert(!put_failed.error);
  assert(put_failed.collaborator_errors.size() == 1);
  assert(put_failed.collaborator_errors[0] == "cache put failed: backend down");
}

void TestDegradedResultIsNotCached() {
  auto ml        = std::make_shared<FakeMlService>();
  ml->fail_first = 1;
  auto cache     = std::make_shared<cadence::cache::MemoryResultCache>();

  const ResponseAnalyzer analyzer(MlOptions(), cache, ml);

  const auto first = analyzer.Analyze(TwoBlockDay());
  assert(first.ml_error);
  assert(*first.ml_error == "model not trained");
  assert(cache->Size() == 0);

  const auto second = analyzer.Analyze(TwoBlockDay());
  assert(ml->calls == 2);
  assert(!second.ml_error);
  assert(second.ml_enhanced);
  assert(cache->Size() == 1);

  const auto third = analyzer.Analyze(TwoBlockDay());
  assert(ml->calls == 2);
  assert(third.ml_enhanced);
}

void TestAnomalyStageFailureIsReported() {
  const ResponseAnalyzer analyzer({}, nullptr, nullptr, std::make_shared<ThrowingAnomalyDetector>());
  const auto             result = analyzer.Analyze(TwoBlockDay());

  assert(!result.error);
  assert(result.response_times);
  assert(result.reciprocity);
  assert(result.anomalies.empty());
  assert(result.anomalies_error);
  assert(*result.anomalies_error == "detector crashed");

  const auto healthy = ResponseAnalyzer({}).Analyze(TwoBlockDay());
  assert(!healthy.anomalies_error);
}

void TestSingleStageEntryPoints() {
  const ResponseAnalyzer analyzer({});

  const auto timing = analyzer.AnalyzeResponseTimes(TwoBlockDay());
  assert(timing);
  assert(timing->total_pairs == 3);

  const auto reciprocity = analyzer.DetectReciprocityPatterns(TwoBlockDay());
  assert(reciprocity);
  assert(reciprocity->counterparties.count("a") == 1);

  const auto flows = analyzer.AnalyzeConversationFlows(TwoBlockDay());
  assert(flows);

  RawTable missing;
  missing.AddColumn("timestamp", {"2023-01-02 10:00:00"});
  const auto failed = analyzer.AnalyzeResponseTimes(missing);
  assert(!failed);
  assert(failed.error == "missing required columns: [counterparty_id, direction]");
}

void TestStatisticalPrediction() {
  const auto prediction = ResponseAnalyzer({}).PredictResponseBehavior(TwoBlockDay(), "b");

  assert(!prediction.error);
  assert(prediction.method == "statistical");
  assert(prediction.expected_response_seconds);
  assert(*prediction.expected_response_seconds == 4500.0);
  assert(std::abs(prediction.confidence - 0.116) < 1e-9);
}

void TestPredictionConfidenceIsCapped() {
  std::vector<std::string> times;
  std::vector<std::string> counterparties;
  std::vector<std::string> directions;
  for (int i = 0; i < 200; ++i) {
    times.push_back("2023-01-02 " + std::string(i / 60 < 10 ? "0" : "") + std::to_string(i / 60) + ":" + (i % 60 < 10 ? "0" : "") +
                    std::to_string(i % 60) + ":00");
    counterparties.push_back("c");
    directions.push_back(i % 2 == 0 ? "received" : "sent");
  }

  const auto prediction = ResponseAnalyzer({}).PredictResponseBehavior(MakeTable(times, counterparties, directions), "c");
  assert(!prediction.error);
  assert(prediction.confidence == 0.5);
  assert(*prediction.expected_response_seconds == 60.0);
}

void TestPredictionErrors() {
  const ResponseAnalyzer analyzer({});

  assert(*analyzer.PredictResponseBehavior(TwoBlockDay(), "").error == "contact identifier cannot be empty");
  assert(*analyzer.PredictResponseBehavior(RawTable{}, "a").error == "cannot predict with empty data");
  assert(*analyzer.PredictResponseBehavior(TwoBlockDay(), "zz").error == "no data found for contact: zz");

  const auto one_sided = analyzer.PredictResponseBehavior(MakeTable({"2023-01-02 10:00:00", "2023-01-02 11:00:00"}, {"a", "a"}, {"sent", "sent"}), "a");
  assert(*one_sided.error == "insufficient data for prediction");
  assert(one_sided.method == "statistical");
  assert(one_sided.confidence == 0.1);
  assert(!one_sided.expected_response_seconds);
}

void TestMlPredictionIsPreferredAndClamped() {
  auto ml = std::make_shared<FakeMlService>();

  const ResponseAnalyzer analyzer(MlOptions(), nullptr, ml);
  const auto             prediction = analyzer.PredictResponseBehavior(TwoBlockDay(), "b");
  assert(prediction.method == "ml");
  assert(prediction.model_name == "ResponsePatternModel");
  assert(*prediction.expected_response_seconds == 1200.0);
  assert(prediction.confidence == 1.0);

  // No ML prediction for "a" falls back to statistics.
  const auto fallback = analyzer.PredictResponseBehavior(TwoBlockDay(), "a");
  assert(fallback.method == "statistical");

  ml->fail           = true;
  const auto failing = analyzer.PredictResponseBehavior(TwoBlockDay(), "b");
  assert(!failing.error);
  assert(failing.method == "statistical");
}

} // namespace

int main() {
  TestFullAnalysisPopulatesEveryStage();
  TestValidationFailureSetsOnlyError();
  TestEmptyRecordTableIsRejected();
  TestMlAugmentationIsMergedWhenEnabled();
  TestMlFailureIsRecordedNotFatal();
  TestCacheServesRepeatedCalls();
  TestFailedAnalysisIsNotCached();
  TestCacheFailuresAreCollaboratorErrors();
  TestDegradedResultIsNotCached();
  TestAnomalyStageFailureIsReported();
  TestSingleStageEntryPoints();
  TestStatisticalPrediction();
  TestPredictionConfidenceIsCapped();
  TestPredictionErrors();
  TestMlPredictionIsPreferredAndClamped();

  std::cout << "cadence_unit_response_analyzer: pass\n";
  return 0;
}

#pragma once

#include <memory>
#include <string>

#include "internal/analysis/analysis_options.hpp"
#include "internal/analysis/anomaly_detector.hpp"
#include "internal/cache/result_cache.hpp"
#include "internal/collaborators/ml_service.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"
#include "internal/util/result.hpp"

namespace cadence::analysis {

/*
  ResponseAnalyzer

  Runs timing, reciprocity, conversation flow and anomaly detection over
  one record set and folds them into a ResponseAnalysis.

  Failure policy:
    - validation failure: only `error` is set
    - timing failure: `error` is set, the call stops
    - any other stage: that stage carries an error stub, the rest continue
    - cache / ML failures: recorded, never fatal, and the result is not cached

  The cache and ML service are optional; without them the analyzer is a
  pure function of its input.
*/
class ResponseAnalyzer {
 public:
  explicit ResponseAnalyzer(AnalysisOptions options, std::shared_ptr<cadence::cache::ResultCache> cache = nullptr,
                            std::shared_ptr<cadence::collaborators::MlService> ml_service       = nullptr,
                            std::shared_ptr<const AnomalyDetector>             anomaly_detector = nullptr);

  cadence::model::ResponseAnalysis Analyze(const cadence::ingest::RawTable& table, const cadence::ingest::ColumnMapping& mapping = {}) const;
  cadence::model::ResponseAnalysis Analyze(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping = {}) const;

  cadence::util::Result<cadence::model::TimingStatistics>         AnalyzeResponseTimes(const cadence::ingest::RawTable&      table,
                                                                                       const cadence::ingest::ColumnMapping& mapping = {}) const;
  cadence::util::Result<cadence::model::ReciprocityAnalysis>      DetectReciprocityPatterns(const cadence::ingest::RawTable&      table,
                                                                                            const cadence::ingest::ColumnMapping& mapping = {}) const;
  cadence::util::Result<cadence::model::ConversationFlowAnalysis> AnalyzeConversationFlows(const cadence::ingest::RawTable&      table,
                                                                                           const cadence::ingest::ColumnMapping& mapping = {}) const;

  cadence::model::ResponsePrediction PredictResponseBehavior(const cadence::ingest::RawTable& table, const std::string& counterparty,
                                                             const cadence::ingest::ColumnMapping& mapping = {}) const;
  cadence::model::ResponsePrediction PredictResponseBehavior(const cadence::ingest::RecordTable& records, const std::string& counterparty,
                                                             const cadence::ingest::ColumnMapping& mapping = {}) const;

  const AnalysisOptions& options() const {
    return options_;
  }

 private:
  cadence::model::ResponseAnalysis Compute(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping) const;

  AnalysisOptions                                    options_;
  std::shared_ptr<cadence::cache::ResultCache>       cache_;
  std::shared_ptr<cadence::collaborators::MlService> ml_service_;
  std::shared_ptr<const AnomalyDetector>             anomaly_detector_;
};

} // namespace cadence::analysis

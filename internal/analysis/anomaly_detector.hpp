#pragma once

#include <vector>

#include "internal/model/analysis.hpp"
#include "internal/util/result.hpp"

namespace cadence::analysis {

/*
  Turns timing outliers and one-sided relationships into anomaly records.

  Response-time anomalies come first, then reciprocity anomalies. A failure
  in one kind yields zero anomalies of that kind and a warning; it never
  blocks the other kind.

  Detect and the per-kind steps are virtual so an analyzer can be given a
  different rule set.
*/
class AnomalyDetector {
 public:
  virtual ~AnomalyDetector() = default;

  virtual std::vector<cadence::model::Anomaly> Detect(const cadence::util::Result<cadence::model::TimingStatistics>&    timing,
                                              const cadence::util::Result<cadence::model::ReciprocityAnalysis>& reciprocity) const;

  // severity = min(1, |latency / average - 1|), or 1 without a positive average.
  static std::vector<cadence::model::Anomaly> ResponseTimeAnomalies(const cadence::model::TimingStatistics& timing);

  // One anomaly with severity 0.6 per only_sent / only_received counterparty.
  static std::vector<cadence::model::Anomaly> ReciprocityAnomalies(const cadence::model::ReciprocityAnalysis& reciprocity);

 protected:
  virtual std::vector<cadence::model::Anomaly> ResponseTimeStep(const cadence::model::TimingStatistics& timing) const;
  virtual std::vector<cadence::model::Anomaly> ReciprocityStep(const cadence::model::ReciprocityAnalysis& reciprocity) const;
};

} // namespace cadence::analysis

#pragma once

#include <cstddef>

#include "internal/analysis/analysis_options.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::analysis {

// Pure function of the two counts and the ratio thresholds.
cadence::model::RelationshipBalance ClassifyBalance(std::size_t sent, std::size_t received, double balance_low, double balance_high);

// sent / received with +inf for received-only-zero, 0 for sent-only-zero and 1 for no messages.
double MessageRatio(std::size_t sent, std::size_t received);

/*
  Per-counterparty balance and initiation behaviour.

  Initiations come from segmenting each counterparty's own timeline with the
  initiation timeout; the direction of the first record of every segment is
  counted as one initiation on that side.
*/
class ReciprocityAnalyzer {
 public:
  explicit ReciprocityAnalyzer(AnalysisOptions options);

  cadence::model::ReciprocityAnalysis Analyze(const cadence::ingest::RecordTable& table) const;

 private:
  AnalysisOptions options_;
};

} // namespace cadence::analysis

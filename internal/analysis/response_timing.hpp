#pragma once

#include <vector>

#include "internal/analysis/analysis_options.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::analysis {

// Histogram bin edges for response latencies, in seconds.
inline const std::vector<double>& LatencyBinEdges() {
  static const std::vector<double> kEdges{0, 60, 300, 900, 1800, 3600, 7200, 86400};
  return kEdges;
}

/*
  Finds Received -> Sent transitions between temporally adjacent records of
  the same counterparty. Latency = sent - received; pairs with latency <= 0
  are dropped. Output follows (counterparty, time) order.
*/
std::vector<cadence::model::ResponsePair> ExtractResponsePairs(const cadence::ingest::RecordTable& table);

class ResponseTimingAnalyzer {
 public:
  explicit ResponseTimingAnalyzer(AnalysisOptions options);

  cadence::model::TimingStatistics Analyze(const cadence::ingest::RecordTable& table) const;

  // Zero pairs produce an unpopulated result (no average, zero counts).
  cadence::model::TimingStatistics Summarize(std::vector<cadence::model::ResponsePair> pairs) const;

 private:
  AnalysisOptions options_;
};

} // namespace cadence::analysis

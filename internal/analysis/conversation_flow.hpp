#pragma once

#include "internal/analysis/analysis_options.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::analysis {

/*
  Conversation-level view of the whole log: global segmentation with the
  conversation timeout, start distributions, the five most common
  three-message direction sequences and turn-taking metrics.

  Sequences and turns only consider conversations with at least three
  records.
*/
class ConversationFlowAnalyzer {
 public:
  explicit ConversationFlowAnalyzer(AnalysisOptions options);

  cadence::model::ConversationFlowAnalysis Analyze(const cadence::ingest::RecordTable& table) const;

 private:
  AnalysisOptions options_;
};

} // namespace cadence::analysis

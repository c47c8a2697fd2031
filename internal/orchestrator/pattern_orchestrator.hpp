#pragma once

#include <memory>
#include <vector>

#include "internal/analysis/response_analyzer.hpp"
#include "internal/collaborators/sibling_detector.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/ingest/raw_table.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"

namespace cadence::orchestrator {

/*
  PatternOrchestrator

  Composes the response analyzer with the sibling detectors into one ranked
  PatternReport. Only input validation is a hard stop (top-level `error`);
  every analyzer, stage, cache, ML or sibling failure lands in `errors`
  and detection continues with whatever succeeded.
*/
class PatternOrchestrator {
 public:
  PatternOrchestrator(std::shared_ptr<const cadence::analysis::ResponseAnalyzer>           analyzer,
                      std::vector<std::shared_ptr<cadence::collaborators::SiblingDetector>> siblings = {});

  cadence::model::PatternReport DetectPatterns(const cadence::ingest::RawTable& table, const cadence::ingest::ColumnMapping& mapping = {}) const;
  cadence::model::PatternReport DetectPatterns(const cadence::ingest::RecordTable& records, const cadence::ingest::ColumnMapping& mapping = {}) const;

 private:
  std::shared_ptr<const cadence::analysis::ResponseAnalyzer>           analyzer_;
  std::vector<std::shared_ptr<cadence::collaborators::SiblingDetector>> siblings_;
};

} // namespace cadence::orchestrator

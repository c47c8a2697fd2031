#pragma once

#include "cadence/analysis/v1.hpp"
#include "service_context.hpp"

namespace cadence::service {

/*
  Wire-facing facade over the analyzer and orchestrator.

  Analysis failures come back inside the reports; only a malformed request
  (bad column mapping) or an internal fault escapes as an exception.
*/
class AnalysisService {
 public:
  explicit AnalysisService(ServiceContext ctx);

  cadence::analysis::v1::ResponseAnalysisReport AnalyzeResponses(const cadence::analysis::v1::AnalyzeRequest& req);
  cadence::analysis::v1::PatternReport          DetectPatterns(const cadence::analysis::v1::AnalyzeRequest& req);
  cadence::analysis::v1::PredictResponseReply   PredictResponse(const cadence::analysis::v1::PredictResponseRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace cadence::service

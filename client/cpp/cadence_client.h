#pragma once

#include <arrow/result.h>
#include <grpcpp/channel.h>

#include <map>
#include <memory>
#include <string>

#include "cadence/analysis/v1.hpp"

namespace cadence::client {

class AnalysisClient {
 public:
  explicit AnalysisClient(std::shared_ptr<grpc::Channel> channel);

  // Loads a CSV log into a wire batch; `aliases` maps standard keys
  // (timestamp, counterparty_id, direction) onto the file's column names.
  static arrow::Result<cadence::analysis::v1::RecordBatch> FromCsv(const std::string& path, const std::map<std::string, std::string>& aliases = {});

  arrow::Result<cadence::analysis::v1::ResponseAnalysisReport> AnalyzeResponses(const cadence::analysis::v1::AnalyzeRequest& request) const;

  arrow::Result<cadence::analysis::v1::PatternReport> DetectPatterns(const cadence::analysis::v1::AnalyzeRequest& request) const;

  arrow::Result<cadence::analysis::v1::PredictResponseReply> PredictResponse(const cadence::analysis::v1::PredictResponseRequest& request) const;

 private:
  std::unique_ptr<cadence::analysis::v1::AnalysisService::Stub> stub_;
};

} // namespace cadence::client

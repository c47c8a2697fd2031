#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "cadence/analysis/v1/analysis_service.grpc.pb.h"
#include "internal/service/analysis_service.hpp"

namespace cadence::grpc {

class AnalysisServer final : public cadence::analysis::v1::AnalysisService::Service {
 public:
  explicit AnalysisServer(std::shared_ptr<cadence::service::AnalysisService> svc);

  ::grpc::Status AnalyzeResponses(::grpc::ServerContext*, const cadence::analysis::v1::AnalyzeRequest*,
                                  cadence::analysis::v1::ResponseAnalysisReport*) override;

  ::grpc::Status DetectPatterns(::grpc::ServerContext*, const cadence::analysis::v1::AnalyzeRequest*,
                                cadence::analysis::v1::PatternReport*) override;

  ::grpc::Status PredictResponse(::grpc::ServerContext*, const cadence::analysis::v1::PredictResponseRequest*,
                                 cadence::analysis::v1::PredictResponseReply*) override;

 private:
  std::shared_ptr<cadence::service::AnalysisService> service_;
};

} // namespace cadence::grpc

#include "analysis_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace cadence::grpc {

using namespace cadence::analysis::v1;

AnalysisServer::AnalysisServer(std::shared_ptr<cadence::service::AnalysisService> svc) : service_(std::move(svc)) {
}

::grpc::Status AnalysisServer::AnalyzeResponses(::grpc::ServerContext*, const AnalyzeRequest* req, ResponseAnalysisReport* resp) {
  try {
    *resp = service_->AnalyzeResponses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::DetectPatterns(::grpc::ServerContext*, const AnalyzeRequest* req, PatternReport* resp) {
  try {
    *resp = service_->DetectPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalysisServer::PredictResponse(::grpc::ServerContext*, const PredictResponseRequest* req, PredictResponseReply* resp) {
  try {
    *resp = service_->PredictResponse(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace cadence::grpc

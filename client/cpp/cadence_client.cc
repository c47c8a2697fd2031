#include "client/cpp/cadence_client.h"

#include <arrow/status.h>
#include <grpcpp/client_context.h>

#include <exception>
#include <string>
#include <string_view>

#include "internal/ingest/arrow_csv_reader.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/service/report_codec.hpp"

namespace cadence::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

} // namespace

AnalysisClient::AnalysisClient(std::shared_ptr<grpc::Channel> channel) : stub_(cadence::analysis::v1::AnalysisService::NewStub(channel)) {
}

arrow::Result<cadence::analysis::v1::RecordBatch> AnalysisClient::FromCsv(const std::string& path, const std::map<std::string, std::string>& aliases) {
  try {
    const auto mapping = cadence::ingest::ColumnMapping::FromMap(aliases);
    return cadence::service::ToProto(cadence::ingest::ArrowCsvReader::Read(path, mapping));
  } catch (const std::exception& e) {
    return arrow::Status::IOError("load ", path, " failed: ", e.what());
  }
}

arrow::Result<cadence::analysis::v1::ResponseAnalysisReport> AnalysisClient::AnalyzeResponses(
    const cadence::analysis::v1::AnalyzeRequest& request) const {
  cadence::analysis::v1::ResponseAnalysisReport response;
  grpc::ClientContext                           ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->AnalyzeResponses(&ctx, request, &response), "AnalyzeResponses"));
  return response;
}

arrow::Result<cadence::analysis::v1::PatternReport> AnalysisClient::DetectPatterns(const cadence::analysis::v1::AnalyzeRequest& request) const {
  cadence::analysis::v1::PatternReport response;
  grpc::ClientContext                  ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->DetectPatterns(&ctx, request, &response), "DetectPatterns"));
  return response;
}

arrow::Result<cadence::analysis::v1::PredictResponseReply> AnalysisClient::PredictResponse(
    const cadence::analysis::v1::PredictResponseRequest& request) const {
  cadence::analysis::v1::PredictResponseReply response;
  grpc::ClientContext                         ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->PredictResponse(&ctx, request, &response), "PredictResponse"));
  return response;
}

} // namespace cadence::client

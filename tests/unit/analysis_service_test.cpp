#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "cadence/analysis/v1.hpp"
#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/analysis_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/analysis_service.hpp"
#include "internal/service/report_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace cadence::analysis::v1;

void AddColumn(RecordBatch& batch, const std::string& name, const std::vector<std::string>& values) {
  auto* column = batch.add_columns();
  column->set_name(name);
  for (const auto& value : values) {
    column->add_values(value);
  }
}

RecordBatch TwoBlockDay(const std::string& counterparty_column = "counterparty_id") {
  RecordBatch batch;
  AddColumn(batch, "timestamp",
            {"2023-01-02 10:00:00", "2023-01-02 10:02:00", "2023-01-02 10:05:00", "2023-01-02 10:07:00", "2023-01-02 14:00:00", "2023-01-02 15:00:00",
             "2023-01-02 15:30:00", "2023-01-02 17:00:00"});
  AddColumn(batch, counterparty_column, {"a", "a", "a", "a", "b", "b", "b", "b"});
  AddColumn(batch, "direction", {"sent", "received", "sent", "received", "received", "sent", "received", "sent"});
  return batch;
}

std::shared_ptr<cadence::service::AnalysisService> BuildService() {
  return std::make_shared<cadence::service::AnalysisService>(cadence::factory::BuildContext(cadence::runtime::config::RuntimeConfig{}));
}

void TestRecordBatchConversion() {
  const auto table = cadence::service::FromProto(TwoBlockDay());
  assert(table.RowCount() == 8);
  assert(table.FindColumn("counterparty_id")->values[4] == "b");

  const auto batch = cadence::service::ToProto(table);
  assert(batch.columns_size() == 3);
  assert(batch.columns(2).name() == "direction");
  assert(batch.columns(2).values(7) == "sent");
}

void TestRequestMappingOverlaysDefaults() {
  auto defaults = cadence::ingest::ColumnMapping::FromMap({{"counterparty_id", "phone_number"}});

  AnalyzeRequest req;
  (*req.mutable_column_mapping())["direction"] = "message_type";

  const auto merged = cadence::service::MergeMapping(defaults, req.column_mapping());
  assert(merged.counterparty_column() == "phone_number");
  assert(merged.direction_column() == "message_type");
  assert(merged.timestamp_column() == "timestamp");

  (*req.mutable_column_mapping())["sender"] = "from";
  bool threw = false;
  try {
    (void)cadence::service::MergeMapping(defaults, req.column_mapping());
  } catch (const cadence::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestAnalyzeResponsesReturnsEveryStage() {
  cadence::grpc::AnalysisServer server(BuildService());

  AnalyzeRequest req;
  *req.mutable_records() = TwoBlockDay();
  ResponseAnalysisReport resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.AnalyzeResponses(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.has_error());
  assert(resp.response_times_result_case() == ResponseAnalysisReport::kResponseTimes);
  assert(resp.response_times().total_pairs() == 3);
  assert(resp.response_times().average_seconds() == 3060.0);
  assert(resp.reciprocity_result_case() == ResponseAnalysisReport::kReciprocityPatterns);
  assert(resp.reciprocity_patterns().counterparties_size() == 2);
  assert(resp.reciprocity_patterns().counterparties(0).relationship_balance() == "balanced");
  assert(resp.conversation_flows_result_case() == ResponseAnalysisReport::kConversationFlows);
}

void TestRequestMappingIsApplied() {
  cadence::grpc::AnalysisServer server(BuildService());

  AnalyzeRequest req;
  *req.mutable_records()                             = TwoBlockDay("phone_number");
  (*req.mutable_column_mapping())["counterparty_id"] = "phone_number";
  ResponseAnalysisReport resp;
  ::grpc::ServerContext  grpc_ctx;

  assert(server.AnalyzeResponses(&grpc_ctx, &req, &resp).ok());
  assert(!resp.has_error());
  assert(resp.response_times().total_pairs() == 3);
}

void TestValidationFailureIsReportedInBody() {
  cadence::grpc::AnalysisServer server(BuildService());

  AnalyzeRequest req;
  *req.mutable_records() = TwoBlockDay("phone_number");
  ResponseAnalysisReport resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.AnalyzeResponses(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.has_error());
  assert(resp.error() == "missing required columns: [counterparty_id]");
  assert(resp.response_times_result_case() == ResponseAnalysisReport::RESPONSE_TIMES_RESULT_NOT_SET);
  assert(resp.anomalies_size() == 0);
}

void TestStageErrorsAreEncoded() {
  cadence::model::ResponseAnalysis analysis;
  analysis.response_times     = cadence::util::Result<cadence::model::TimingStatistics>::Ok({});
  analysis.conversation_flows = cadence::util::Result<cadence::model::ConversationFlowAnalysis>::Err("flow failed");
  analysis.anomalies_error    = "detector crashed";

  const auto report = cadence::service::ToProto(analysis);
  assert(!report.has_error());
  assert(report.conversation_flows_error() == "flow failed");
  assert(report.has_anomalies_error());
  assert(report.anomalies_error() == "detector crashed");
  assert(report.anomalies_size() == 0);

  const auto clean = cadence::service::ToProto(cadence::model::ResponseAnalysis{});
  assert(!clean.has_anomalies_error());
}

void TestUnknownMappingKeyIsInvalidArgument() {
  cadence::grpc::AnalysisServer server(BuildService());

  AnalyzeRequest req;
  *req.mutable_records()                    = TwoBlockDay();
  (*req.mutable_column_mapping())["sender"] = "from";
  PatternReport         resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.DetectPatterns(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestDetectPatterns() {
  cadence::grpc::AnalysisServer server(BuildService());

  AnalyzeRequest req;
  *req.mutable_records() = TwoBlockDay();
  PatternReport         resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.DetectPatterns(&grpc_ctx, &req, &resp).ok());
  assert(!resp.has_error());
  assert(resp.errors_size() == 0);
  assert(resp.detected_patterns_size() > 0);
  for (int i = 1; i < resp.detected_patterns_size(); ++i) {
    assert(resp.detected_patterns(i - 1).pattern_significance() >= resp.detected_patterns(i).pattern_significance());
  }
  assert(resp.response_analysis().response_times().total_pairs() == 3);

  AnalyzeRequest        empty;
  PatternReport         empty_resp;
  ::grpc::ServerContext empty_ctx;
  assert(server.DetectPatterns(&empty_ctx, &empty, &empty_resp).ok());
  assert(empty_resp.has_error());
  assert(empty_resp.detected_patterns_size() == 0);
}

void TestPredictResponse() {
  cadence::grpc::AnalysisServer server(BuildService());

  PredictResponseRequest req;
  *req.mutable_records() = TwoBlockDay();
  req.set_counterparty("b");
  PredictResponseReply  resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.PredictResponse(&grpc_ctx, &req, &resp).ok());
  assert(!resp.has_error());
  assert(resp.has_expected_response_seconds());
  assert(resp.expected_response_seconds() == 4500.0);
  assert(resp.method() == "statistical");

  req.set_counterparty("");
  PredictResponseReply  missing;
  ::grpc::ServerContext missing_ctx;
  assert(server.PredictResponse(&missing_ctx, &req, &missing).ok());
  assert(missing.error() == "contact identifier cannot be empty");
  assert(!missing.has_expected_response_seconds());
}

void TestExceptionsMapToStatusCodes() {
  using cadence::grpc::ToStatus;

  assert(ToStatus(cadence::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(cadence::util::InvalidArgument("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(cadence::util::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(cadence::util::CollaboratorError("down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestServiceRequiresEngine() {
  bool threw = false;
  try {
    cadence::service::AnalysisService service(cadence::service::ServiceContext{});
  } catch (const cadence::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFactoryRegistersAnalysisServer() {
  cadence::runtime::config::RuntimeConfig config;
  config.mutable_cache()->set_enabled(true);

  auto app = cadence::factory::Build(config);
  assert(app.analysis_service);
  assert(app.context.analyzer);
  assert(app.context.orchestrator);
  assert(app.grpc_services.size() == 1);
}

} // namespace

int main() {
  TestRecordBatchConversion();
  TestRequestMappingOverlaysDefaults();
  TestAnalyzeResponsesReturnsEveryStage();
  TestRequestMappingIsApplied();
  TestValidationFailureIsReportedInBody();
  TestStageErrorsAreEncoded();
  TestUnknownMappingKeyIsInvalidArgument();
  TestDetectPatterns();
  TestPredictResponse();
  TestExceptionsMapToStatusCodes();
  TestServiceRequiresEngine();
  TestFactoryRegistersAnalysisServer();

  std::cout << "cadence_unit_analysis_service: pass\n";
  return 0;
}

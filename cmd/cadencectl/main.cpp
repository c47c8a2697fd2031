#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "cadence/analysis/v1.hpp"
#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/ingest/arrow_csv_reader.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/service/analysis_service.hpp"
#include "internal/service/report_codec.hpp"

using namespace cadence::analysis::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cadencectl <addr|local> analyze <file.csv> [key=column ...]\n"
            << "  cadencectl <addr|local> patterns <file.csv> [key=column ...]\n"
            << "  cadencectl <addr|local> predict <file.csv> <counterparty> [key=column ...]\n"
            << "\n"
            << "  keys: timestamp, counterparty_id (phone_number), direction (message_type)\n"
            << "  addr 'local' runs the engine in-process with default settings\n";
}

static bool ParseAliases(int argc, char** argv, int first, std::map<std::string, std::string>* aliases) {
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
      std::cerr << "invalid column mapping: '" << arg << "' (expected key=column)\n";
      return false;
    }
    (*aliases)[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return true;
}

static int PrintJson(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render report: " << status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];
  const std::string path = argv[3];

  std::string counterparty;
  int         first_alias = 4;
  if (cmd == "predict") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    counterparty = argv[4];
    first_alias  = 5;
  } else if (cmd != "analyze" && cmd != "patterns") {
    Usage();
    return 1;
  }

  std::map<std::string, std::string> aliases;
  if (!ParseAliases(argc, argv, first_alias, &aliases)) {
    return 1;
  }

  RecordBatch batch;
  try {
    const auto mapping = cadence::ingest::ColumnMapping::FromMap(aliases);
    batch              = cadence::service::ToProto(cadence::ingest::ArrowCsvReader::Read(path, mapping));
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  AnalyzeRequest         analyze_req;
  PredictResponseRequest predict_req;
  *analyze_req.mutable_records() = batch;
  *predict_req.mutable_records() = batch;
  predict_req.set_counterparty(counterparty);
  for (const auto& [key, column] : aliases) {
    (*analyze_req.mutable_column_mapping())[key] = column;
    (*predict_req.mutable_column_mapping())[key] = column;
  }

  // ------------------------------------------------------------

  if (addr == "local") {
    try {
      cadence::runtime::config::RuntimeConfig config;
      cadence::service::AnalysisService       service(cadence::factory::BuildContext(config));

      if (cmd == "analyze") return PrintJson(service.AnalyzeResponses(analyze_req));
      if (cmd == "patterns") return PrintJson(service.DetectPatterns(analyze_req));
      return PrintJson(service.PredictResponse(predict_req));
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 2;
    }
  }

  // ------------------------------------------------------------

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AnalysisService::NewStub(channel);

  grpc::ClientContext ctx;

  if (cmd == "analyze") {
    ResponseAnalysisReport resp;
    auto                   status = stub->AnalyzeResponses(&ctx, analyze_req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return PrintJson(resp);
  }

  if (cmd == "patterns") {
    PatternReport resp;
    auto          status = stub->DetectPatterns(&ctx, analyze_req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return PrintJson(resp);
  }

  PredictResponseReply resp;
  auto                 status = stub->PredictResponse(&ctx, predict_req, &resp);
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  return PrintJson(resp);
}

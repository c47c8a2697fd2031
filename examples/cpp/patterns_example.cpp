#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/cadence_client.h"
#include "cadence/analysis/v1.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: patterns_example <file.csv> [endpoint]\n";
    return 1;
  }
  const std::string path   = argv[1];
  const std::string target = argc > 2 ? argv[2] : "localhost:50061";

  cadence::client::AnalysisClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto batch = cadence::client::AnalysisClient::FromCsv(path);
  if (!batch.ok()) {
    std::cerr << batch.status().ToString() << '\n';
    return 1;
  }

  cadence::analysis::v1::AnalyzeRequest request;
  *request.mutable_records() = *batch;

  auto result = client.DetectPatterns(request);
  if (!result.ok()) {
    std::cerr << "DetectPatterns RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& report = result.ValueOrDie();
  if (report.has_error()) {
    std::cerr << "analysis rejected input: " << report.error() << '\n';
    return 1;
  }

  // Patterns arrive ranked by pattern_significance, highest first.
  std::cout << report.detected_patterns_size() << " patterns, " << report.anomalies_size() << " anomalies\n";
  for (const auto& pattern : report.detected_patterns()) {
    std::cout << "  [" << pattern.pattern_type() << "/" << pattern.subtype() << "] " << pattern.description()
              << " (significance=" << pattern.pattern_significance() << ")\n";
  }
  for (const auto& error : report.errors()) {
    std::cout << "  partial failure: " << error << '\n';
  }

  return 0;
}

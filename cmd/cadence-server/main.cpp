#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "internal/config/analysis_settings.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

using cadence::observability::StringField;

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

// Accepts `cadence-server <config.yaml>` and `cadence-server --config <config.yaml>`.
std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) != "--config") {
    return std::string(argv[1]);
  }
  if (argc == 3 && std::string(argv[1]) == "--config") {
    return std::string(argv[2]);
  }
  return std::nullopt;
}

void StopObservability() {
  cadence::observability::ShutdownLogging();
  cadence::observability::ShutdownMetrics();
  cadence::observability::ShutdownTracing();
}

int Serve(const cadence::runtime::config::RuntimeConfig& config) {
  // Fails fast on invalid thresholds before any port is bound.
  const auto options = cadence::config::ResolveAnalysisOptions(config);
  const auto cache   = cadence::config::ResolveCacheSettings(config);
  CADENCE_LOG_INFO("analysis engine settings", cadence::config::DescribeSettings(options, cache));

  auto app = cadence::factory::Build(config);

  const auto&              bind_address = config.server().bind_address();
  cadence::runtime::Server server(bind_address, std::move(app.grpc_services));

  std::signal(SIGINT, RequestStop);
  std::signal(SIGTERM, RequestStop);

  server.Start();
  CADENCE_LOG_INFO("cadence server listening", {StringField("bind_address", bind_address)});

  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  }

  CADENCE_LOG_INFO("stop requested, draining in-flight analyses");
  server.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << "usage: cadence-server <config.yaml>\n"
              << "       cadence-server --config <config.yaml>\n";
    return 1;
  }

  cadence::runtime::config::RuntimeConfig config;
  try {
    config = cadence::config::ConfigLoader::LoadFromYaml(*config_path);
  } catch (const std::exception& e) {
    std::cerr << "cadence-server: cannot load " << *config_path << ": " << e.what() << '\n';
    return 2;
  }

  cadence::observability::InitializeLogging(config);
  cadence::observability::InitializeTracing(config);
  cadence::observability::InitializeMetrics(config);

  int exit_code = 0;
  try {
    exit_code = Serve(config);
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("cadence server failed", {StringField("config", *config_path), StringField("error", e.what())});
    exit_code = 2;
  }

  StopObservability();
  return exit_code;
}

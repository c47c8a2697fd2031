#include "factory.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "internal/analysis/response_analyzer.hpp"
#include "internal/cache/result_cache.hpp"
#include "internal/config/analysis_settings.hpp"
#include "internal/grpc/analysis_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/orchestrator/pattern_orchestrator.hpp"
#include "internal/patterns/contact_pattern_detector.hpp"
#include "internal/patterns/time_pattern_detector.hpp"

namespace cadence::factory {

using cadence::observability::BoolField;
using cadence::observability::IntField;
using cadence::observability::StringField;

namespace {

std::shared_ptr<cache::ResultCache> BuildCache(const cadence::runtime::config::RuntimeConfig& config) {
  const auto settings = cadence::config::ResolveCacheSettings(config);
  if (!settings.enabled) {
    return nullptr;
  }
  CADENCE_LOG_INFO("result cache enabled",
                   {IntField("ttl_seconds", settings.ttl.count()), IntField("max_entries", static_cast<std::int64_t>(settings.max_entries))});
  return std::make_shared<cache::MemoryResultCache>(settings.ttl, settings.max_entries);
}

} // namespace

/*
    Build analysis dependency graph
*/
service::ServiceContext BuildContext(const cadence::runtime::config::RuntimeConfig& config, std::shared_ptr<collaborators::MlService> ml_service) {
  auto options = cadence::config::ResolveAnalysisOptions(config);
  if (options.ml_enabled && !ml_service) {
    CADENCE_LOG_WARN("ml augmentation enabled but no ml service is available", {StringField("model_name", options.ml_model_name)});
  }

  // ------------------------------------------------------------------
  // Analyzer
  // ------------------------------------------------------------------
  auto analyzer = std::make_shared<const analysis::ResponseAnalyzer>(options, BuildCache(config), std::move(ml_service));

  // ------------------------------------------------------------------
  // Orchestrator and sibling detectors
  // ------------------------------------------------------------------
  std::vector<std::shared_ptr<collaborators::SiblingDetector>> siblings;
  siblings.push_back(std::make_shared<patterns::TimePatternDetector>());
  siblings.push_back(std::make_shared<patterns::ContactPatternDetector>());

  service::ServiceContext ctx;
  ctx.analyzer        = analyzer;
  ctx.orchestrator    = std::make_shared<const orchestrator::PatternOrchestrator>(analyzer, std::move(siblings));
  ctx.default_mapping = cadence::config::ResolveColumnMapping(config);

  CADENCE_LOG_DEBUG("analysis engine built", {BoolField("ml_enabled", options.ml_enabled), IntField("siblings", 2)});
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const cadence::runtime::config::RuntimeConfig& config) {
  Application app;
  app.context          = BuildContext(config);
  app.analysis_service = std::make_shared<service::AnalysisService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AnalysisServer>(app.analysis_service));

  return app;
}

} // namespace cadence::factory

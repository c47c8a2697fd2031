#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/collaborators/ml_service.hpp"
#include "internal/service/analysis_service.hpp"
#include "internal/service/service_context.hpp"

namespace cadence::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  cadence::service::ServiceContext                   context;
  std::shared_ptr<cadence::service::AnalysisService> analysis_service;
  std::vector<std::unique_ptr<::grpc::Service>>      grpc_services;
};

/*
  BuildContext

  Wires analyzer, cache and sibling detectors from the runtime config.
  The ML service is optional; when the config enables ML and none is
  supplied, analysis runs without augmentation.
*/
cadence::service::ServiceContext BuildContext(const cadence::runtime::config::RuntimeConfig&     config,
                                              std::shared_ptr<cadence::collaborators::MlService> ml_service = nullptr);

// Composition root of the server.
Application Build(const cadence::runtime::config::RuntimeConfig& config);

} // namespace cadence::factory

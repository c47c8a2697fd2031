#pragma once

#include <memory>

#include "internal/ingest/column_mapping.hpp"

namespace cadence::analysis { class ResponseAnalyzer; }
namespace cadence::orchestrator { class PatternOrchestrator; }

namespace cadence::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<const cadence::analysis::ResponseAnalyzer>        analyzer;
  std::shared_ptr<const cadence::orchestrator::PatternOrchestrator> orchestrator;
  cadence::ingest::ColumnMapping                                    default_mapping;
};

} // namespace cadence::service

#pragma once

#include <chrono>
#include <cstddef>

#include "config/config.pb.h"
#include "internal/analysis/analysis_options.hpp"
#include "internal/ingest/column_mapping.hpp"
#include "internal/observability/logging.hpp"

namespace cadence::config {

struct CacheSettings {
  bool                 enabled{false};
  std::chrono::seconds ttl{3600};
  std::size_t          max_entries{256};
};

// Applies defaults for unset fields. Throws util::InvalidArgument when
// balance_low > balance_high, a threshold is negative or a timeout is not
// positive.
cadence::analysis::AnalysisOptions ResolveAnalysisOptions(const cadence::runtime::config::RuntimeConfig& config);

// Throws util::InvalidArgument on an unknown mapping key.
cadence::ingest::ColumnMapping ResolveColumnMapping(const cadence::runtime::config::RuntimeConfig& config);

CacheSettings ResolveCacheSettings(const cadence::runtime::config::RuntimeConfig& config);

// Effective engine settings as log fields, in a fixed order.
cadence::observability::LogFields DescribeSettings(const cadence::analysis::AnalysisOptions& options, const CacheSettings& cache);

} // namespace cadence::config

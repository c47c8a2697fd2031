#pragma once

#include <string>

namespace cadence::analysis {

/*
  Tunables consumed by the engine. Built from RuntimeConfig by
  config::ResolveAnalysisOptions; defaults apply when a field is unset.
*/
struct AnalysisOptions {
  double quick_threshold_seconds{300.0};
  double delayed_threshold_seconds{3600.0};
  double conversation_timeout_seconds{3600.0};

  double balance_low{0.4};
  double balance_high{0.6};
  double initiation_timeout_seconds{3600.0};

  double outlier_iqr_k{1.5};

  bool        ml_enabled{false};
  std::string ml_model_name{"ResponsePatternModel"};
};

} // namespace cadence::analysis

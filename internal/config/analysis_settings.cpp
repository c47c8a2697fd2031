#include "internal/config/analysis_settings.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <string>

#include "internal/util/errors.hpp"

namespace cadence::config {
namespace {

void RequireNonNegative(double value, const char* name) {
  if (std::isnan(value) || value < 0.0) {
    throw cadence::util::InvalidArgument(std::string(name) + " must be non-negative");
  }
}

void RequirePositive(double value, const char* name) {
  if (std::isnan(value) || value <= 0.0) {
    throw cadence::util::InvalidArgument(std::string(name) + " must be positive");
  }
}

} // namespace

cadence::analysis::AnalysisOptions ResolveAnalysisOptions(const cadence::runtime::config::RuntimeConfig& config) {
  cadence::analysis::AnalysisOptions options;

  const auto& response = config.analysis().response();
  if (response.has_quick_threshold_seconds()) {
    options.quick_threshold_seconds = response.quick_threshold_seconds();
  }
  if (response.has_delayed_threshold_seconds()) {
    options.delayed_threshold_seconds = response.delayed_threshold_seconds();
  }
  if (response.has_conversation_timeout_seconds()) {
    options.conversation_timeout_seconds = response.conversation_timeout_seconds();
  }

  const auto& reciprocity = config.analysis().reciprocity();
  if (reciprocity.has_balance_low()) {
    options.balance_low = reciprocity.balance_low();
  }
  if (reciprocity.has_balance_high()) {
    options.balance_high = reciprocity.balance_high();
  }
  if (reciprocity.has_initiation_timeout_seconds()) {
    options.initiation_timeout_seconds = reciprocity.initiation_timeout_seconds();
  }

  const auto& ml     = config.analysis().ml();
  options.ml_enabled = ml.enabled();
  if (!ml.model_name().empty()) {
    options.ml_model_name = ml.model_name();
  }

  RequireNonNegative(options.quick_threshold_seconds, "quick_threshold_seconds");
  RequireNonNegative(options.delayed_threshold_seconds, "delayed_threshold_seconds");
  RequirePositive(options.conversation_timeout_seconds, "conversation_timeout_seconds");
  RequirePositive(options.initiation_timeout_seconds, "initiation_timeout_seconds");
  RequireNonNegative(options.balance_low, "balance_low");
  RequireNonNegative(options.balance_high, "balance_high");
  if (options.balance_low > options.balance_high) {
    throw cadence::util::InvalidArgument("balance_low must not exceed balance_high");
  }

  return options;
}

cadence::ingest::ColumnMapping ResolveColumnMapping(const cadence::runtime::config::RuntimeConfig& config) {
  const auto& aliases = config.analysis().column_mapping();
  return cadence::ingest::ColumnMapping::FromMap(std::map<std::string, std::string>(aliases.begin(), aliases.end()));
}

CacheSettings ResolveCacheSettings(const cadence::runtime::config::RuntimeConfig& config) {
  CacheSettings settings;
  const auto&   cache = config.cache();
  settings.enabled    = cache.enabled();
  if (cache.has_ttl_seconds()) {
    settings.ttl = std::chrono::seconds(static_cast<std::int64_t>(cache.ttl_seconds()));
  }
  if (cache.has_max_entries()) {
    settings.max_entries = static_cast<std::size_t>(cache.max_entries());
  }
  return settings;
}

cadence::observability::LogFields DescribeSettings(const cadence::analysis::AnalysisOptions& options, const CacheSettings& cache) {
  using cadence::observability::BoolField;
  using cadence::observability::DoubleField;
  using cadence::observability::IntField;

  cadence::observability::LogFields fields = {
      DoubleField("quick_threshold_seconds", options.quick_threshold_seconds),
      DoubleField("delayed_threshold_seconds", options.delayed_threshold_seconds),
      DoubleField("conversation_timeout_seconds", options.conversation_timeout_seconds),
      DoubleField("balance_low", options.balance_low),
      DoubleField("balance_high", options.balance_high),
      BoolField("ml_enabled", options.ml_enabled),
      BoolField("cache_enabled", cache.enabled),
  };
  if (options.ml_enabled) {
    fields.push_back(cadence::observability::StringField("ml_model", options.ml_model_name));
  }
  if (cache.enabled) {
    fields.push_back(IntField("cache_ttl_seconds", cache.ttl.count()));
    fields.push_back(IntField("cache_max_entries", static_cast<std::int64_t>(cache.max_entries)));
  }
  return fields;
}

} // namespace cadence::config

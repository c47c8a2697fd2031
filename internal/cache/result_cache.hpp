#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "internal/analysis/analysis_options.hpp"
#include "internal/ingest/record_table.hpp"
#include "internal/model/analysis.hpp"
#include "internal/util/time.hpp"

namespace cadence::cache {

/*
  Memoization capability consulted by the analyzer. The engine only calls
  Get / Put; lifetime and eviction belong to the implementation. Either call
  may throw; callers record the failure and carry on.
*/
class ResultCache {
 public:
  virtual ~ResultCache() = default;

  virtual std::optional<cadence::model::ResponseAnalysis> Get(const std::string& key) = 0;
  virtual void Put(const std::string& key, const cadence::model::ResponseAnalysis& value) = 0;
};

class NoopResultCache final : public ResultCache {
 public:
  std::optional<cadence::model::ResponseAnalysis> Get(const std::string&) override {
    return std::nullopt;
  }
  void Put(const std::string&, const cadence::model::ResponseAnalysis&) override {
  }
};

/*
  In-process cache with a TTL and an entry cap. When full, the entry with
  the oldest insertion time is evicted. Safe for concurrent callers.
*/
class MemoryResultCache final : public ResultCache {
 public:
  using ClockFn = std::function<cadence::util::TimePoint()>;

  explicit MemoryResultCache(std::chrono::seconds ttl = std::chrono::seconds(3600), std::size_t max_entries = 256, ClockFn clock = &cadence::util::Now);

  std::optional<cadence::model::ResponseAnalysis> Get(const std::string& key) override;
  void                                            Put(const std::string& key, const cadence::model::ResponseAnalysis& value) override;

  std::size_t Size() const;

 private:
  struct Entry {
    cadence::util::TimePoint         stored_at;
    cadence::model::ResponseAnalysis value;
  };

  bool Expired(const Entry& entry, cadence::util::TimePoint now) const;

  std::chrono::seconds         ttl_;
  std::size_t                  max_entries_;
  ClockFn                      clock_;
  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

// Identity/shape fingerprint of (operation, records, options).
std::string Fingerprint(std::string_view operation, const cadence::ingest::RecordTable& table, const cadence::analysis::AnalysisOptions& options);

} // namespace cadence::cache

#include "internal/cache/result_cache.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <utility>

namespace cadence::cache {
namespace {

// FNV-1a, 64 bit.
class Hasher {
 public:
  void Add(std::string_view bytes) {
    for (unsigned char c : bytes) {
      state_ ^= c;
      state_ *= 1099511628211ULL;
    }
    // Field separator so ("ab","c") != ("a","bc").
    state_ ^= 0xff;
    state_ *= 1099511628211ULL;
  }

  void Add(std::uint64_t value) {
    Add(std::string_view(reinterpret_cast<const char*>(&value), sizeof(value)));
  }

  void Add(double value) {
    Add(fmt::format("{}", value));
  }

  std::uint64_t value() const {
    return state_;
  }

 private:
  std::uint64_t state_{14695981039346656037ULL};
};

} // namespace

MemoryResultCache::MemoryResultCache(std::chrono::seconds ttl, std::size_t max_entries, ClockFn clock)
    : ttl_(ttl), max_entries_(std::max<std::size_t>(1, max_entries)), clock_(std::move(clock)) {
}

bool MemoryResultCache::Expired(const Entry& entry, cadence::util::TimePoint now) const {
  return now - entry.stored_at >= ttl_;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<cadence::model::ResponseAnalysis> MemoryResultCache::Get(const std::string& key) {
  const auto now = clock_();
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (!Expired(it->second, now)) {
      return it->second.value;
    }
  }

  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it != entries_.end() && Expired(it->second, now)) {
    entries_.erase(it);
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void MemoryResultCache::Put(const std::string& key, const cadence::model::ResponseAnalysis& value) {
  const auto       now = clock_();
  std::unique_lock lock(mutex_);

  std::erase_if(entries_, [&](const auto& item) { return Expired(item.second, now); });

  if (entries_.size() >= max_entries_ && entries_.find(key) == entries_.end()) {
    auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                   [](const auto& a, const auto& b) { return a.second.stored_at < b.second.stored_at; });
    entries_.erase(oldest);
  }

  entries_[key] = Entry{now, value};
}

std::size_t MemoryResultCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

// ------------------------------------------------------------
// Fingerprint
// ------------------------------------------------------------

std::string Fingerprint(std::string_view operation, const cadence::ingest::RecordTable& table, const cadence::analysis::AnalysisOptions& options) {
  Hasher hasher;
  hasher.Add(operation);
  hasher.Add(static_cast<std::uint64_t>(table.size()));
  for (const auto& record : table.records()) {
    hasher.Add(static_cast<std::uint64_t>(record.timestamp.time_since_epoch().count()));
    hasher.Add(record.counterparty);
    hasher.Add(cadence::model::ToString(record.direction));
  }

  hasher.Add(options.quick_threshold_seconds);
  hasher.Add(options.delayed_threshold_seconds);
  hasher.Add(options.conversation_timeout_seconds);
  hasher.Add(options.balance_low);
  hasher.Add(options.balance_high);
  hasher.Add(options.initiation_timeout_seconds);
  hasher.Add(options.outlier_iqr_k);
  hasher.Add(static_cast<std::uint64_t>(options.ml_enabled ? 1 : 0));
  hasher.Add(options.ml_model_name);

  return fmt::format("{}_{}_{:016x}", operation, table.size(), hasher.value());
}

} // namespace cadence::cache

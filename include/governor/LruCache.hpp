#pragma once
// Byte-budgeted cache with least-recently-accessed eviction and lazy TTL expiry.
#include <any>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "model/Memory.hpp"

namespace steward::governor {

class LruCache {
public:
  explicit LruCache(uint64_t budget_bytes);

  // Inserts or replaces 'key'. Evicts least recently accessed entries until
  // the new entry fits. An entry larger than the whole budget is rejected
  // and the cache is left untouched.
  [[nodiscard]] bool put(const std::string& key, std::any value, uint64_t size_bytes,
                         std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  // Hit: returns a copy and refreshes access metadata. Missing or expired
  // entries count a miss; expired ones are removed.
  [[nodiscard]] std::optional<std::any> get(const std::string& key);

  bool remove(const std::string& key);
  uint64_t clear();                    // bytes freed
  uint64_t shrink_by(double fraction); // evict LRU until 'fraction' of current bytes is freed

  [[nodiscard]] model::CacheStats stats() const;
  [[nodiscard]] uint64_t total_bytes() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t budget_bytes() const { return budget_bytes_; }
  // Presence check without touching access metadata or counters.
  [[nodiscard]] bool contains(const std::string& key) const;

private:
  struct Slot {
    std::any value;
    uint64_t size_bytes{};
    int64_t inserted_ms{};
    std::chrono::steady_clock::time_point inserted_at{};
    uint64_t access_count{};
    uint64_t last_access_tick{};
    int64_t last_accessed_ms{};
    std::optional<std::chrono::milliseconds> ttl;
  };

  // Caller holds mu_. Returns bytes freed.
  uint64_t evict_lru_locked(uint64_t bytes_needed);

  const uint64_t budget_bytes_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> slots_;
  uint64_t total_bytes_{0};
  uint64_t tick_{0};
  uint64_t hits_{0};
  uint64_t misses_{0};
  uint64_t evictions_{0};
};

} // namespace steward::governor

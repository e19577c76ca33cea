#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "governor/LruCache.hpp"
#include "governor/ObjectPools.hpp"
#include "governor/SizeEstimate.hpp"
#include "model/Memory.hpp"
#include "probes/MemoryProbe.hpp"
#include "store/KeyValueStore.hpp"
#include "util/Log.hpp"

namespace steward::governor {

struct GovernorConfig {
  double budget_mb{150.0};
  uint64_t cache_budget_bytes{50ull * 1024 * 1024};
  int snapshot_interval_ms{30000};
  int leak_check_interval_ms{60000};
  int pressure_interval_ms{15000};
  double leak_threshold_mb{10.0};
  double component_leak_threshold_mb{5.0};
  double high_usage_warn_pct{80.0};
};

// Observes process memory, detects growth, owns the shared cache and object
// pools, and sheds cache under pressure. Nothing thrown inside the periodic
// work escapes; failures are logged and counted in the fault ledger.
class ResourceGovernor {
public:
  // Returns true when memory was handed back to the system.
  using CollectionHook = std::function<bool()>;

  static constexpr size_t kMaxSamples = 100;
  static constexpr size_t kMaxFindings = 50;
  static constexpr size_t kLeakWindow = 10;
  static constexpr size_t kComponentHistory = 20;
  static constexpr size_t kPersistSamples = 50;
  static constexpr size_t kPersistFindings = 20;

  ResourceGovernor(GovernorConfig cfg, probes::IMemoryProbe& probe, store::IKeyValueStore& store);
  ~ResourceGovernor();

  ResourceGovernor(const ResourceGovernor&) = delete;
  ResourceGovernor& operator=(const ResourceGovernor&) = delete;

  // Loads persisted history, takes a first snapshot and starts the loops. No-op when running.
  void start_monitoring();
  // Stops the loops and persists recent history and cache stats.
  void stop_monitoring();
  [[nodiscard]] bool is_monitoring() const;

  // Loop bodies, callable directly.
  void capture_snapshot();
  void check_for_leaks();
  void check_memory_pressure();

  void track_component_memory(const std::string& component, double mb);

  [[nodiscard]] model::MemoryPressure get_memory_pressure();
  [[nodiscard]] model::MemorySummary get_memory_summary();
  [[nodiscard]] std::vector<model::MemorySample> get_snapshots(size_t count = 0) const; // 0 = all
  [[nodiscard]] std::vector<model::LeakFinding> get_detected_leaks() const;
  [[nodiscard]] model::PressureCounters pressure_counters() const;
  [[nodiscard]] const GovernorConfig& config() const { return cfg_; }

  template <class T>
  bool set_cache(const std::string& key, T value, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
    uint64_t size = estimate_size(value);
    return cache_.put(key, std::any(std::move(value)), size, ttl);
  }

  template <class T>
  std::optional<T> get_cache(const std::string& key) {
    auto v = cache_.get(key);
    if (!v) return std::nullopt;
    if (const T* p = std::any_cast<T>(&*v)) return *p;
    util::log_warn("ResourceGovernor", "cache entry '%s' holds another type", key.c_str());
    return std::nullopt;
  }

  bool remove_cache(const std::string& key) { return cache_.remove(key); }
  void clear_cache() { (void)cache_.clear(); }
  [[nodiscard]] model::CacheStats get_cache_stats() const { return cache_.stats(); }

  template <class T, class Factory>
  std::shared_ptr<T> get_from_pool(const std::string& pool, Factory&& factory) {
    return pools_.acquire<T>(pool, std::forward<Factory>(factory));
  }

  template <class T>
  void return_to_pool(const std::string& pool, std::shared_ptr<T> obj) {
    (void)pools_.release<T>(pool, std::move(obj));
  }

  void clear_pool(const std::string& pool) { pools_.clear(pool); }
  [[nodiscard]] size_t pooled(const std::string& pool) const { return pools_.pooled(pool); }

  void set_collection_hook(CollectionHook hook);

private:
  void run(std::stop_token st);
  [[nodiscard]] std::optional<model::MemoryReading> read_probe();
  void request_collection();
  void load_persisted();
  void persist();

  GovernorConfig cfg_;
  probes::IMemoryProbe& probe_;
  store::IKeyValueStore& store_;

  LruCache cache_;
  ObjectPools pools_;

  std::mutex probe_mu_;
  mutable std::mutex mu_;
  std::deque<model::MemorySample> samples_;
  std::deque<model::LeakFinding> findings_;
  std::map<std::string, std::deque<double>> components_;
  model::PressureCounters counters_;
  CollectionHook collect_;

  mutable std::mutex run_mu_;
  std::jthread thread_{};
};

} // namespace steward::governor

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steward::model {

// Raw probe output, megabytes.
struct MemoryReading {
  double heap_used_mb{};
  double heap_total_mb{};
  std::optional<double> rss_mb;
};

struct MemorySample {
  int64_t timestamp_ms{};
  double heap_used_mb{};
  double heap_total_mb{};
  double percentage_of_budget{}; // heap_used / budget * 100
  std::map<std::string, double> per_component_mb; // latest registered value per component
};

enum class LeakSeverity { Low, Medium, High, Critical };

struct LeakFinding {
  int64_t detected_at_ms{};
  std::string component;               // "overall" or a tracked component
  double growth_mb{};
  LeakSeverity severity{LeakSeverity::Low};
  std::vector<double> contributing_samples; // MB values of the window, oldest first
  std::vector<std::string> recommendations;
};

enum class PressureLevel { Normal, Moderate, High, Critical };
enum class MemoryTrend { Stable, Increasing, Decreasing };

struct MemoryPressure {
  PressureLevel level{PressureLevel::Normal};
  double percentage{};
  MemoryTrend trend{MemoryTrend::Stable};
  bool action_required{false};
  std::vector<std::string> recommended_actions;
};

struct CacheStats {
  uint64_t total_size_bytes{};
  uint64_t budget_bytes{};
  size_t entry_count{};
  double hit_rate_pct{};
  uint64_t hits{};
  uint64_t misses{};
  uint64_t evictions{};
  int64_t oldest_entry_ms{};  // insertion wall time, 0 when empty
  int64_t newest_entry_ms{};
  int64_t oldest_entry_age_ms{};
  int64_t newest_entry_age_ms{};
};

// Corrective actions taken by the pressure loop.
struct PressureCounters {
  uint64_t checks{};
  uint64_t cache_shrinks{};
  uint64_t cache_clears{};
  uint64_t collection_requests{};
};

struct MemorySummary {
  MemorySample current;
  MemoryPressure pressure;
  size_t leaks{};
  CacheStats cache;
};

[[nodiscard]] const char* to_string(LeakSeverity s);
[[nodiscard]] const char* to_string(PressureLevel l);
[[nodiscard]] const char* to_string(MemoryTrend t);

} // namespace steward::model

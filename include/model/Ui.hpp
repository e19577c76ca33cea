#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "model/Memory.hpp"

namespace steward::model {

struct ScrollMetrics {
  double fps{};
  double smoothness{}; // 0..100
  int jank_count{};
};

struct UISample {
  int64_t timestamp_ms{};
  std::string screen_id;
  double fps{60.0};
  double frame_drops{};
  double render_time_ms{};
  double interaction_delay_ms{};
  std::optional<ScrollMetrics> scroll;
};

enum class TraceKind { Mark, Measure, Navigation, Render, Interaction };

struct TraceEntry {
  std::string name;
  TraceKind kind{TraceKind::Mark};
  int64_t start_time_ms{};
  double duration_ms{};
  std::map<std::string, std::string> detail; // empty when absent
};

struct Mark {
  std::string name;
  int64_t timestamp_ms{};
  double mono_ms{};
};

struct Measure {
  std::string name;
  std::string start_mark;
  std::string end_mark; // "now" when measured against the current time
  double duration_ms{};
};

// Memory as seen by the recorder (read from the governor).
struct MemoryMetric {
  int64_t timestamp_ms{};
  double used_mb{};
  double limit_mb{};
  double percentage{};
};

struct CurrentPerformance {
  int fps{60};
  int memory_usage_mb{};
  int response_time_ms{};
  bool is_performant{true};
};

struct ScreenRenderStat {
  std::string screen;
  double avg_render_time_ms{};
};

struct Transition {
  std::string from;
  std::string to;
  double time_ms{};
};

struct UiStats {
  double average_fps{60.0};
  double frame_drop_rate_pct{};
  double average_render_time_ms{};
  double average_interaction_delay_ms{};
  std::vector<ScreenRenderStat> slow_screens; // top 5 by average render time
};

struct MemoryStats {
  double average_usage_mb{};
  double peak_usage_mb{};
  bool leak_suspected{false};
  MemoryTrend trend{MemoryTrend::Stable};
};

struct NavigationStats {
  double average_transition_ms{};
  std::vector<Transition> slowest; // top 5
};

struct ResponsivenessStats {
  double average_response_ms{};
  double p95_response_ms{};
  size_t missed_target_count{};
};

struct PerformanceReport {
  int64_t period_start_ms{};
  int64_t period_end_ms{};
  UiStats ui;
  MemoryStats memory;
  NavigationStats navigation;
  ResponsivenessStats responsiveness;
  std::vector<std::string> recommendations;
};

[[nodiscard]] const char* to_string(TraceKind k);

} // namespace steward::model

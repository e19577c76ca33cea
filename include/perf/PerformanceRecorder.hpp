#pragma once
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

#include "model/Ui.hpp"
#include "store/KeyValueStore.hpp"

namespace steward::perf {

struct RecorderConfig {
  int ui_check_interval_ms{5000};
  int memory_interval_ms{30000};
  double memory_limit_mb{150.0};
};

// Supplies the current memory figure; the host wires it to the governor.
using MemoryReadout = std::function<std::optional<model::MemoryMetric>()>;

// Named marks and interval measures plus UI health samples. Purely
// observational: slow samples are logged, never acted upon.
class PerformanceRecorder {
public:
  static constexpr double kTargetFps = 60.0;
  static constexpr double kMinPerformantFps = 55.0;
  static constexpr double kTargetRenderMs = 16.67;
  static constexpr double kTargetResponseMs = 100.0;
  static constexpr double kTargetNavigationMs = 300.0;

  static constexpr size_t kMaxUiSamples = 1000;
  static constexpr size_t kMaxEntries = 500;
  static constexpr size_t kMaxMeasures = 500;
  static constexpr size_t kMaxMemoryMetrics = 500;
  static constexpr size_t kPersistUiSamples = 500;
  static constexpr size_t kPersistMemoryMetrics = 200;
  static constexpr size_t kPersistEntries = 500;

  PerformanceRecorder(RecorderConfig cfg, store::IKeyValueStore& store, MemoryReadout readout = {});
  ~PerformanceRecorder();

  PerformanceRecorder(const PerformanceRecorder&) = delete;
  PerformanceRecorder& operator=(const PerformanceRecorder&) = delete;

  void start_monitoring();
  void stop_monitoring();
  [[nodiscard]] bool is_monitoring() const;

  void mark(const std::string& name, std::map<std::string, std::string> detail = {});
  // Elapsed ms from 'start_mark' to 'end_mark' (or now when absent or unknown).
  // Unknown start mark: warns and returns std::nullopt.
  std::optional<double> measure(const std::string& name, const std::string& start_mark,
                                const std::optional<std::string>& end_mark = std::nullopt);

  void track_screen_render(const std::string& screen, double render_ms, double interaction_delay_ms);
  void track_scroll_performance(const std::string& screen, double fps, double smoothness, int jank_count);
  void track_navigation(const std::string& from, const std::string& to, double duration_ms);
  void track_interaction(const std::string& type, const std::string& target, double response_ms);

  [[nodiscard]] model::CurrentPerformance get_current_performance() const;
  [[nodiscard]] model::PerformanceReport generate_performance_report(double window_hours = 24.0) const;

  // Loop bodies, callable directly.
  void sample_memory();
  void check_ui_health();

  [[nodiscard]] std::vector<model::Mark> get_marks() const;
  [[nodiscard]] std::vector<model::Measure> get_measures() const;
  [[nodiscard]] std::vector<model::TraceEntry> get_entries(std::optional<model::TraceKind> kind = std::nullopt) const;
  [[nodiscard]] std::vector<model::UISample> get_ui_samples() const;
  [[nodiscard]] std::vector<model::MemoryMetric> get_memory_metrics() const;

  void clear_marks();
  // Drops samples, memory metrics and trace entries, and persists the empty state.
  void clear_metrics();

  void set_memory_readout(MemoryReadout readout);

private:
  void run(std::stop_token st);
  void push_entry_locked(model::TraceEntry e);
  void load_persisted();
  void persist();

  RecorderConfig cfg_;
  store::IKeyValueStore& store_;

  mutable std::mutex mu_;
  MemoryReadout readout_;
  std::map<std::string, model::Mark> marks_;
  std::deque<model::Measure> measures_;
  std::deque<model::UISample> ui_;
  std::deque<model::MemoryMetric> memory_;
  std::deque<model::TraceEntry> entries_;

  mutable std::mutex run_mu_;
  std::jthread thread_{};
};

} // namespace steward::perf

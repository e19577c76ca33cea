#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "launch/DataSource.hpp"
#include "launch/IdleSignal.hpp"
#include "launch/LaunchConfig.hpp"
#include "model/Launch.hpp"
#include "store/KeyValueStore.hpp"

namespace steward::launch {

// A priority <= kFatalPriority resource failed or timed out during startup.
class FatalResourceFailure : public std::runtime_error {
public:
  FatalResourceFailure(std::string id, int priority, const std::string& reason);
  [[nodiscard]] const std::string& resource_id() const noexcept { return id_; }
  [[nodiscard]] int priority() const noexcept { return priority_; }

private:
  std::string id_;
  int priority_;
};

// Loads the critical resources concurrently under a shared timeout, marks the
// application interactive, then runs deferred tasks one by one once the idle
// signal fires.
class StartupSequencer {
public:
  static constexpr int kFatalPriority = 3;
  static constexpr size_t kMaxLaunchRecords = 50;

  StartupSequencer(store::IKeyValueStore& store, IDataSource& data, IIdleSignal& idle);
  ~StartupSequencer();

  StartupSequencer(const StartupSequencer&) = delete;
  StartupSequencer& operator=(const StartupSequencer&) = delete;

  // Extra critical resources and deferred tasks from the host. Register
  // before initialize(); later registrations are ignored with a warning.
  void add_resource(std::string id, model::ResourceKind kind, int priority, model::ResourceLoader loader);
  void add_deferred_task(std::string id, int priority, model::DeferredTask task);

  // Runs the critical wave. With a config it is persisted, without one the
  // persisted config (or the defaults) is used. Only the first call does work;
  // after a fatal failure later calls rethrow it.
  void initialize(std::optional<LaunchConfig> cfg = std::nullopt);

  // Persists launch records and config and records the exit time.
  void shutdown();

  [[nodiscard]] model::LaunchPerformance get_launch_performance() const;
  [[nodiscard]] std::vector<model::LaunchRecord> get_launch_metrics() const;
  [[nodiscard]] model::LaunchState state() const { return state_.load(); }
  [[nodiscard]] bool is_ready() const;
  [[nodiscard]] bool cold_start() const;
  [[nodiscard]] LaunchConfig config() const;
  void update_config(const LaunchConfig& cfg);

  [[nodiscard]] std::vector<model::ResourceDescriptor> resources() const;
  [[nodiscard]] std::vector<model::DeferredTaskDescriptor> deferred_tasks() const;
  // Resource ids in the order their loaders were started.
  [[nodiscard]] std::vector<std::string> attempt_order() const;
  // Loaders that settled after their timeout; their outcome was discarded.
  [[nodiscard]] uint64_t late_completions() const;
  // ms from launch start; nullopt until reached.
  [[nodiscard]] std::optional<double> interactive_at_ms() const;
  [[nodiscard]] std::optional<double> critical_path_complete_at_ms() const;

  // Pre-cache: small string blobs kept across launches.
  bool save_to_precache(const std::string& key, const std::string& value);
  [[nodiscard]] std::optional<std::string> get_from_precache(const std::string& key) const;

private:
  struct Outcome {
    bool done{false};
    bool abandoned{false};
    std::optional<std::string> error;
    double load_time_ms{};
  };

  void load_config(const std::optional<LaunchConfig>& cfg);
  void load_launch_records();
  void detect_cold_start();
  void register_resources();
  void load_critical_path();
  void mark_interactive();
  void schedule_background();
  void run_deferred_wave();
  void record_launch();
  void persist_records();
  void load_precache();
  void cleanup_precache();

  [[nodiscard]] double since_launch_ms() const;

  store::IKeyValueStore& store_;
  IDataSource& data_;
  IIdleSignal& idle_;

  const double launch_mono_ms_;
  const int64_t launch_wall_ms_;

  std::mutex init_mu_;
  std::atomic<model::LaunchState> state_{model::LaunchState::NotStarted};
  std::optional<FatalResourceFailure> failure_;

  mutable std::mutex mu_;
  LaunchConfig cfg_;
  bool cold_start_{true};
  std::vector<model::ResourceDescriptor> host_resources_;
  std::vector<model::DeferredTaskDescriptor> host_tasks_;
  std::vector<model::ResourceDescriptor> resources_;
  std::vector<model::DeferredTaskDescriptor> tasks_;
  std::vector<std::string> attempt_order_;
  std::vector<model::LaunchRecord> records_;
  std::optional<double> critical_complete_ms_;
  std::optional<double> interactive_ms_;
  std::optional<double> fully_loaded_ms_;

  mutable std::mutex precache_mu_;
  std::map<std::string, std::string> precache_;

  mutable std::mutex wave_mu_;
  std::condition_variable wave_cv_;
  uint64_t late_completions_{0};
  std::vector<std::jthread> orphans_;
};

} // namespace steward::launch

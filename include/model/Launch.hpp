#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace steward::model {

enum class ResourceKind { Service, Data, Asset };

// Loaders throw on failure and should return early once the token is stopped.
using ResourceLoader = std::function<void(std::stop_token)>;
using DeferredTask = std::function<void()>;

struct ResourceDescriptor {
  std::string id;
  ResourceKind kind{ResourceKind::Service};
  int priority{1};                   // 1 = highest
  ResourceLoader loader;
  bool loaded{false};
  std::optional<std::string> error;
  std::optional<double> load_time_ms;
};

struct DeferredTaskDescriptor {
  std::string id;
  int priority{1};
  DeferredTask task;
  bool executed{false};
  std::optional<std::string> error;
};

enum class LaunchState { NotStarted, LoadingCriticalPath, Interactive, RunningDeferred, FullyLoaded, Failed };

struct LaunchPhases {
  double initialization_ms{};     // launch start -> critical path complete
  double critical_resources_ms{}; // sum of successful resource load times
  double database_setup_ms{};
  double essential_data_ms{};     // sum over data resources
  double ui_render_ms{};          // critical path complete -> interactive
  double background_tasks_ms{};   // interactive -> fully loaded
};

// One per session, all times relative to launch start.
struct LaunchRecord {
  bool cold_start{true};
  int64_t start_time_ms{};        // wall clock
  double critical_path_complete_ms{};
  double interactive_ms{};
  double fully_loaded_ms{};
  LaunchPhases phases;
  int loaded_count{};
  int deferred_count{};
  int failed_count{};
};

struct LaunchPerformance {
  double average_cold_start_ms{};
  double average_warm_start_ms{};
  std::optional<LaunchRecord> last_launch;
  double cold_target_ms{3000.0};
  double warm_target_ms{1000.0};
  bool meeting_target{true};
};

[[nodiscard]] const char* to_string(ResourceKind kind);
[[nodiscard]] const char* to_string(LaunchState state);

} // namespace steward::model

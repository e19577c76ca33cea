#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace steward::launch {

struct LaunchConfig {
  int critical_path_timeout_ms{2000};
  double critical_path_target_ms{2000.0}; // logged when exceeded
  bool enable_precaching{true};
  bool enable_background_init{true};
  bool today_schedule{true};
  bool pending_items{true};
  bool recent_history{true};
  int recent_history_days{7};
  int64_t warm_start_window_ms{5 * 60 * 1000};
  double cold_target_ms{3000.0};
  double warm_target_ms{1000.0};
  uint64_t precache_max_bytes{5ull * 1024 * 1024};
  int64_t precache_max_age_ms{24ll * 60 * 60 * 1000};
};

// Persisted form: a [launch] TOML section. Keys missing from 'text' keep
// the value from 'defaults'.
[[nodiscard]] std::string encode_launch_config(const LaunchConfig& cfg);
[[nodiscard]] LaunchConfig decode_launch_config(std::string_view text, const LaunchConfig& defaults = {});

} // namespace steward::launch

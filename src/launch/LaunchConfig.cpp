#include "launch/LaunchConfig.hpp"
#include "util/TomlReader.hpp"

namespace steward::launch {

std::string encode_launch_config(const LaunchConfig& c) {
  util::TomlReader t;
  t.set("launch", "critical_path_timeout_ms", c.critical_path_timeout_ms);
  t.set("launch", "critical_path_target_ms", c.critical_path_target_ms);
  t.set("launch", "enable_precaching", c.enable_precaching);
  t.set("launch", "enable_background_init", c.enable_background_init);
  t.set("launch", "today_schedule", c.today_schedule);
  t.set("launch", "pending_items", c.pending_items);
  t.set("launch", "recent_history", c.recent_history);
  t.set("launch", "recent_history_days", c.recent_history_days);
  t.set("launch", "warm_start_window_ms", c.warm_start_window_ms);
  t.set("launch", "cold_target_ms", c.cold_target_ms);
  t.set("launch", "warm_target_ms", c.warm_target_ms);
  t.set("precache", "max_bytes", static_cast<int64_t>(c.precache_max_bytes));
  t.set("precache", "max_age_ms", c.precache_max_age_ms);
  return t.dump();
}

LaunchConfig decode_launch_config(std::string_view text, const LaunchConfig& d) {
  util::TomlReader t;
  t.parse(text);
  LaunchConfig c;
  c.critical_path_timeout_ms = t.get_int("launch", "critical_path_timeout_ms", d.critical_path_timeout_ms);
  c.critical_path_target_ms = t.get_double("launch", "critical_path_target_ms", d.critical_path_target_ms);
  c.enable_precaching = t.get_bool("launch", "enable_precaching", d.enable_precaching);
  c.enable_background_init = t.get_bool("launch", "enable_background_init", d.enable_background_init);
  c.today_schedule = t.get_bool("launch", "today_schedule", d.today_schedule);
  c.pending_items = t.get_bool("launch", "pending_items", d.pending_items);
  c.recent_history = t.get_bool("launch", "recent_history", d.recent_history);
  c.recent_history_days = t.get_int("launch", "recent_history_days", d.recent_history_days);
  c.warm_start_window_ms = t.get_i64("launch", "warm_start_window_ms", d.warm_start_window_ms);
  c.cold_target_ms = t.get_double("launch", "cold_target_ms", d.cold_target_ms);
  c.warm_target_ms = t.get_double("launch", "warm_target_ms", d.warm_target_ms);
  int64_t max_bytes = t.get_i64("precache", "max_bytes", static_cast<int64_t>(d.precache_max_bytes));
  c.precache_max_bytes = max_bytes > 0 ? static_cast<uint64_t>(max_bytes) : d.precache_max_bytes;
  c.precache_max_age_ms = t.get_i64("precache", "max_age_ms", d.precache_max_age_ms);
  return c;
}

} // namespace steward::launch

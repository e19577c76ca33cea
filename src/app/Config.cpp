#include "app/Config.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace steward::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("STEWARD_", 0) == 0) {
    alt = std::string("steward_") + n.substr(8);
  } else if (n.rfind("steward_", 0) == 0) {
    alt = std::string("STEWARD_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("STEWARD_CONFIG")) return p;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/steward/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/steward/config.toml";
  return {};
}

std::string default_storage_dir() {
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::string(xdg) + "/steward";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/state/steward";
  return ".steward";
}

namespace {

template <typename T>
bool parse_number(std::string_view s, T& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

template <typename T>
T env_number(const char* env_name, T def) {
  const char* v = env_name ? getenv_compat(env_name) : nullptr;
  if (!v) return def;
  T out{};
  if (parse_number(v, out)) return out;
  util::log_warn("Config", "ignoring %s=%s (not a number)", env_name, v);
  return def;
}

int resolve_int(const util::TomlReader& toml, bool have_toml,
                const char* section, const char* key, const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return env_number<int>(env_name, def);
}

int64_t resolve_i64(const util::TomlReader& toml, bool have_toml,
                    const char* section, const char* key, const char* env_name, int64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_i64(section, key, def);
  return env_number<int64_t>(env_name, def);
}

double resolve_double(const util::TomlReader& toml, bool have_toml,
                      const char* section, const char* key, const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  return env_number<double>(env_name, def);
}

bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                  const char* section, const char* key, const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  const char* v = env_name ? getenv_compat(env_name) : nullptr;
  if (!v) return def;
  if (v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N') return false;
  return true;
}

std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                           const char* section, const char* key, const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (const char* v = env_name ? getenv_compat(env_name) : nullptr) return v;
  return def;
}

} // namespace

StewardConfig resolve_config(const util::TomlReader& toml, bool have_toml) {
  StewardConfig c{};

  // --- [launch] / [precache] ---
  auto& l = c.launch;
  l.critical_path_timeout_ms = resolve_int(toml, have_toml, "launch", "critical_path_timeout_ms",
                                           "STEWARD_CRITICAL_PATH_TIMEOUT_MS", l.critical_path_timeout_ms);
  l.critical_path_target_ms = resolve_double(toml, have_toml, "launch", "critical_path_target_ms",
                                             "STEWARD_CRITICAL_PATH_TARGET_MS", l.critical_path_target_ms);
  l.enable_precaching = resolve_bool(toml, have_toml, "launch", "enable_precaching",
                                     "STEWARD_ENABLE_PRECACHING", l.enable_precaching);
  l.enable_background_init = resolve_bool(toml, have_toml, "launch", "enable_background_init",
                                          "STEWARD_ENABLE_BACKGROUND_INIT", l.enable_background_init);
  l.today_schedule = resolve_bool(toml, have_toml, "launch", "today_schedule", nullptr, l.today_schedule);
  l.pending_items = resolve_bool(toml, have_toml, "launch", "pending_items", nullptr, l.pending_items);
  l.recent_history = resolve_bool(toml, have_toml, "launch", "recent_history", nullptr, l.recent_history);
  l.recent_history_days = resolve_int(toml, have_toml, "launch", "recent_history_days", nullptr, l.recent_history_days);
  l.warm_start_window_ms = resolve_i64(toml, have_toml, "launch", "warm_start_window_ms",
                                       "STEWARD_WARM_START_WINDOW_MS", l.warm_start_window_ms);
  l.cold_target_ms = resolve_double(toml, have_toml, "launch", "cold_target_ms", nullptr, l.cold_target_ms);
  l.warm_target_ms = resolve_double(toml, have_toml, "launch", "warm_target_ms", nullptr, l.warm_target_ms);
  int64_t pc_bytes = resolve_i64(toml, have_toml, "precache", "max_bytes", "STEWARD_PRECACHE_MAX_BYTES",
                                 static_cast<int64_t>(l.precache_max_bytes));
  if (pc_bytes > 0) l.precache_max_bytes = static_cast<uint64_t>(pc_bytes);
  l.precache_max_age_ms = resolve_i64(toml, have_toml, "precache", "max_age_ms", nullptr, l.precache_max_age_ms);

  // --- [governor] ---
  auto& g = c.governor;
  g.budget_mb = resolve_double(toml, have_toml, "governor", "budget_mb", "STEWARD_BUDGET_MB", g.budget_mb);
  int64_t cache_bytes = resolve_i64(toml, have_toml, "governor", "cache_budget_bytes", "STEWARD_CACHE_BUDGET_BYTES",
                                    static_cast<int64_t>(g.cache_budget_bytes));
  if (cache_bytes > 0) g.cache_budget_bytes = static_cast<uint64_t>(cache_bytes);
  g.snapshot_interval_ms = resolve_int(toml, have_toml, "governor", "snapshot_interval_ms", nullptr,
                                       g.snapshot_interval_ms);
  g.leak_check_interval_ms = resolve_int(toml, have_toml, "governor", "leak_check_interval_ms", nullptr,
                                         g.leak_check_interval_ms);
  g.pressure_interval_ms = resolve_int(toml, have_toml, "governor", "pressure_interval_ms", nullptr,
                                       g.pressure_interval_ms);
  g.leak_threshold_mb = resolve_double(toml, have_toml, "governor", "leak_threshold_mb", nullptr, g.leak_threshold_mb);
  g.component_leak_threshold_mb = resolve_double(toml, have_toml, "governor", "component_leak_threshold_mb", nullptr,
                                                 g.component_leak_threshold_mb);

  // --- [recorder] ---
  auto& r = c.recorder;
  r.ui_check_interval_ms = resolve_int(toml, have_toml, "recorder", "ui_check_interval_ms", nullptr,
                                       r.ui_check_interval_ms);
  r.memory_interval_ms = resolve_int(toml, have_toml, "recorder", "memory_interval_ms", nullptr, r.memory_interval_ms);
  r.memory_limit_mb = g.budget_mb;

  // --- [metrics] / [storage] ---
  int port = resolve_int(toml, have_toml, "metrics", "port", "STEWARD_METRICS_PORT", 0);
  if (port < 0 || port > 65535) {
    util::log_warn("Config", "metrics port %d out of range, metrics disabled", port);
    port = 0;
  }
  c.metrics_port = static_cast<uint16_t>(port);
  c.storage_dir = resolve_string(toml, have_toml, "storage", "dir", "STEWARD_STORAGE_DIR", default_storage_dir());

  return c;
}

StewardConfig load_config() {
  util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) util::log_debug("Config", "loaded %s", path.c_str());
  return resolve_config(toml, have_toml);
}

} // namespace steward::app

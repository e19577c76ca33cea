#include "util/Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace steward::util {

static std::mutex g_mu;
static LogHook g_hook;
static std::array<std::atomic<uint64_t>, 4> g_counts{};
static std::atomic<int> g_level{-1};

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "info";
}

LogLevel parse_log_level(std::string_view s, LogLevel defv) {
  if (s == "debug" || s == "DEBUG") return LogLevel::Debug;
  if (s == "info" || s == "INFO") return LogLevel::Info;
  if (s == "warn" || s == "WARN" || s == "warning") return LogLevel::Warn;
  if (s == "error" || s == "ERROR") return LogLevel::Error;
  if (s == "off" || s == "OFF" || s == "none") return LogLevel::Off;
  return defv;
}

LogLevel log_level() {
  int v = g_level.load(std::memory_order_relaxed);
  if (v < 0) {
    const char* env = std::getenv("STEWARD_LOG_LEVEL");
    LogLevel l = (env && *env) ? parse_log_level(env, LogLevel::Info) : LogLevel::Info;
    int expected = -1;
    g_level.compare_exchange_strong(expected, static_cast<int>(l));
    v = g_level.load(std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(v);
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

uint64_t log_count(LogLevel level) {
  if (level == LogLevel::Off) return 0;
  return g_counts[static_cast<size_t>(level)].load();
}

void set_log_hook(LogHook hook) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_hook = std::move(hook);
}

static void vemit(LogLevel level, const char* component, const char* fmt, va_list ap) {
  if (static_cast<int>(level) < static_cast<int>(log_level())) return;
  char buf[1024];
  int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  if (n < 0) return;
  g_counts[static_cast<size_t>(level)].fetch_add(1);
  const char* tag = (level == LogLevel::Warn) ? "warning: " : (level == LogLevel::Error) ? "error: " : "";
  std::lock_guard<std::mutex> lk(g_mu);
  std::fprintf(stderr, "steward: %s: %s%s\n", component, tag, buf);
  if (g_hook) g_hook(level, component, std::string_view(buf, std::min<size_t>(static_cast<size_t>(n), sizeof(buf) - 1)));
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vemit(LogLevel::Debug, component, fmt, ap); va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vemit(LogLevel::Info, component, fmt, ap); va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vemit(LogLevel::Warn, component, fmt, ap); va_end(ap);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vemit(LogLevel::Error, component, fmt, ap); va_end(ap);
}

} // namespace steward::util

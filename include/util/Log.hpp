#pragma once
// Leveled stderr logging: "steward: <component>: <message>"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace steward::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

[[nodiscard]] const char* to_string(LogLevel level);
[[nodiscard]] LogLevel parse_log_level(std::string_view s, LogLevel defv);

// Minimum level is read once from STEWARD_LOG_LEVEL; set_log_level overrides it.
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Messages emitted per level since process start (filtered ones are not counted).
[[nodiscard]] uint64_t log_count(LogLevel level);

// Optional observer invoked for every emitted line, after it is written. Pass {} to clear.
// The hook runs under the log mutex and must not log itself.
using LogHook = std::function<void(LogLevel, std::string_view component, std::string_view message)>;
void set_log_hook(LogHook hook);

} // namespace steward::util

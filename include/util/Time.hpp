#pragma once
#include <chrono>
#include <cstdint>

namespace steward::util {

// Milliseconds since the Unix epoch (persisted timestamps).
[[nodiscard]] inline int64_t wall_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

// Monotonic milliseconds with sub-millisecond precision (durations only).
[[nodiscard]] inline double mono_ms() {
  return std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace steward::util

#pragma once
// Host data layer consumed by the critical startup wave.
#include <chrono>
#include <stop_token>

namespace steward::launch {

// Each call blocks until done, throws a std::exception on failure, and
// should return early once 'st' is stopped.
class IDataSource {
public:
  virtual ~IDataSource() = default;
  virtual void initialize(std::stop_token st) = 0;
  virtual void preload_today_schedule(std::stop_token st) = 0;
  virtual void preload_pending_items(std::stop_token st) = 0;
  virtual void preload_recent_history(std::stop_token st, int days) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Sleeps for 'd' unless 'st' is stopped first. Returns false when stopped.
bool interruptible_sleep(std::stop_token st, std::chrono::milliseconds d);

} // namespace steward::launch

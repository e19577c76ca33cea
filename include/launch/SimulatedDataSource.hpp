#pragma once
#include <atomic>
#include <chrono>

#include "launch/DataSource.hpp"

namespace steward::launch {

// Stand-in data layer for the host binary: every preload sleeps for a fixed
// delay (waking early when asked to stop) and can be told to fail.
struct SimulatedDataSourceDelays {
  std::chrono::milliseconds init{120};
  std::chrono::milliseconds schedule{80};
  std::chrono::milliseconds pending{60};
  std::chrono::milliseconds history{150};
};

class SimulatedDataSource : public IDataSource {
public:
  using Delays = SimulatedDataSourceDelays;

  // fail_priority selects the preload that throws: 1 database, 3 schedule,
  // 4 pending items, 5 history. 0 disables failures.
  explicit SimulatedDataSource(Delays delays = {}, int fail_priority = 0)
      : delays_(delays), fail_priority_(fail_priority) {}

  void initialize(std::stop_token st) override;
  void preload_today_schedule(std::stop_token st) override;
  void preload_pending_items(std::stop_token st) override;
  void preload_recent_history(std::stop_token st, int days) override;
  const char* name() const override { return "simulated"; }

  [[nodiscard]] int calls() const { return calls_.load(); }

private:
  void step(std::stop_token st, std::chrono::milliseconds delay, int priority, const char* what);

  Delays delays_;
  int fail_priority_;
  std::atomic<int> calls_{0};
};

} // namespace steward::launch

#pragma once
// "Run after the current burst of interaction settles."
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace steward::launch {

class IIdleSignal {
public:
  virtual ~IIdleSignal() = default;
  virtual void run_after_interactions(std::function<void()> fn) = 0;
  // Drops pending callbacks and waits for a running one to finish.
  virtual void cancel() = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Callbacks run on the thread that calls notify_idle().
class ManualIdleSignal : public IIdleSignal {
public:
  void run_after_interactions(std::function<void()> fn) override;
  void cancel() override;
  const char* name() const override { return "manual"; }

  // Runs and clears the pending callbacks. Returns how many ran.
  size_t notify_idle();
  [[nodiscard]] size_t pending() const;

private:
  mutable std::mutex mu_;
  std::vector<std::function<void()>> pending_;
  std::mutex run_mu_;
};

// Fires once no interaction has been noted for 'quiet'. Callbacks run on a
// worker thread owned by the signal.
class QuietPeriodIdleSignal : public IIdleSignal {
public:
  explicit QuietPeriodIdleSignal(std::chrono::milliseconds quiet);
  ~QuietPeriodIdleSignal() override;

  void run_after_interactions(std::function<void()> fn) override;
  void cancel() override;
  const char* name() const override { return "quiet_period"; }

  void note_interaction();

private:
  void run(std::stop_token st);

  const std::chrono::milliseconds quiet_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::vector<std::function<void()>> pending_;
  std::chrono::steady_clock::time_point last_interaction_;
  std::jthread thread_{};
};

} // namespace steward::launch

#include "minitest.hpp"
#include "launch/IdleSignal.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

using namespace std::chrono_literals;
using steward::launch::QuietPeriodIdleSignal;
using Clock = std::chrono::steady_clock;

namespace {

struct FireRecord {
  std::mutex mu;
  std::optional<Clock::time_point> at;

  void hit() {
    std::lock_guard<std::mutex> lk(mu);
    at = Clock::now();
  }
  std::optional<Clock::time_point> get() {
    std::lock_guard<std::mutex> lk(mu);
    return at;
  }
};

bool wait_fired(FireRecord& rec, std::chrono::milliseconds limit) {
  auto deadline = Clock::now() + limit;
  while (Clock::now() < deadline) {
    if (rec.get()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return rec.get().has_value();
}

} // namespace

TEST(quiet_period_waits_before_firing) {
  FireRecord rec;
  auto created = Clock::now();
  QuietPeriodIdleSignal idle(200ms);
  idle.run_after_interactions([&] { rec.hit(); });
  ASSERT_TRUE(wait_fired(rec, 3000ms));
  ASSERT_TRUE(*rec.get() - created >= 200ms);
}

TEST(quiet_period_interaction_pushes_deadline_back) {
  FireRecord rec;
  QuietPeriodIdleSignal idle(250ms);
  idle.run_after_interactions([&] { rec.hit(); });
  std::this_thread::sleep_for(100ms);
  auto touched = Clock::now();
  idle.note_interaction();
  ASSERT_TRUE(wait_fired(rec, 3000ms));
  ASSERT_TRUE(*rec.get() - touched >= 250ms);
}

TEST(quiet_period_runs_every_pending_callback_once) {
  std::atomic<int> runs{0};
  FireRecord last;
  QuietPeriodIdleSignal idle(50ms);
  idle.run_after_interactions([&] { ++runs; });
  idle.run_after_interactions([&] { ++runs; last.hit(); });
  ASSERT_TRUE(wait_fired(last, 3000ms));
  std::this_thread::sleep_for(150ms);
  ASSERT_EQ(runs.load(), 2);
}

TEST(quiet_period_cancel_drops_pending_callbacks) {
  std::atomic<bool> ran{false};
  QuietPeriodIdleSignal idle(100ms);
  idle.run_after_interactions([&] { ran = true; });
  idle.cancel();
  std::this_thread::sleep_for(300ms);
  ASSERT_TRUE(!ran.load());
  // Registering after cancel never fires either: the worker is gone.
  idle.run_after_interactions([&] { ran = true; });
  std::this_thread::sleep_for(300ms);
  ASSERT_TRUE(!ran.load());
}

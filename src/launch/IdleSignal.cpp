#include "launch/IdleSignal.hpp"
#include "launch/DataSource.hpp"

namespace steward::launch {

bool interruptible_sleep(std::stop_token st, std::chrono::milliseconds d) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(m);
  (void)cv.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

void ManualIdleSignal::run_after_interactions(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mu_);
  pending_.push_back(std::move(fn));
}

void ManualIdleSignal::cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.clear();
  }
  // Wait out a notify_idle() in progress.
  std::lock_guard<std::mutex> run(run_mu_);
}

size_t ManualIdleSignal::notify_idle() {
  std::lock_guard<std::mutex> run(run_mu_);
  std::vector<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    batch.swap(pending_);
  }
  for (auto& fn : batch) fn();
  return batch.size();
}

size_t ManualIdleSignal::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.size();
}

QuietPeriodIdleSignal::QuietPeriodIdleSignal(std::chrono::milliseconds quiet)
    : quiet_(quiet), last_interaction_(std::chrono::steady_clock::now()) {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

QuietPeriodIdleSignal::~QuietPeriodIdleSignal() { cancel(); }

void QuietPeriodIdleSignal::run_after_interactions(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.push_back(std::move(fn));
  }
  cv_.notify_all();
}

void QuietPeriodIdleSignal::note_interaction() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_interaction_ = std::chrono::steady_clock::now();
  }
  cv_.notify_all();
}

void QuietPeriodIdleSignal::cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.clear();
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void QuietPeriodIdleSignal::run(std::stop_token st) {
  std::unique_lock<std::mutex> lk(mu_);
  while (!st.stop_requested()) {
    if (pending_.empty()) {
      cv_.wait(lk, st, [this]{ return !pending_.empty(); });
      continue;
    }
    auto idle_at = last_interaction_ + quiet_;
    if (std::chrono::steady_clock::now() < idle_at) {
      cv_.wait_until(lk, st, idle_at, []{ return false; });
      continue;
    }
    std::vector<std::function<void()>> batch;
    batch.swap(pending_);
    lk.unlock();
    for (auto& fn : batch) {
      if (st.stop_requested()) break;
      fn();
    }
    lk.lock();
  }
}

} // namespace steward::launch

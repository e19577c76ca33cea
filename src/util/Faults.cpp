#include "util/Faults.hpp"

#include <array>
#include <atomic>
#include <deque>
#include <mutex>

namespace steward::util {

struct FaultEvent { std::chrono::steady_clock::time_point t; FaultKind kind; };

static std::mutex g_mu;
static std::deque<FaultEvent> g_events; // ~10 minutes window
static std::array<std::atomic<uint64_t>, 3> g_totals{};

static constexpr auto kWindow = std::chrono::minutes(10);

static void prune_older_than(std::chrono::steady_clock::time_point cutoff) {
  while (!g_events.empty() && g_events.front().t < cutoff) g_events.pop_front();
}

const char* to_string(FaultKind kind) {
  switch (kind) {
    case FaultKind::Probe:       return "probe";
    case FaultKind::Persistence: return "persistence";
    case FaultKind::Loop:        return "loop";
  }
  return "loop";
}

void note_fault(FaultKind kind) {
  auto now = std::chrono::steady_clock::now();
  g_totals[static_cast<size_t>(kind)].fetch_add(1);
  std::lock_guard<std::mutex> lk(g_mu);
  prune_older_than(now - kWindow);
  g_events.push_back(FaultEvent{now, kind});
}

int count_recent_faults_ms(int ms) {
  auto now = std::chrono::steady_clock::now();
  auto cutoff = now - std::chrono::milliseconds(ms);
  std::lock_guard<std::mutex> lk(g_mu);
  prune_older_than(now - kWindow);
  int c = 0;
  for (const auto& e : g_events) if (e.t >= cutoff) ++c;
  return c;
}

int count_recent_kind_faults_ms(FaultKind kind, int ms) {
  auto now = std::chrono::steady_clock::now();
  auto cutoff = now - std::chrono::milliseconds(ms);
  std::lock_guard<std::mutex> lk(g_mu);
  prune_older_than(now - kWindow);
  int c = 0;
  for (const auto& e : g_events) if (e.t >= cutoff && e.kind == kind) ++c;
  return c;
}

uint64_t total_faults(FaultKind kind) { return g_totals[static_cast<size_t>(kind)].load(); }

} // namespace steward::util

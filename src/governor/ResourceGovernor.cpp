#include "governor/ResourceGovernor.hpp"
#include "governor/Policy.hpp"
#include "store/Codec.hpp"
#include "util/Faults.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <exception>
#ifdef __GLIBC__
#include <malloc.h>
#endif

using namespace std::chrono;

namespace steward::governor {

namespace {

constexpr const char* kTag = "ResourceGovernor";
constexpr const char* kSnapshotsKey = "memory_snapshots";
constexpr const char* kLeaksKey = "memory_leaks";
constexpr const char* kCacheStatsKey = "cache_stats";

bool default_collection() {
#ifdef __GLIBC__
  return ::malloc_trim(0) != 0;
#else
  return false;
#endif
}

template <class T>
std::vector<T> tail(const std::deque<T>& d, size_t n) {
  size_t start = d.size() > n ? d.size() - n : 0;
  return std::vector<T>(d.begin() + static_cast<std::ptrdiff_t>(start), d.end());
}

} // namespace

ResourceGovernor::ResourceGovernor(GovernorConfig cfg, probes::IMemoryProbe& probe, store::IKeyValueStore& store)
    : cfg_(cfg), probe_(probe), store_(store), cache_(cfg.cache_budget_bytes), collect_(default_collection) {}

ResourceGovernor::~ResourceGovernor() { stop_monitoring(); }

void ResourceGovernor::start_monitoring() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (thread_.joinable()) return;
  util::log_info(kTag, "starting memory monitoring (budget %.0fMB)", cfg_.budget_mb);
  load_persisted();
  capture_snapshot();
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void ResourceGovernor::stop_monitoring() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
  persist();
  util::log_info(kTag, "memory monitoring stopped");
}

bool ResourceGovernor::is_monitoring() const {
  std::lock_guard<std::mutex> lk(run_mu_);
  return thread_.joinable();
}

void ResourceGovernor::run(std::stop_token st) {
  const auto snapshot_interval = milliseconds(std::max(1, cfg_.snapshot_interval_ms));
  const auto leak_interval = milliseconds(std::max(1, cfg_.leak_check_interval_ms));
  const auto pressure_interval = milliseconds(std::max(1, cfg_.pressure_interval_ms));
  // The first snapshot was taken by start_monitoring.
  auto next_snapshot = steady_clock::now() + snapshot_interval;
  auto next_leak = steady_clock::now() + leak_interval;
  auto next_pressure = steady_clock::now() + pressure_interval;

  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_snapshot) { capture_snapshot(); next_snapshot = now + snapshot_interval; }
    if (now >= next_leak) { check_for_leaks(); next_leak = now + leak_interval; }
    if (now >= next_pressure) { check_memory_pressure(); next_pressure = now + pressure_interval; }

    auto next_due = std::min({next_snapshot, next_leak, next_pressure});
    auto sleep_for = duration_cast<milliseconds>(next_due - steady_clock::now());
    if (sleep_for < 1ms) sleep_for = 1ms;
    if (sleep_for > 100ms) sleep_for = 100ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

std::optional<model::MemoryReading> ResourceGovernor::read_probe() {
  std::lock_guard<std::mutex> lk(probe_mu_);
  model::MemoryReading r;
  try {
    if (probe_.sample(r)) return r;
    util::log_warn(kTag, "memory probe '%s' returned no reading", probe_.name());
  } catch (const std::exception& e) {
    util::log_error(kTag, "memory probe '%s' failed: %s", probe_.name(), e.what());
  }
  util::note_fault(util::FaultKind::Probe);
  return std::nullopt;
}

void ResourceGovernor::capture_snapshot() {
  try {
    auto reading = read_probe();
    if (!reading) return;
    model::MemorySample s;
    s.timestamp_ms = util::wall_ms();
    s.heap_used_mb = reading->heap_used_mb;
    s.heap_total_mb = reading->heap_total_mb;
    s.percentage_of_budget = cfg_.budget_mb > 0.0 ? reading->heap_used_mb / cfg_.budget_mb * 100.0 : 0.0;
    {
      std::lock_guard<std::mutex> lk(mu_);
      for (const auto& [name, history] : components_)
        if (!history.empty()) s.per_component_mb[name] = history.back();
      samples_.push_back(s);
      while (samples_.size() > kMaxSamples) samples_.pop_front();
    }
    if (s.percentage_of_budget > cfg_.high_usage_warn_pct) {
      util::log_warn(kTag, "high memory usage: %.1fMB (%.1f%%)", s.heap_used_mb, s.percentage_of_budget);
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "snapshot failed: %s", e.what());
    util::note_fault(util::FaultKind::Loop);
  }
}

void ResourceGovernor::check_for_leaks() {
  try {
    std::vector<model::LeakFinding> found;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (samples_.size() < kLeakWindow) return;
      auto window = tail(samples_, kLeakWindow);
      std::vector<double> used;
      used.reserve(window.size());
      for (const auto& s : window) used.push_back(s.heap_used_mb);

      const int64_t now = util::wall_ms();
      double growth = used.back() - used.front();
      if (growth > cfg_.leak_threshold_mb) {
        model::LeakFinding f;
        f.detected_at_ms = now;
        f.component = "overall";
        f.growth_mb = growth;
        f.severity = severity_for_growth(growth);
        f.contributing_samples = used;
        f.recommendations = leak_recommendations(growth, f.component);
        found.push_back(std::move(f));
      }

      for (const auto& [name, history] : components_) {
        if (history.size() < kLeakWindow) continue;
        std::vector<double> recent(history.end() - static_cast<std::ptrdiff_t>(kLeakWindow), history.end());
        double cgrowth = recent.back() - recent.front();
        if (cgrowth <= cfg_.component_leak_threshold_mb) continue;
        model::LeakFinding f;
        f.detected_at_ms = now;
        f.component = name;
        f.growth_mb = cgrowth;
        f.severity = severity_for_growth(cgrowth);
        f.contributing_samples = std::move(recent);
        f.recommendations = leak_recommendations(cgrowth, name);
        found.push_back(std::move(f));
      }

      for (const auto& f : found) findings_.push_back(f);
      while (findings_.size() > kMaxFindings) findings_.pop_front();
    }
    for (const auto& f : found) {
      util::log_error(kTag, "memory leak suspected in '%s': +%.1fMB over %zu samples (%s)",
                      f.component.c_str(), f.growth_mb, f.contributing_samples.size(),
                      model::to_string(f.severity));
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "leak check failed: %s", e.what());
    util::note_fault(util::FaultKind::Loop);
  }
}

void ResourceGovernor::check_memory_pressure() {
  try {
    auto reading = read_probe();
    {
      std::lock_guard<std::mutex> lk(mu_);
      ++counters_.checks;
    }
    if (!reading) return;
    model::MemoryTrend trend;
    {
      std::lock_guard<std::mutex> lk(mu_);
      std::vector<double> used;
      for (const auto& s : tail(samples_, 5)) used.push_back(s.heap_used_mb);
      trend = memory_trend(used);
    }
    auto p = assess_pressure(reading->heap_used_mb, cfg_.budget_mb, trend);
    switch (p.level) {
      case model::PressureLevel::Moderate:
        util::log_info(kTag, "moderate memory pressure (%.1f%%)", p.percentage);
        break;
      case model::PressureLevel::High: {
        util::log_warn(kTag, "high memory pressure (%.1f%%, %s): shrinking cache by 30%%",
                       p.percentage, model::to_string(p.trend));
        uint64_t freed = cache_.shrink_by(0.3);
        {
          std::lock_guard<std::mutex> lk(mu_);
          ++counters_.cache_shrinks;
        }
        util::log_info(kTag, "cache shrink freed %.1fKB", static_cast<double>(freed) / 1024.0);
        request_collection();
        break;
      }
      case model::PressureLevel::Critical:
        (void)cache_.clear();
        {
          std::lock_guard<std::mutex> lk(mu_);
          ++counters_.cache_clears;
        }
        request_collection();
        util::log_error(kTag, "critical memory pressure (%.1f%%): cache cleared", p.percentage);
        break;
      case model::PressureLevel::Normal:
        break;
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "pressure check failed: %s", e.what());
    util::note_fault(util::FaultKind::Loop);
  }
}

void ResourceGovernor::request_collection() {
  CollectionHook hook;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++counters_.collection_requests;
    hook = collect_;
  }
  if (!hook) return;
  bool released = hook();
  util::log_info(kTag, "collection requested: %s", released ? "memory released" : "nothing released");
}

void ResourceGovernor::set_collection_hook(CollectionHook hook) {
  std::lock_guard<std::mutex> lk(mu_);
  collect_ = std::move(hook);
}

void ResourceGovernor::track_component_memory(const std::string& component, double mb) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& history = components_[component];
  history.push_back(mb);
  while (history.size() > kComponentHistory) history.pop_front();
}

model::MemoryPressure ResourceGovernor::get_memory_pressure() {
  auto reading = read_probe();
  std::vector<double> used;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& s : tail(samples_, 5)) used.push_back(s.heap_used_mb);
  }
  double current = reading ? reading->heap_used_mb : (used.empty() ? 0.0 : used.back());
  return assess_pressure(current, cfg_.budget_mb, memory_trend(used));
}

model::MemorySummary ResourceGovernor::get_memory_summary() {
  model::MemorySummary out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!samples_.empty()) out.current = samples_.back();
    else out.current.timestamp_ms = util::wall_ms();
    out.leaks = findings_.size();
  }
  out.pressure = get_memory_pressure();
  out.cache = cache_.stats();
  return out;
}

std::vector<model::MemorySample> ResourceGovernor::get_snapshots(size_t count) const {
  std::lock_guard<std::mutex> lk(mu_);
  return tail(samples_, count == 0 ? samples_.size() : count);
}

std::vector<model::LeakFinding> ResourceGovernor::get_detected_leaks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {findings_.begin(), findings_.end()};
}

model::PressureCounters ResourceGovernor::pressure_counters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

void ResourceGovernor::load_persisted() {
  try {
    if (auto blob = store_.get(kSnapshotsKey)) {
      if (auto v = store::decode_memory_samples(*blob)) {
        std::lock_guard<std::mutex> lk(mu_);
        samples_.assign(v->begin(), v->end());
        while (samples_.size() > kMaxSamples) samples_.pop_front();
      } else {
        util::log_warn(kTag, "discarding unreadable %s", kSnapshotsKey);
        util::note_fault(util::FaultKind::Persistence);
      }
    }
    if (auto blob = store_.get(kLeaksKey)) {
      if (auto v = store::decode_leak_findings(*blob)) {
        std::lock_guard<std::mutex> lk(mu_);
        findings_.assign(v->begin(), v->end());
        while (findings_.size() > kMaxFindings) findings_.pop_front();
      } else {
        util::log_warn(kTag, "discarding unreadable %s", kLeaksKey);
        util::note_fault(util::FaultKind::Persistence);
      }
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "failed to load history: %s", e.what());
    util::note_fault(util::FaultKind::Persistence);
  }
}

void ResourceGovernor::persist() {
  try {
    std::string samples_blob, leaks_blob;
    {
      std::lock_guard<std::mutex> lk(mu_);
      samples_blob = store::encode_memory_samples(tail(samples_, kPersistSamples));
      leaks_blob = store::encode_leak_findings(tail(findings_, kPersistFindings));
    }
    bool ok = store_.set(kSnapshotsKey, samples_blob);
    ok = store_.set(kLeaksKey, leaks_blob) && ok;
    ok = store_.set(kCacheStatsKey, store::encode_cache_stats(cache_.stats())) && ok;
    if (!ok) {
      util::log_error(kTag, "failed to persist memory history to '%s' store", store_.name());
      util::note_fault(util::FaultKind::Persistence);
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "failed to persist memory history: %s", e.what());
    util::note_fault(util::FaultKind::Persistence);
  }
}

} // namespace steward::governor

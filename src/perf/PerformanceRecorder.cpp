#include "perf/PerformanceRecorder.hpp"
#include "store/Codec.hpp"
#include "util/Faults.hpp"
#include "util/Log.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>

using namespace std::chrono;

namespace steward::perf {

namespace {

constexpr const char* kTag = "PerformanceRecorder";
constexpr const char* kUiKey = "perf_ui_metrics";
constexpr const char* kMemoryKey = "perf_memory_metrics";
constexpr const char* kEntriesKey = "perf_entries";

template <class T>
void push_capped(std::deque<T>& d, T v, size_t cap) {
  d.push_back(std::move(v));
  while (d.size() > cap) d.pop_front();
}

template <class T>
std::vector<T> tail(const std::deque<T>& d, size_t n) {
  size_t start = d.size() > n ? d.size() - n : 0;
  return std::vector<T>(d.begin() + static_cast<std::ptrdiff_t>(start), d.end());
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

std::string fmt_double(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

// Last ten readings against the ten before them, 5MB dead band.
model::MemoryTrend analyze_trend(const std::vector<model::MemoryMetric>& m) {
  if (m.size() < 10) return model::MemoryTrend::Stable;
  const size_t n = m.size();
  size_t older_begin = n >= 20 ? n - 20 : 0;
  size_t older_end = n - 10;
  if (older_end == older_begin) return model::MemoryTrend::Stable;
  double recent = 0.0, older = 0.0;
  for (size_t i = older_end; i < n; ++i) recent += m[i].used_mb;
  for (size_t i = older_begin; i < older_end; ++i) older += m[i].used_mb;
  recent /= 10.0;
  older /= static_cast<double>(older_end - older_begin);
  double diff = recent - older;
  if (diff > 5.0) return model::MemoryTrend::Increasing;
  if (diff < -5.0) return model::MemoryTrend::Decreasing;
  return model::MemoryTrend::Stable;
}

struct ReportInputs {
  double avg_fps;
  double frame_drop_rate;
  double avg_render_ms;
  double peak_memory_mb;
  bool leak_suspected;
  double avg_response_ms;
  size_t missed_target_count;
  double memory_limit_mb;
};

std::vector<std::string> recommendations_for(const ReportInputs& in) {
  std::vector<std::string> out;
  char buf[160];
  if (in.avg_fps < PerformanceRecorder::kMinPerformantFps) {
    out.emplace_back("Consider optimizing animations and reducing re-renders");
    out.emplace_back("Memoize derived view state to skip unnecessary component updates");
  }
  if (in.frame_drop_rate > 5.0) {
    out.emplace_back("High frame drop rate detected - review heavy computations in render cycle");
  }
  if (in.avg_render_ms > PerformanceRecorder::kTargetRenderMs) {
    out.emplace_back("Average render time exceeds 60 FPS target - optimize component rendering");
    out.emplace_back("Consider virtualizing long lists and using lazy loading");
  }
  if (in.leak_suspected) {
    out.emplace_back("Memory leak suspected - review component cleanup and listener removal");
    out.emplace_back("Check for retained references and circular dependencies");
  }
  if (in.peak_memory_mb > in.memory_limit_mb) {
    std::snprintf(buf, sizeof(buf), "Peak memory usage (%.0fMB) exceeds target (%.0fMB)",
                  in.peak_memory_mb, in.memory_limit_mb);
    out.emplace_back(buf);
    out.emplace_back("Implement memory pooling and optimize image caching");
  }
  if (in.avg_response_ms > PerformanceRecorder::kTargetResponseMs) {
    std::snprintf(buf, sizeof(buf), "Average response time (%.0fms) exceeds target (%.0fms)",
                  in.avg_response_ms, PerformanceRecorder::kTargetResponseMs);
    out.emplace_back(buf);
    out.emplace_back("Move heavy computations to background threads");
  }
  if (in.missed_target_count > 10) {
    std::snprintf(buf, sizeof(buf), "%zu interactions exceeded response time target", in.missed_target_count);
    out.emplace_back(buf);
    out.emplace_back("Optimize event handlers and reduce synchronous operations");
  }
  return out;
}

} // namespace

PerformanceRecorder::PerformanceRecorder(RecorderConfig cfg, store::IKeyValueStore& store, MemoryReadout readout)
    : cfg_(cfg), store_(store), readout_(std::move(readout)) {}

PerformanceRecorder::~PerformanceRecorder() { stop_monitoring(); }

void PerformanceRecorder::start_monitoring() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (thread_.joinable()) return;
  util::log_info(kTag, "starting performance monitoring");
  load_persisted();
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void PerformanceRecorder::stop_monitoring() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
  persist();
  util::log_info(kTag, "performance monitoring stopped");
}

bool PerformanceRecorder::is_monitoring() const {
  std::lock_guard<std::mutex> lk(run_mu_);
  return thread_.joinable();
}

void PerformanceRecorder::run(std::stop_token st) {
  const auto ui_interval = milliseconds(std::max(1, cfg_.ui_check_interval_ms));
  const auto mem_interval = milliseconds(std::max(1, cfg_.memory_interval_ms));
  auto next_ui = steady_clock::now() + ui_interval;
  auto next_mem = steady_clock::now() + mem_interval;

  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_ui) { check_ui_health(); next_ui = now + ui_interval; }
    if (now >= next_mem) { sample_memory(); next_mem = now + mem_interval; }

    auto next_due = std::min(next_ui, next_mem);
    auto sleep_for = duration_cast<milliseconds>(next_due - steady_clock::now());
    if (sleep_for < 1ms) sleep_for = 1ms;
    if (sleep_for > 100ms) sleep_for = 100ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

void PerformanceRecorder::push_entry_locked(model::TraceEntry e) {
  push_capped(entries_, std::move(e), kMaxEntries);
}

void PerformanceRecorder::mark(const std::string& name, std::map<std::string, std::string> detail) {
  model::Mark m{name, util::wall_ms(), util::mono_ms()};
  std::lock_guard<std::mutex> lk(mu_);
  marks_[name] = m;
  push_entry_locked(model::TraceEntry{name, model::TraceKind::Mark, m.timestamp_ms, 0.0, std::move(detail)});
}

std::optional<double> PerformanceRecorder::measure(const std::string& name, const std::string& start_mark,
                                                   const std::optional<std::string>& end_mark) {
  double duration = 0.0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto start = marks_.find(start_mark);
    if (start == marks_.end()) {
      util::log_warn(kTag, "start mark '%s' not found", start_mark.c_str());
      return std::nullopt;
    }
    double end_mono = util::mono_ms();
    if (end_mark) {
      if (auto end = marks_.find(*end_mark); end != marks_.end()) end_mono = end->second.mono_ms;
    }
    duration = end_mono - start->second.mono_ms;
    push_capped(measures_, model::Measure{name, start_mark, end_mark.value_or("now"), duration}, kMaxMeasures);
    push_entry_locked(model::TraceEntry{name, model::TraceKind::Measure, start->second.timestamp_ms, duration, {}});
  }
  util::log_debug(kTag, "measure '%s': %.2fms", name.c_str(), duration);
  return duration;
}

void PerformanceRecorder::track_screen_render(const std::string& screen, double render_ms, double interaction_delay_ms) {
  const int64_t now = util::wall_ms();
  {
    std::lock_guard<std::mutex> lk(mu_);
    model::UISample s;
    s.timestamp_ms = now;
    s.screen_id = screen;
    s.fps = kTargetFps;
    s.render_time_ms = render_ms;
    s.interaction_delay_ms = interaction_delay_ms;
    push_capped(ui_, std::move(s), kMaxUiSamples);
    push_entry_locked(model::TraceEntry{"screen_render_" + screen, model::TraceKind::Render,
                                        now - static_cast<int64_t>(render_ms), render_ms,
                                        {{"interaction_delay_ms", fmt_double(interaction_delay_ms)}}});
  }
  if (render_ms > kTargetRenderMs) {
    util::log_warn(kTag, "slow render on %s: %.2fms (target %.2fms)", screen.c_str(), render_ms, kTargetRenderMs);
  }
  if (interaction_delay_ms > kTargetResponseMs) {
    util::log_warn(kTag, "slow interaction on %s: %.2fms (target %.0fms)", screen.c_str(), interaction_delay_ms,
                   kTargetResponseMs);
  }
}

void PerformanceRecorder::track_scroll_performance(const std::string& screen, double fps, double smoothness, int jank_count) {
  const int64_t now = util::wall_ms();
  model::ScrollMetrics scroll{fps, std::clamp(smoothness, 0.0, 100.0), jank_count};
  {
    std::lock_guard<std::mutex> lk(mu_);
    // Attach to a sample of the same screen from the last second, if any.
    auto it = std::find_if(ui_.rbegin(), ui_.rend(), [&](const model::UISample& s) {
      return s.screen_id == screen && now - s.timestamp_ms < 1000;
    });
    if (it != ui_.rend()) {
      it->scroll = scroll;
    } else {
      model::UISample s;
      s.timestamp_ms = now;
      s.screen_id = screen;
      s.fps = fps;
      s.frame_drops = kTargetFps - fps;
      s.scroll = scroll;
      push_capped(ui_, std::move(s), kMaxUiSamples);
    }
  }
  if (fps < kMinPerformantFps) {
    util::log_warn(kTag, "poor scroll performance on %s: %.0f FPS (target %.0f FPS)", screen.c_str(), fps, kTargetFps);
  }
  if (jank_count > 5) {
    util::log_warn(kTag, "high jank count on %s: %d janks", screen.c_str(), jank_count);
  }
}

void PerformanceRecorder::track_navigation(const std::string& from, const std::string& to, double duration_ms) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    push_entry_locked(model::TraceEntry{"navigation_" + from + "_to_" + to, model::TraceKind::Navigation,
                                        util::wall_ms() - static_cast<int64_t>(duration_ms), duration_ms,
                                        {{"from", from}, {"to", to}}});
  }
  if (duration_ms > kTargetNavigationMs) {
    util::log_warn(kTag, "slow navigation %s -> %s: %.2fms", from.c_str(), to.c_str(), duration_ms);
  }
  util::log_debug(kTag, "navigation %s -> %s: %.2fms", from.c_str(), to.c_str(), duration_ms);
}

void PerformanceRecorder::track_interaction(const std::string& type, const std::string& target, double response_ms) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    push_entry_locked(model::TraceEntry{"interaction_" + type + "_" + target, model::TraceKind::Interaction,
                                        util::wall_ms() - static_cast<int64_t>(response_ms), response_ms,
                                        {{"type", type}, {"target", target}}});
  }
  if (response_ms > kTargetResponseMs) {
    util::log_warn(kTag, "slow interaction '%s' on '%s': %.2fms (target %.0fms)", type.c_str(), target.c_str(),
                   response_ms, kTargetResponseMs);
  }
}

model::CurrentPerformance PerformanceRecorder::get_current_performance() const {
  double avg_fps = kTargetFps;
  double memory_mb = 0.0;
  double avg_response = 0.0;
  MemoryReadout readout;
  bool have_memory = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto recent_ui = tail(ui_, 10);
    if (!recent_ui.empty()) {
      double sum = 0.0;
      for (const auto& s : recent_ui) sum += s.fps;
      avg_fps = sum / static_cast<double>(recent_ui.size());
    }
    if (!memory_.empty()) {
      memory_mb = memory_.back().used_mb;
      have_memory = true;
    } else {
      readout = readout_;
    }
    double sum = 0.0;
    size_t n = 0;
    for (auto it = entries_.rbegin(); it != entries_.rend() && n < 10; ++it) {
      if (it->kind != model::TraceKind::Interaction) continue;
      sum += it->duration_ms;
      ++n;
    }
    if (n > 0) avg_response = sum / static_cast<double>(n);
  }
  if (!have_memory && readout) {
    if (auto m = readout()) memory_mb = m->used_mb;
  }

  model::CurrentPerformance out;
  out.fps = static_cast<int>(std::lround(avg_fps));
  out.memory_usage_mb = static_cast<int>(std::lround(memory_mb));
  out.response_time_ms = static_cast<int>(std::lround(avg_response));
  out.is_performant = avg_fps >= kMinPerformantFps && memory_mb <= cfg_.memory_limit_mb &&
                      avg_response <= kTargetResponseMs;
  return out;
}

model::PerformanceReport PerformanceRecorder::generate_performance_report(double window_hours) const {
  const int64_t now = util::wall_ms();
  const int64_t cutoff = now - static_cast<int64_t>(window_hours * 3600.0 * 1000.0);

  std::vector<model::UISample> ui;
  std::vector<model::MemoryMetric> mem;
  std::vector<model::TraceEntry> nav, inter;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& s : ui_) if (s.timestamp_ms >= cutoff) ui.push_back(s);
    for (const auto& m : memory_) if (m.timestamp_ms >= cutoff) mem.push_back(m);
    for (const auto& e : entries_) {
      if (e.start_time_ms < cutoff) continue;
      if (e.kind == model::TraceKind::Navigation) nav.push_back(e);
      else if (e.kind == model::TraceKind::Interaction) inter.push_back(e);
    }
  }

  model::PerformanceReport r;
  r.period_start_ms = cutoff;
  r.period_end_ms = now;

  // UI
  double avg_fps = kTargetFps, drop_rate = 0.0, avg_render = 0.0, avg_delay = 0.0;
  if (!ui.empty()) {
    double fps = 0.0, drops = 0.0, render = 0.0, delay = 0.0;
    std::map<std::string, std::pair<double, int>> per_screen;
    for (const auto& s : ui) {
      fps += s.fps;
      drops += s.frame_drops;
      render += s.render_time_ms;
      delay += s.interaction_delay_ms;
      auto& acc = per_screen[s.screen_id];
      acc.first += s.render_time_ms;
      acc.second += 1;
    }
    const double n = static_cast<double>(ui.size());
    avg_fps = fps / n;
    drop_rate = drops / (n * kTargetFps) * 100.0;
    avg_render = render / n;
    avg_delay = delay / n;
    for (const auto& [screen, acc] : per_screen)
      r.ui.slow_screens.push_back({screen, acc.first / acc.second});
    std::stable_sort(r.ui.slow_screens.begin(), r.ui.slow_screens.end(),
                     [](const auto& a, const auto& b) { return a.avg_render_time_ms > b.avg_render_time_ms; });
    if (r.ui.slow_screens.size() > 5) r.ui.slow_screens.resize(5);
  }
  r.ui.average_fps = round2(avg_fps);
  r.ui.frame_drop_rate_pct = round2(drop_rate);
  r.ui.average_render_time_ms = round2(avg_render);
  r.ui.average_interaction_delay_ms = round2(avg_delay);

  // Memory
  double avg_mem = 0.0, peak_mem = 0.0;
  if (!mem.empty()) {
    for (const auto& m : mem) {
      avg_mem += m.used_mb;
      peak_mem = std::max(peak_mem, m.used_mb);
    }
    avg_mem /= static_cast<double>(mem.size());
  }
  r.memory.trend = analyze_trend(mem);
  r.memory.leak_suspected = r.memory.trend == model::MemoryTrend::Increasing && avg_mem > 100.0;
  r.memory.average_usage_mb = round2(avg_mem);
  r.memory.peak_usage_mb = round2(peak_mem);

  // Navigation
  double avg_nav = 0.0;
  if (!nav.empty()) {
    for (const auto& e : nav) avg_nav += e.duration_ms;
    avg_nav /= static_cast<double>(nav.size());
    std::stable_sort(nav.begin(), nav.end(), [](const auto& a, const auto& b) { return a.duration_ms > b.duration_ms; });
    for (size_t i = 0; i < nav.size() && i < 5; ++i) {
      auto from = nav[i].detail.find("from");
      auto to = nav[i].detail.find("to");
      r.navigation.slowest.push_back({from != nav[i].detail.end() ? from->second : "unknown",
                                      to != nav[i].detail.end() ? to->second : "unknown",
                                      nav[i].duration_ms});
    }
  }
  r.navigation.average_transition_ms = round2(avg_nav);

  // Responsiveness
  double avg_resp = 0.0, p95 = 0.0;
  size_t missed = 0;
  if (!inter.empty()) {
    std::vector<double> times;
    times.reserve(inter.size());
    for (const auto& e : inter) {
      times.push_back(e.duration_ms);
      avg_resp += e.duration_ms;
      if (e.duration_ms > kTargetResponseMs) ++missed;
    }
    avg_resp /= static_cast<double>(inter.size());
    std::sort(times.begin(), times.end());
    p95 = times[static_cast<size_t>(std::floor(static_cast<double>(times.size()) * 0.95))];
  }
  r.responsiveness.average_response_ms = round2(avg_resp);
  r.responsiveness.p95_response_ms = round2(p95);
  r.responsiveness.missed_target_count = missed;

  r.recommendations = recommendations_for(ReportInputs{avg_fps, drop_rate, avg_render, peak_mem,
                                                       r.memory.leak_suspected, avg_resp, missed,
                                                       cfg_.memory_limit_mb});
  return r;
}

void PerformanceRecorder::sample_memory() {
  try {
    MemoryReadout readout;
    {
      std::lock_guard<std::mutex> lk(mu_);
      readout = readout_;
    }
    if (!readout) return;
    auto m = readout();
    if (!m) return;
    {
      std::lock_guard<std::mutex> lk(mu_);
      push_capped(memory_, *m, kMaxMemoryMetrics);
    }
    if (m->percentage > 90.0) {
      util::log_error(kTag, "critical memory usage: %.1fMB of %.1fMB (%.1f%%)", m->used_mb, m->limit_mb, m->percentage);
    } else if (m->used_mb > cfg_.memory_limit_mb) {
      util::log_warn(kTag, "memory usage %.1fMB exceeds target %.0fMB", m->used_mb, cfg_.memory_limit_mb);
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "memory sampling failed: %s", e.what());
    util::note_fault(util::FaultKind::Loop);
  }
}

void PerformanceRecorder::check_ui_health() {
  auto cur = get_current_performance();
  if (!cur.is_performant) {
    util::log_warn(kTag, "performance degradation: %d FPS, %dMB, %dms response",
                   cur.fps, cur.memory_usage_mb, cur.response_time_ms);
  }
}

std::vector<model::Mark> PerformanceRecorder::get_marks() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::Mark> out;
  out.reserve(marks_.size());
  for (const auto& [name, m] : marks_) out.push_back(m);
  return out;
}

std::vector<model::Measure> PerformanceRecorder::get_measures() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {measures_.begin(), measures_.end()};
}

std::vector<model::TraceEntry> PerformanceRecorder::get_entries(std::optional<model::TraceKind> kind) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::TraceEntry> out;
  for (const auto& e : entries_)
    if (!kind || e.kind == *kind) out.push_back(e);
  return out;
}

std::vector<model::UISample> PerformanceRecorder::get_ui_samples() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {ui_.begin(), ui_.end()};
}

std::vector<model::MemoryMetric> PerformanceRecorder::get_memory_metrics() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {memory_.begin(), memory_.end()};
}

void PerformanceRecorder::clear_marks() {
  std::lock_guard<std::mutex> lk(mu_);
  marks_.clear();
  measures_.clear();
}

void PerformanceRecorder::clear_metrics() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ui_.clear();
    memory_.clear();
    entries_.clear();
  }
  persist();
}

void PerformanceRecorder::set_memory_readout(MemoryReadout readout) {
  std::lock_guard<std::mutex> lk(mu_);
  readout_ = std::move(readout);
}

void PerformanceRecorder::load_persisted() {
  try {
    auto ui = store_.get(kUiKey);
    auto mem = store_.get(kMemoryKey);
    auto entries = store_.get(kEntriesKey);
    std::lock_guard<std::mutex> lk(mu_);
    bool bad = false;
    if (ui) {
      if (auto v = store::decode_ui_samples(*ui)) ui_.assign(v->begin(), v->end());
      else bad = true;
    }
    if (mem) {
      if (auto v = store::decode_memory_metrics(*mem)) memory_.assign(v->begin(), v->end());
      else bad = true;
    }
    if (entries) {
      if (auto v = store::decode_trace_entries(*entries)) entries_.assign(v->begin(), v->end());
      else bad = true;
    }
    if (bad) {
      util::log_warn(kTag, "discarding unreadable persisted metrics");
      util::note_fault(util::FaultKind::Persistence);
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "failed to load metrics: %s", e.what());
    util::note_fault(util::FaultKind::Persistence);
  }
}

void PerformanceRecorder::persist() {
  try {
    std::string ui, mem, entries;
    {
      std::lock_guard<std::mutex> lk(mu_);
      ui = store::encode_ui_samples(tail(ui_, kPersistUiSamples));
      mem = store::encode_memory_metrics(tail(memory_, kPersistMemoryMetrics));
      entries = store::encode_trace_entries(tail(entries_, kPersistEntries));
    }
    bool ok = store_.set(kUiKey, ui);
    ok = store_.set(kMemoryKey, mem) && ok;
    ok = store_.set(kEntriesKey, entries) && ok;
    if (!ok) {
      util::log_error(kTag, "failed to persist metrics to '%s' store", store_.name());
      util::note_fault(util::FaultKind::Persistence);
    }
  } catch (const std::exception& e) {
    util::log_error(kTag, "failed to persist metrics: %s", e.what());
    util::note_fault(util::FaultKind::Persistence);
  }
}

} // namespace steward::perf

#include "app/Config.hpp"
#include "app/Steward.hpp"
#include "launch/SimulatedDataSource.hpp"
#include "probes/MemoryProbe.hpp"
#include "store/KeyValueStore.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

template <typename T>
static bool parse_arg(std::string_view s, T& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

static void usage() {
  std::cout << "Usage: steward [--seconds N] [--report-hours H] [--fail-priority P]\n";
  std::cout << "Runs a governed startup against a simulated data layer, then monitors for N seconds (default 10).\n";
  std::cout << "  --fail-priority P  make the preload with priority P fail (1, 3, 4 or 5)\n";
  std::cout << "Config: $STEWARD_CONFIG or ~/.config/steward/config.toml\n";
}

// Simulated UI activity so the recorder has something to report.
static void simulate_frame(steward::app::Steward& s, steward::launch::QuietPeriodIdleSignal& idle, int tick) {
  static const char* kScreens[] = {"today", "pending", "history"};
  const char* screen = kScreens[tick % 3];
  const char* next = kScreens[(tick + 1) % 3];
  auto& rec = s.recorder();
  rec.track_screen_render(screen, 12.0 + (tick % 5) * 2.5, 40.0 + (tick % 7) * 15.0);
  if (tick % 4 == 0) rec.track_scroll_performance(screen, 58.0 - (tick % 3), 95.0, tick % 2);
  if (tick % 10 == 0) {
    rec.track_navigation(screen, next, 180.0 + (tick % 4) * 60.0);
    idle.note_interaction();
  }
  rec.track_interaction("tap", screen, 60.0 + (tick % 6) * 12.0);
  s.governor().track_component_memory(screen, 4.0 + (tick % 10) * 0.3);
}

static void print_summary(steward::app::Steward& s, double report_hours) {
  namespace model = steward::model;
  auto lp = s.sequencer().get_launch_performance();
  std::printf("\n== Launch ==\n");
  std::printf("state: %s  %s start\n", model::to_string(s.sequencer().state()), s.sequencer().cold_start() ? "cold" : "warm");
  if (lp.last_launch) {
    const auto& l = *lp.last_launch;
    std::printf("critical path %.0fms  interactive %.0fms  fully loaded %.0fms\n",
                l.critical_path_complete_ms, l.interactive_ms, l.fully_loaded_ms);
    std::printf("loaded %d  deferred %d  failed %d\n", l.loaded_count, l.deferred_count, l.failed_count);
  }
  std::printf("avg cold %.0fms (target %.0f)  avg warm %.0fms (target %.0f)  %s\n",
              lp.average_cold_start_ms, lp.cold_target_ms, lp.average_warm_start_ms, lp.warm_target_ms,
              lp.meeting_target ? "meeting target" : "missing target");
  for (const auto& r : s.sequencer().resources()) {
    std::printf("  %-16s p%d %-8s %s\n", r.id.c_str(), r.priority, model::to_string(r.kind),
                r.loaded ? "loaded" : (r.error ? r.error->c_str() : "pending"));
  }

  auto ms = s.governor().get_memory_summary();
  std::printf("\n== Memory ==\n");
  std::printf("heap %.1f / %.1fMB (%.1f%% of budget)  pressure %s  trend %s\n",
              ms.current.heap_used_mb, ms.current.heap_total_mb, ms.current.percentage_of_budget,
              model::to_string(ms.pressure.level), model::to_string(ms.pressure.trend));
  std::printf("cache %llu bytes in %zu entries, hit rate %.1f%%  leaks %zu\n",
              static_cast<unsigned long long>(ms.cache.total_size_bytes), ms.cache.entry_count,
              ms.cache.hit_rate_pct, ms.leaks);
  for (const auto& a : ms.pressure.recommended_actions) std::printf("  - %s\n", a.c_str());

  auto rep = s.recorder().generate_performance_report(report_hours);
  std::printf("\n== Performance (last %.1fh) ==\n", report_hours);
  std::printf("fps %.2f  frame drops %.1f%%  render %.2fms\n", rep.ui.average_fps, rep.ui.frame_drop_rate_pct,
              rep.ui.average_render_time_ms);
  for (const auto& sc : rep.ui.slow_screens)
    std::printf("  slow screen %-10s %.2fms\n", sc.screen.c_str(), sc.avg_render_time_ms);
  std::printf("navigation avg %.2fms  response avg %.2fms p95 %.2fms missed %zu\n",
              rep.navigation.average_transition_ms, rep.responsiveness.average_response_ms,
              rep.responsiveness.p95_response_ms, rep.responsiveness.missed_target_count);
  for (const auto& r : rep.recommendations) std::printf("  - %s\n", r.c_str());
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  int seconds = 10;
  double report_hours = 24.0;
  int fail_priority = 0;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    bool ok = true;
    if (a == "--seconds" && i + 1 < argc) ok = parse_arg(argv[++i], seconds) && seconds >= 0;
    else if (a == "--report-hours" && i + 1 < argc) ok = parse_arg(argv[++i], report_hours) && report_hours > 0;
    else if (a == "--fail-priority" && i + 1 < argc) ok = parse_arg(argv[++i], fail_priority);
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else ok = false;
    if (!ok) {
      std::fprintf(stderr, "steward: bad argument: %s\n", argv[i]);
      usage();
      return 2;
    }
  }

  auto cfg = steward::app::load_config();
  auto idle_owned = std::make_unique<steward::launch::QuietPeriodIdleSignal>(400ms);
  auto* idle = idle_owned.get();
  steward::launch::SimulatedDataSource::Delays delays{};
  steward::app::Steward app(cfg,
                            std::make_unique<steward::store::FileKeyValueStore>(cfg.storage_dir),
                            steward::probes::make_default_probe(),
                            std::make_unique<steward::launch::SimulatedDataSource>(delays, fail_priority),
                            std::move(idle_owned));

  try {
    app.start();
  } catch (const steward::launch::FatalResourceFailure& e) {
    std::fprintf(stderr, "steward: startup aborted: %s\n", e.what());
    app.shutdown();
    return 1;
  }

  app.recorder().mark("interactive");
  auto end = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  int tick = 0;
  while (!g_stop.load() && std::chrono::steady_clock::now() < end) {
    simulate_frame(app, *idle, tick++);
    std::this_thread::sleep_for(100ms);
  }
  app.recorder().mark("session_end");
  if (auto d = app.recorder().measure("session", "interactive", "session_end"))
    steward::util::log_info("main", "session lasted %.0fms", *d);

  print_summary(app, report_hours);
  app.shutdown();
  return 0;
}

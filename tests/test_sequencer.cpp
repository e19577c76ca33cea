#include "minitest.hpp"
#include "test_doubles.hpp"
#include "launch/StartupSequencer.hpp"
#include "store/Codec.hpp"
#include "util/Time.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using steward::launch::FatalResourceFailure;
using steward::launch::LaunchConfig;
using steward::launch::ManualIdleSignal;
using steward::launch::StartupSequencer;
using steward::model::LaunchState;
using steward::model::ResourceKind;
using steward::store::MemoryKeyValueStore;
using steward::testing::LogCapture;
using steward::testing::ScriptedDataSource;
using steward::util::LogLevel;

static LaunchConfig fast_config() {
  LaunchConfig c;
  c.critical_path_timeout_ms = 2000;
  return c;
}

static const steward::model::ResourceDescriptor* find_resource(const std::vector<steward::model::ResourceDescriptor>& v,
                                                               const std::string& id) {
  for (const auto& r : v)
    if (r.id == id) return &r;
  return nullptr;
}

static steward::model::LaunchRecord launch_record(bool cold, double interactive_ms) {
  steward::model::LaunchRecord r;
  r.cold_start = cold;
  r.start_time_ms = 1700000000000;
  r.critical_path_complete_ms = interactive_ms;
  r.interactive_ms = interactive_ms;
  r.fully_loaded_ms = interactive_ms;
  return r;
}

TEST(sequencer_happy_path_reaches_fully_loaded) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  std::vector<std::string> ran;
  seq.add_deferred_task("index_search", 3, [&] { ran.push_back("index_search"); });
  ASSERT_TRUE(seq.state() == LaunchState::NotStarted);
  ASSERT_TRUE(!seq.is_ready());

  seq.initialize(fast_config());
  ASSERT_TRUE(seq.state() == LaunchState::Interactive);
  ASSERT_TRUE(seq.is_ready());
  ASSERT_TRUE(seq.interactive_at_ms().has_value());
  ASSERT_TRUE(seq.critical_path_complete_at_ms().has_value());
  ASSERT_TRUE(*seq.interactive_at_ms() >= *seq.critical_path_complete_at_ms());
  ASSERT_TRUE(seq.cold_start());
  auto res = seq.resources();
  ASSERT_EQ(res.size(), 5u);
  for (const auto& r : res) {
    ASSERT_TRUE(r.loaded);
    ASSERT_TRUE(!r.error.has_value());
    ASSERT_TRUE(r.load_time_ms.has_value());
  }
  ASSERT_EQ(data.history_days.load(), 7);

  // Still accepted while interactive.
  seq.add_deferred_task("sync_contacts", 1, [&] { ran.push_back("sync_contacts"); });
  ASSERT_EQ(idle.pending(), 1u);
  ASSERT_TRUE(!kv.get("launch_metrics").has_value());

  ASSERT_EQ(idle.notify_idle(), 1u);
  ASSERT_TRUE(seq.state() == LaunchState::FullyLoaded);
  ASSERT_EQ(ran, (std::vector<std::string>{"sync_contacts", "index_search"}));
  auto tasks = seq.deferred_tasks();
  ASSERT_EQ(tasks.size(), 3u);
  ASSERT_EQ(tasks.back().id, "cache_cleanup");

  auto records = steward::store::decode_launch_records(kv.get("launch_metrics").value_or(""));
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  const auto& rec = records->front();
  ASSERT_TRUE(rec.cold_start);
  ASSERT_EQ(rec.loaded_count, 5);
  ASSERT_EQ(rec.deferred_count, 3);
  ASSERT_EQ(rec.failed_count, 0);
  ASSERT_TRUE(rec.fully_loaded_ms >= rec.interactive_ms);
  ASSERT_NEAR(rec.phases.background_tasks_ms, rec.fully_loaded_ms - rec.interactive_ms, 1e-6);
  ASSERT_EQ(seq.get_launch_metrics().size(), 1u);
}

TEST(sequencer_starts_loaders_in_priority_order) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  seq.add_resource("fonts", ResourceKind::Asset, 2, [](std::stop_token) {});
  seq.add_resource("feature_flags", ResourceKind::Service, 1, [](std::stop_token) {});
  auto cfg = fast_config();
  cfg.recent_history_days = 3;
  seq.initialize(cfg);
  ASSERT_EQ(seq.attempt_order(), (std::vector<std::string>{"database_init", "feature_flags", "pre_cache_load", "fonts",
                                                           "today_schedules", "pending_items", "recent_history"}));
  ASSERT_EQ(data.history_days.load(), 3);
}

TEST(sequencer_disabled_preloads_are_not_registered) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  auto cfg = fast_config();
  cfg.enable_precaching = false;
  cfg.pending_items = false;
  cfg.recent_history = false;
  seq.initialize(cfg);
  ASSERT_EQ(seq.attempt_order(), (std::vector<std::string>{"database_init", "today_schedules"}));
  ASSERT_EQ(data.calls(), (std::vector<std::string>{"initialize", "today_schedule"}));
}

TEST(sequencer_critical_timeout_is_fatal) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  data.init.delay = 50ms;
  data.schedule.delay = 5000ms;
  seq.add_resource("settings", ResourceKind::Data, 2, [](std::stop_token st) {
    (void)steward::launch::interruptible_sleep(st, 100ms);
  });
  auto cfg = fast_config();
  cfg.critical_path_timeout_ms = 200;
  cfg.enable_precaching = false;
  cfg.pending_items = false;
  cfg.recent_history = false;

  const auto started = std::chrono::steady_clock::now();
  bool threw = false;
  try {
    seq.initialize(cfg);
  } catch (const FatalResourceFailure& e) {
    threw = true;
    ASSERT_EQ(e.resource_id(), "today_schedules");
    ASSERT_EQ(e.priority(), 3);
    ASSERT_TRUE(std::string(e.what()).find("timed out after 200ms") != std::string::npos);
  }
  ASSERT_TRUE(threw);
  ASSERT_TRUE(std::chrono::steady_clock::now() - started < 2000ms);
  ASSERT_TRUE(seq.state() == LaunchState::Failed);
  ASSERT_TRUE(!seq.is_ready());
  ASSERT_TRUE(!seq.interactive_at_ms().has_value());
  ASSERT_EQ(idle.pending(), 0u);

  auto res = seq.resources();
  ASSERT_TRUE(find_resource(res, "database_init")->loaded);
  ASSERT_TRUE(find_resource(res, "settings")->loaded);
  ASSERT_TRUE(!find_resource(res, "today_schedules")->loaded);

  // The abandoned loader is told to stop and its result is discarded.
  for (int i = 0; i < 100 && seq.late_completions() == 0; ++i) std::this_thread::sleep_for(10ms);
  ASSERT_EQ(seq.late_completions(), 1u);
  ASSERT_EQ(data.stopped.load(), 1);

  bool rethrown = false;
  try {
    seq.initialize(cfg);
  } catch (const FatalResourceFailure& e) {
    rethrown = e.resource_id() == "today_schedules";
  }
  ASSERT_TRUE(rethrown);
  ASSERT_EQ(data.calls().size(), 2u);
}

TEST(sequencer_rejected_critical_resource_message) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  data.init.error = "db locked";
  std::string what;
  try {
    seq.initialize(fast_config());
  } catch (const FatalResourceFailure& e) {
    what = e.what();
  }
  ASSERT_EQ(what, "critical resource 'database_init' (priority 1) failed: db locked");
  ASSERT_TRUE(seq.state() == LaunchState::Failed);
}

TEST(sequencer_low_priority_failure_is_tolerated) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  data.pending.error = "disk busy";
  LogCapture logs;
  seq.initialize(fast_config());
  ASSERT_TRUE(seq.state() == LaunchState::Interactive);
  auto res = seq.resources();
  auto pending = find_resource(res, "pending_items");
  ASSERT_TRUE(pending != nullptr);
  ASSERT_TRUE(!pending->loaded);
  ASSERT_EQ(pending->error.value_or(""), "disk busy");
  ASSERT_EQ(logs.count(LogLevel::Warn, "continuing"), 1u);

  idle.notify_idle();
  auto records = seq.get_launch_metrics();
  ASSERT_EQ(records.size(), 1u);
  ASSERT_EQ(records[0].loaded_count, 4);
  ASSERT_EQ(records[0].failed_count, 1);
}

TEST(sequencer_low_priority_timeout_is_tolerated) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  data.history.delay = 5000ms;
  auto cfg = fast_config();
  cfg.critical_path_timeout_ms = 150;
  seq.initialize(cfg);
  ASSERT_TRUE(seq.state() == LaunchState::Interactive);
  auto res = seq.resources();
  auto history = find_resource(res, "recent_history");
  ASSERT_TRUE(history->error.value_or("").find("timed out") != std::string::npos);
}

TEST(sequencer_initialize_is_idempotent) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  seq.initialize(fast_config());
  auto calls = data.calls().size();
  ASSERT_EQ(calls, 4u);
  seq.initialize(fast_config());
  seq.initialize();
  ASSERT_EQ(data.calls().size(), calls);
  ASSERT_EQ(idle.pending(), 1u);
  ASSERT_EQ(seq.attempt_order().size(), 5u);
}

TEST(sequencer_deferred_failures_are_isolated) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  std::vector<std::string> ran;
  seq.add_deferred_task("warm_images", 2, [&] { ran.push_back("warm_images"); });
  seq.add_deferred_task("prune_logs", 1, [&] {
    ran.push_back("prune_logs");
    throw std::runtime_error("read-only filesystem");
  });
  seq.add_deferred_task("empty", 4, {});
  seq.initialize(fast_config());
  idle.notify_idle();
  ASSERT_EQ(ran, (std::vector<std::string>{"prune_logs", "warm_images"}));
  auto tasks = seq.deferred_tasks();
  ASSERT_EQ(tasks.size(), 4u);
  ASSERT_EQ(tasks[0].id, "prune_logs");
  ASSERT_EQ(tasks[0].error.value_or(""), "read-only filesystem");
  ASSERT_TRUE(!tasks[0].executed);
  ASSERT_TRUE(tasks[1].executed);
  ASSERT_TRUE(!tasks[2].executed);
  ASSERT_TRUE(tasks[2].error.has_value());
  ASSERT_EQ(tasks[3].id, "cache_cleanup");
  ASSERT_TRUE(tasks[3].executed);
  ASSERT_TRUE(seq.state() == LaunchState::FullyLoaded);
  ASSERT_EQ(seq.get_launch_metrics()[0].deferred_count, 2);
  ASSERT_EQ(seq.get_launch_metrics()[0].failed_count, 2);

  LogCapture logs;
  seq.add_deferred_task("too_late", 1, [] {});
  ASSERT_EQ(logs.count(LogLevel::Warn, "too_late"), 1u);
  ASSERT_EQ(seq.deferred_tasks().size(), 4u);
}

TEST(sequencer_without_background_init_is_fully_loaded) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  bool ran = false;
  seq.add_deferred_task("never", 1, [&] { ran = true; });
  auto cfg = fast_config();
  cfg.enable_background_init = false;
  seq.initialize(cfg);
  ASSERT_TRUE(seq.state() == LaunchState::FullyLoaded);
  ASSERT_EQ(idle.pending(), 0u);
  ASSERT_TRUE(!ran);
  auto records = seq.get_launch_metrics();
  ASSERT_EQ(records.size(), 1u);
  ASSERT_NEAR(records[0].phases.background_tasks_ms, 0.0, 1e-9);
  ASSERT_TRUE(kv.get("launch_metrics").has_value());
}

TEST(sequencer_late_resource_registration_is_ignored) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  seq.initialize(fast_config());
  LogCapture logs;
  seq.add_resource("late", ResourceKind::Asset, 1, [](std::stop_token) {});
  ASSERT_EQ(logs.count(LogLevel::Warn, "late"), 1u);
  ASSERT_EQ(seq.resources().size(), 5u);
}

TEST(sequencer_detects_warm_start) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  ASSERT_TRUE(kv.set("last_launch_time", std::to_string(steward::util::wall_ms() - 60 * 1000)));
  StartupSequencer seq(kv, data, idle);
  seq.initialize(fast_config());
  ASSERT_TRUE(!seq.cold_start());
  auto stamp = std::stoll(kv.get("last_launch_time").value_or("0"));
  ASSERT_TRUE(steward::util::wall_ms() - stamp < 60 * 1000);
}

TEST(sequencer_detects_cold_start) {
  {
    MemoryKeyValueStore kv;
    ScriptedDataSource data;
    ManualIdleSignal idle;
    ASSERT_TRUE(kv.set("last_launch_time", std::to_string(steward::util::wall_ms() - 10 * 60 * 1000)));
    StartupSequencer seq(kv, data, idle);
    seq.initialize(fast_config());
    ASSERT_TRUE(seq.cold_start());
  }
  {
    MemoryKeyValueStore kv;
    ScriptedDataSource data;
    ManualIdleSignal idle;
    ASSERT_TRUE(kv.set("last_launch_time", "yesterday"));
    LogCapture logs;
    StartupSequencer seq(kv, data, idle);
    seq.initialize(fast_config());
    ASSERT_TRUE(seq.cold_start());
    ASSERT_EQ(logs.count(LogLevel::Warn, "unreadable"), 1u);
  }
}

TEST(sequencer_loads_fresh_precache) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  steward::store::PrecacheBlob pc{steward::util::wall_ms() - 1000, {{"user", "ada"}, {"theme", "dark"}}};
  ASSERT_TRUE(kv.set("launch_pre_cache", steward::store::encode_precache(pc)));
  StartupSequencer seq(kv, data, idle);
  ASSERT_TRUE(!seq.get_from_precache("user").has_value());
  seq.initialize(fast_config());
  ASSERT_EQ(seq.get_from_precache("user").value_or(""), "ada");
  ASSERT_TRUE(!seq.get_from_precache("missing").has_value());
  idle.notify_idle();
  ASSERT_TRUE(kv.get("launch_pre_cache").has_value());
}

TEST(sequencer_expired_precache_is_ignored_then_cleaned) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  steward::store::PrecacheBlob pc{steward::util::wall_ms() - 25ll * 60 * 60 * 1000, {{"user", "ada"}}};
  ASSERT_TRUE(kv.set("launch_pre_cache", steward::store::encode_precache(pc)));
  StartupSequencer seq(kv, data, idle);
  seq.initialize(fast_config());
  ASSERT_TRUE(!seq.get_from_precache("user").has_value());
  idle.notify_idle();
  ASSERT_TRUE(!kv.get("launch_pre_cache").has_value());
}

TEST(sequencer_precache_size_limit) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  auto cfg = fast_config();
  cfg.precache_max_bytes = 64;
  seq.initialize(cfg);
  ASSERT_TRUE(seq.save_to_precache("user", "ada"));
  auto stored = steward::store::decode_precache(kv.get("launch_pre_cache").value_or(""));
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(stored->data.at("user"), "ada");

  LogCapture logs;
  ASSERT_TRUE(!seq.save_to_precache("blob", std::string(200, 'x')));
  ASSERT_EQ(logs.count(LogLevel::Warn, "size limit"), 1u);
  // The oversized blob is not written.
  stored = steward::store::decode_precache(kv.get("launch_pre_cache").value_or(""));
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(stored->data.count("blob"), 0u);
}

TEST(sequencer_config_persists_across_launches) {
  MemoryKeyValueStore kv;
  {
    ScriptedDataSource data;
    ManualIdleSignal idle;
    StartupSequencer seq(kv, data, idle);
    auto cfg = fast_config();
    cfg.critical_path_timeout_ms = 1234;
    cfg.recent_history_days = 14;
    seq.initialize(cfg);
    ASSERT_TRUE(kv.get("launch_config").has_value());
  }
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  seq.initialize();
  ASSERT_EQ(seq.config().critical_path_timeout_ms, 1234);
  ASSERT_EQ(seq.config().recent_history_days, 14);
  ASSERT_EQ(data.history_days.load(), 14);

  auto changed = seq.config();
  changed.enable_precaching = false;
  seq.update_config(changed);
  ASSERT_TRUE(!steward::launch::decode_launch_config(kv.get("launch_config").value_or("")).enable_precaching);
}

TEST(sequencer_launch_performance_averages) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  std::vector<steward::model::LaunchRecord> history = {launch_record(true, 2000), launch_record(true, 4000),
                                                        launch_record(false, 1500)};
  ASSERT_TRUE(kv.set("launch_metrics", steward::store::encode_launch_records(history)));
  ASSERT_TRUE(kv.set("last_launch_time", std::to_string(steward::util::wall_ms() - 1000)));
  StartupSequencer seq(kv, data, idle);
  auto cfg = fast_config();
  cfg.enable_background_init = false;
  seq.initialize(cfg);

  auto perf = seq.get_launch_performance();
  ASSERT_NEAR(perf.average_cold_start_ms, 3000.0, 1e-9);
  ASSERT_TRUE(perf.average_warm_start_ms > 750.0);
  ASSERT_TRUE(perf.average_warm_start_ms < 1000.0);
  ASSERT_TRUE(perf.meeting_target);
  ASSERT_TRUE(perf.last_launch.has_value());
  ASSERT_TRUE(!perf.last_launch->cold_start);
  ASSERT_NEAR(perf.cold_target_ms, 3000.0, 1e-9);
  ASSERT_EQ(seq.get_launch_metrics().size(), 4u);
}

TEST(sequencer_launch_performance_misses_target) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  std::vector<steward::model::LaunchRecord> history(StartupSequencer::kMaxLaunchRecords, launch_record(true, 4000));
  ASSERT_TRUE(kv.set("launch_metrics", steward::store::encode_launch_records(history)));
  StartupSequencer seq(kv, data, idle);
  auto cfg = fast_config();
  cfg.enable_background_init = false;
  seq.initialize(cfg);
  auto perf = seq.get_launch_performance();
  ASSERT_TRUE(perf.average_cold_start_ms > 3000.0);
  ASSERT_TRUE(!perf.meeting_target);
  ASSERT_EQ(seq.get_launch_metrics().size(), StartupSequencer::kMaxLaunchRecords);
}

TEST(sequencer_shutdown_persists_state) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  seq.initialize(fast_config());
  ASSERT_TRUE(kv.remove("last_launch_time"));
  seq.shutdown();
  ASSERT_EQ(idle.notify_idle(), 0u);
  ASSERT_TRUE(seq.state() == LaunchState::Interactive);
  ASSERT_TRUE(kv.get("last_launch_time").has_value());
  ASSERT_TRUE(kv.get("launch_config").has_value());
  auto records = steward::store::decode_launch_records(kv.get("launch_metrics").value_or(""));
  ASSERT_TRUE(records.has_value());
  ASSERT_TRUE(records->empty());
}

TEST(sequencer_config_roundtrip_keeps_defaults_for_missing_keys) {
  LaunchConfig defaults;
  defaults.cold_target_ms = 2500;
  auto c = steward::launch::decode_launch_config("[launch]\ncritical_path_timeout_ms = 900\n", defaults);
  ASSERT_EQ(c.critical_path_timeout_ms, 900);
  ASSERT_NEAR(c.cold_target_ms, 2500.0, 1e-9);
  ASSERT_TRUE(c.enable_background_init);
}

TEST(sequencer_task_added_during_wave_is_refused_not_lost) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  LogCapture logs;
  bool nested_ran = false;
  seq.add_deferred_task("spawner", 1, [&] {
    seq.add_deferred_task("nested", 1, [&] { nested_ran = true; });
  });
  seq.initialize(fast_config());
  idle.notify_idle();
  ASSERT_TRUE(seq.state() == LaunchState::FullyLoaded);
  ASSERT_TRUE(!nested_ran);
  ASSERT_EQ(logs.count(steward::util::LogLevel::Warn, "nested"), 1u);
  for (const auto& t : seq.deferred_tasks()) ASSERT_NE(t.id, "nested");
}

TEST(sequencer_without_background_init_refuses_late_tasks) {
  MemoryKeyValueStore kv;
  ScriptedDataSource data;
  ManualIdleSignal idle;
  StartupSequencer seq(kv, data, idle);
  auto cfg = fast_config();
  cfg.enable_background_init = false;
  seq.initialize(cfg);
  LogCapture logs;
  seq.add_deferred_task("after", 1, [] {});
  ASSERT_EQ(logs.count(steward::util::LogLevel::Warn, "after"), 1u);
}

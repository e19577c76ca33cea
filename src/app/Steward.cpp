#include "app/Steward.hpp"
#include "util/Faults.hpp"
#include "util/Log.hpp"

namespace steward::app {

Steward::Steward(StewardConfig cfg,
                 std::unique_ptr<store::IKeyValueStore> store,
                 std::unique_ptr<probes::IMemoryProbe> probe,
                 std::unique_ptr<launch::IDataSource> data,
                 std::unique_ptr<launch::IIdleSignal> idle)
    : cfg_(std::move(cfg)),
      store_(std::move(store)),
      probe_(std::move(probe)),
      data_(std::move(data)),
      idle_(std::move(idle)),
      governor_(cfg_.governor, *probe_, *store_),
      recorder_(cfg_.recorder, *store_),
      sequencer_(*store_, *data_, *idle_),
      metrics_([this]{ return view_to_prometheus(metrics_view()); },
               [this]{ return sequencer_.is_ready(); },
               cfg_.metrics_port) {
  recorder_.set_memory_readout([this]() -> std::optional<model::MemoryMetric> {
    auto snaps = governor_.get_snapshots(1);
    if (snaps.empty()) return std::nullopt;
    const auto& s = snaps.back();
    model::MemoryMetric m;
    m.timestamp_ms = s.timestamp_ms;
    m.used_mb = s.heap_used_mb;
    m.limit_mb = governor_.config().budget_mb;
    m.percentage = s.percentage_of_budget;
    return m;
  });
  sequencer_.add_deferred_task("governor_start", 1, [this]{ governor_.start_monitoring(); });
  sequencer_.add_deferred_task("recorder_start", 2, [this]{ recorder_.start_monitoring(); });
}

Steward::~Steward() {
  // A deferred wave must not run against members being torn down.
  idle_->cancel();
  metrics_.stop();
}

void Steward::start() {
  util::log_info("Steward", "store '%s', probe '%s', data source '%s', idle signal '%s'",
                 store_->name(), probe_->name(), data_->name(), idle_->name());
  sequencer_.initialize(cfg_.launch);
  metrics_.start();
}

void Steward::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  idle_->cancel();
  metrics_.stop();
  recorder_.stop_monitoring();
  governor_.stop_monitoring();
  sequencer_.shutdown();
}

MetricsView Steward::metrics_view() {
  MetricsView v;
  v.memory = governor_.get_memory_summary();
  v.pressure_actions = governor_.pressure_counters();
  v.leaks = governor_.get_detected_leaks();
  v.launch = sequencer_.get_launch_performance();
  v.launch_state = sequencer_.state();
  v.late_completions = sequencer_.late_completions();
  v.ui = recorder_.get_current_performance();
  v.probe_faults = util::total_faults(util::FaultKind::Probe);
  v.persistence_faults = util::total_faults(util::FaultKind::Persistence);
  v.loop_faults = util::total_faults(util::FaultKind::Loop);
  v.recent_faults_5m = util::count_recent_faults_ms(5 * 60 * 1000);
  return v;
}

} // namespace steward::app

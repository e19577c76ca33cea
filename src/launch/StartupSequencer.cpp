#include "launch/StartupSequencer.hpp"
#include "store/Codec.hpp"
#include "util/Faults.hpp"
#include "util/Log.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <chrono>
#include <charconv>
#include <exception>

namespace steward::launch {

namespace {

constexpr const char* kTag = "StartupSequencer";
constexpr const char* kRecordsKey = "launch_metrics";
constexpr const char* kPrecacheKey = "launch_pre_cache";
constexpr const char* kLastLaunchKey = "last_launch_time";
constexpr const char* kConfigKey = "launch_config";

std::string format_fatal(const std::string& id, int priority, const std::string& reason) {
  return "critical resource '" + id + "' (priority " + std::to_string(priority) + ") failed: " + reason;
}

} // namespace

FatalResourceFailure::FatalResourceFailure(std::string id, int priority, const std::string& reason)
    : std::runtime_error(format_fatal(id, priority, reason)), id_(std::move(id)), priority_(priority) {}

StartupSequencer::StartupSequencer(store::IKeyValueStore& store, IDataSource& data, IIdleSignal& idle)
    : store_(store), data_(data), idle_(idle), launch_mono_ms_(util::mono_ms()), launch_wall_ms_(util::wall_ms()) {}

StartupSequencer::~StartupSequencer() {
  // No deferred wave may start once we are gone; orphaned loaders are joined
  // by the orphans_ destructor.
  idle_.cancel();
}

double StartupSequencer::since_launch_ms() const { return util::mono_ms() - launch_mono_ms_; }

void StartupSequencer::add_resource(std::string id, model::ResourceKind kind, int priority, model::ResourceLoader loader) {
  if (state_.load() != model::LaunchState::NotStarted) {
    util::log_warn(kTag, "resource '%s' registered after initialize, ignored", id.c_str());
    return;
  }
  std::lock_guard<std::mutex> lk(mu_);
  model::ResourceDescriptor r;
  r.id = std::move(id);
  r.kind = kind;
  r.priority = priority;
  r.loader = std::move(loader);
  host_resources_.push_back(std::move(r));
}

void StartupSequencer::add_deferred_task(std::string id, int priority, model::DeferredTask task) {
  std::unique_lock<std::mutex> lk(mu_);
  // run_deferred_wave flips the state and drains host_tasks_ under mu_.
  auto st = state_.load();
  if (st == model::LaunchState::RunningDeferred || st == model::LaunchState::FullyLoaded) {
    lk.unlock();
    util::log_warn(kTag, "deferred task '%s' registered after the deferred wave started, ignored", id.c_str());
    return;
  }
  model::DeferredTaskDescriptor t;
  t.id = std::move(id);
  t.priority = priority;
  t.task = std::move(task);
  host_tasks_.push_back(std::move(t));
}

void StartupSequencer::initialize(std::optional<LaunchConfig> cfg) {
  std::lock_guard<std::mutex> init(init_mu_);
  if (failure_) throw *failure_;
  if (state_.load() != model::LaunchState::NotStarted) return;

  util::log_info(kTag, "starting launch sequence");
  load_config(cfg);
  load_launch_records();
  detect_cold_start();
  register_resources();

  state_.store(model::LaunchState::LoadingCriticalPath);
  try {
    load_critical_path();
  } catch (const FatalResourceFailure& e) {
    failure_ = e;
    state_.store(model::LaunchState::Failed);
    util::log_error(kTag, "launch failed: %s", e.what());
    throw;
  }

  mark_interactive();
  schedule_background();
  util::log_info(kTag, "initialization complete");
}

void StartupSequencer::load_config(const std::optional<LaunchConfig>& cfg) {
  if (cfg) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cfg_ = *cfg;
    }
    if (!store_.set(kConfigKey, encode_launch_config(*cfg))) {
      util::log_error(kTag, "failed to save launch config");
      util::note_fault(util::FaultKind::Persistence);
    }
    return;
  }
  if (auto text = store_.get(kConfigKey)) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = decode_launch_config(*text, cfg_);
  }
}

void StartupSequencer::load_launch_records() {
  auto blob = store_.get(kRecordsKey);
  if (!blob) return;
  auto v = store::decode_launch_records(*blob);
  if (!v) {
    util::log_warn(kTag, "discarding unreadable launch records");
    util::note_fault(util::FaultKind::Persistence);
    return;
  }
  std::lock_guard<std::mutex> lk(mu_);
  records_ = std::move(*v);
  if (records_.size() > kMaxLaunchRecords)
    records_.erase(records_.begin(), records_.end() - static_cast<std::ptrdiff_t>(kMaxLaunchRecords));
}

void StartupSequencer::detect_cold_start() {
  bool cold = true;
  int64_t window;
  {
    std::lock_guard<std::mutex> lk(mu_);
    window = cfg_.warm_start_window_ms;
  }
  if (auto last = store_.get(kLastLaunchKey)) {
    int64_t ts = 0;
    auto [ptr, ec] = std::from_chars(last->data(), last->data() + last->size(), ts);
    if (ec == std::errc{} && ptr == last->data() + last->size()) {
      cold = launch_wall_ms_ - ts > window;
    } else {
      util::log_warn(kTag, "ignoring unreadable %s", kLastLaunchKey);
    }
  }
  if (!store_.set(kLastLaunchKey, std::to_string(launch_wall_ms_))) {
    util::log_error(kTag, "failed to record launch time");
    util::note_fault(util::FaultKind::Persistence);
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    cold_start_ = cold;
  }
  util::log_info(kTag, "%s start detected", cold ? "cold" : "warm");
}

void StartupSequencer::register_resources() {
  std::lock_guard<std::mutex> lk(mu_);
  const LaunchConfig c = cfg_;
  auto add = [this](const char* id, model::ResourceKind kind, int priority, model::ResourceLoader loader) {
    model::ResourceDescriptor r;
    r.id = id;
    r.kind = kind;
    r.priority = priority;
    r.loader = std::move(loader);
    resources_.push_back(std::move(r));
  };

  add("database_init", model::ResourceKind::Service, 1, [this](std::stop_token st){ data_.initialize(st); });
  if (c.enable_precaching)
    add("pre_cache_load", model::ResourceKind::Data, 2, [this](std::stop_token){ load_precache(); });
  if (c.today_schedule)
    add("today_schedules", model::ResourceKind::Data, 3, [this](std::stop_token st){ data_.preload_today_schedule(st); });
  if (c.pending_items)
    add("pending_items", model::ResourceKind::Data, 4, [this](std::stop_token st){ data_.preload_pending_items(st); });
  if (c.recent_history) {
    int days = c.recent_history_days;
    add("recent_history", model::ResourceKind::Data, 5,
        [this, days](std::stop_token st){ data_.preload_recent_history(st, days); });
  }
  for (auto& r : host_resources_) resources_.push_back(std::move(r));
  host_resources_.clear();

  std::stable_sort(resources_.begin(), resources_.end(),
                   [](const auto& a, const auto& b) { return a.priority < b.priority; });
  util::log_info(kTag, "registered %zu critical resources (data source '%s')", resources_.size(), data_.name());
}

void StartupSequencer::load_critical_path() {
  using clock = std::chrono::steady_clock;

  std::vector<model::ResourceDescriptor> sorted;
  int timeout_ms;
  double target_ms;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sorted = resources_;
    timeout_ms = std::max(0, cfg_.critical_path_timeout_ms);
    target_ms = cfg_.critical_path_target_ms;
  }

  const double wave_start = util::mono_ms();
  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
  std::vector<std::shared_ptr<Outcome>> outcomes;
  std::vector<std::jthread> workers;
  outcomes.reserve(sorted.size());
  workers.reserve(sorted.size());

  for (const auto& r : sorted) {
    auto out = std::make_shared<Outcome>();
    outcomes.push_back(out);
    {
      std::lock_guard<std::mutex> lk(mu_);
      attempt_order_.push_back(r.id);
    }
    workers.emplace_back([this, out, loader = r.loader, id = r.id, wave_start](std::stop_token st) {
      std::optional<std::string> err;
      try {
        loader(st);
      } catch (const std::exception& e) {
        err = e.what();
      }
      const double took = util::mono_ms() - wave_start;
      bool late = false;
      {
        std::lock_guard<std::mutex> lk(wave_mu_);
        if (out->abandoned) {
          ++late_completions_;
          late = true;
        } else {
          out->done = true;
          out->error = std::move(err);
          out->load_time_ms = took;
        }
      }
      if (late) {
        util::log_info(kTag, "discarding late result of '%s' after %.0fms", id.c_str(), took);
        return;
      }
      wave_cv_.notify_all();
    });
  }

  std::vector<size_t> timed_out;
  {
    std::unique_lock<std::mutex> lk(wave_mu_);
    wave_cv_.wait_until(lk, deadline, [&] {
      return std::all_of(outcomes.begin(), outcomes.end(), [](const auto& o) { return o->done; });
    });
    for (size_t i = 0; i < outcomes.size(); ++i) {
      if (outcomes[i]->done) continue;
      outcomes[i]->abandoned = true;
      outcomes[i]->error = "timed out after " + std::to_string(timeout_ms) + "ms";
      timed_out.push_back(i);
    }
  }
  for (size_t i : timed_out) {
    workers[i].request_stop();
    orphans_.push_back(std::move(workers[i]));
  }
  // Settled workers are finishing; joined here.
  workers.clear();

  std::optional<FatalResourceFailure> fatal;
  {
    std::lock_guard<std::mutex> lk(mu_);
    critical_complete_ms_ = since_launch_ms();
    for (size_t i = 0; i < resources_.size(); ++i) {
      auto& r = resources_[i];
      const auto& o = *outcomes[i];
      if (!o.error) {
        r.loaded = true;
        r.load_time_ms = o.load_time_ms;
        util::log_info(kTag, "loaded %s '%s' in %.0fms", model::to_string(r.kind), r.id.c_str(), o.load_time_ms);
        continue;
      }
      r.error = o.error;
      if (r.priority <= kFatalPriority) {
        util::log_error(kTag, "failed to load %s '%s': %s", model::to_string(r.kind), r.id.c_str(), o.error->c_str());
        if (!fatal) fatal.emplace(r.id, r.priority, *o.error);
      } else {
        util::log_warn(kTag, "failed to load %s '%s': %s (continuing)", model::to_string(r.kind), r.id.c_str(),
                       o.error->c_str());
      }
    }
  }

  const double took = util::mono_ms() - wave_start;
  util::log_info(kTag, "critical path settled in %.0fms", took);
  if (took > target_ms)
    util::log_warn(kTag, "critical path exceeded target (%.0fms): %.0fms", target_ms, took);
  if (fatal) throw *fatal;
}

void StartupSequencer::mark_interactive() {
  double at, target;
  bool cold;
  {
    std::lock_guard<std::mutex> lk(mu_);
    interactive_ms_ = since_launch_ms();
    at = *interactive_ms_;
    cold = cold_start_;
    target = cold ? cfg_.cold_target_ms : cfg_.warm_target_ms;
  }
  state_.store(model::LaunchState::Interactive);
  if (at > target)
    util::log_warn(kTag, "time to interactive %.0fms exceeded %s target (%.0fms)", at, cold ? "cold" : "warm", target);
  else
    util::log_info(kTag, "interactive in %.0fms (%s target %.0fms met)", at, cold ? "cold" : "warm", target);
}

void StartupSequencer::schedule_background() {
  bool enabled;
  {
    std::lock_guard<std::mutex> lk(mu_);
    enabled = cfg_.enable_background_init;
  }
  if (!enabled) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      fully_loaded_ms_ = interactive_ms_;
      state_.store(model::LaunchState::FullyLoaded);
    }
    record_launch();
    return;
  }
  util::log_info(kTag, "scheduling deferred tasks on '%s' idle signal", idle_.name());
  idle_.run_after_interactions([this]{ run_deferred_wave(); });
}

void StartupSequencer::run_deferred_wave() {
  std::vector<model::DeferredTaskDescriptor> queue;
  {
    std::lock_guard<std::mutex> lk(mu_);
    state_.store(model::LaunchState::RunningDeferred);
    for (auto& t : host_tasks_) tasks_.push_back(std::move(t));
    host_tasks_.clear();
    model::DeferredTaskDescriptor cleanup;
    cleanup.id = "cache_cleanup";
    cleanup.priority = 5;
    cleanup.task = [this]{ cleanup_precache(); };
    tasks_.push_back(std::move(cleanup));
    std::stable_sort(tasks_.begin(), tasks_.end(), [](const auto& a, const auto& b) { return a.priority < b.priority; });
    queue = tasks_;
  }

  util::log_info(kTag, "running %zu deferred tasks", queue.size());
  for (size_t i = 0; i < queue.size(); ++i) {
    std::optional<std::string> err;
    try {
      if (!queue[i].task) throw std::runtime_error("no task body");
      queue[i].task();
    } catch (const std::exception& e) {
      err = e.what();
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (err) tasks_[i].error = err;
      else tasks_[i].executed = true;
    }
    if (err) util::log_error(kTag, "deferred task '%s' failed: %s", queue[i].id.c_str(), err->c_str());
    else util::log_debug(kTag, "deferred task '%s' completed", queue[i].id.c_str());
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    fully_loaded_ms_ = since_launch_ms();
  }
  state_.store(model::LaunchState::FullyLoaded);
  util::log_info(kTag, "all deferred tasks completed");
  record_launch();
}

void StartupSequencer::record_launch() {
  model::LaunchRecord rec;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const double cpc = critical_complete_ms_.value_or(0.0);
    const double inter = interactive_ms_.value_or(cpc);
    const double full = fully_loaded_ms_.value_or(inter);
    rec.cold_start = cold_start_;
    rec.start_time_ms = launch_wall_ms_;
    rec.critical_path_complete_ms = cpc;
    rec.interactive_ms = inter;
    rec.fully_loaded_ms = full;
    rec.phases.initialization_ms = cpc;
    rec.phases.ui_render_ms = inter - cpc;
    rec.phases.background_tasks_ms = full - inter;
    for (const auto& r : resources_) {
      if (r.load_time_ms) {
        rec.phases.critical_resources_ms += *r.load_time_ms;
        if (r.id == "database_init") rec.phases.database_setup_ms = *r.load_time_ms;
        if (r.kind == model::ResourceKind::Data) rec.phases.essential_data_ms += *r.load_time_ms;
      }
      if (r.loaded) ++rec.loaded_count;
      if (r.error) ++rec.failed_count;
    }
    for (const auto& t : tasks_) {
      if (t.executed) ++rec.deferred_count;
      if (t.error) ++rec.failed_count;
    }
    records_.push_back(rec);
    if (records_.size() > kMaxLaunchRecords)
      records_.erase(records_.begin(), records_.end() - static_cast<std::ptrdiff_t>(kMaxLaunchRecords));
  }
  persist_records();
  util::log_info(kTag, "launch recorded: interactive %.0fms, %s start, %d loaded, %d deferred, %d failed",
                 rec.interactive_ms, rec.cold_start ? "cold" : "warm", rec.loaded_count, rec.deferred_count,
                 rec.failed_count);
}

void StartupSequencer::persist_records() {
  std::string blob;
  {
    std::lock_guard<std::mutex> lk(mu_);
    blob = store::encode_launch_records(records_);
  }
  if (!store_.set(kRecordsKey, blob)) {
    util::log_error(kTag, "failed to save launch records");
    util::note_fault(util::FaultKind::Persistence);
  }
}

void StartupSequencer::shutdown() {
  idle_.cancel();
  persist_records();
  LaunchConfig c = config();
  bool ok = store_.set(kConfigKey, encode_launch_config(c));
  ok = store_.set(kLastLaunchKey, std::to_string(util::wall_ms())) && ok;
  if (!ok) {
    util::log_error(kTag, "failed to persist launch state on shutdown");
    util::note_fault(util::FaultKind::Persistence);
  }
  util::log_info(kTag, "shutdown (%s)", model::to_string(state_.load()));
}

model::LaunchPerformance StartupSequencer::get_launch_performance() const {
  std::lock_guard<std::mutex> lk(mu_);
  model::LaunchPerformance p;
  double cold_sum = 0.0, warm_sum = 0.0;
  size_t cold_n = 0, warm_n = 0;
  for (const auto& r : records_) {
    if (r.cold_start) { cold_sum += r.interactive_ms; ++cold_n; }
    else { warm_sum += r.interactive_ms; ++warm_n; }
  }
  p.average_cold_start_ms = cold_n ? cold_sum / static_cast<double>(cold_n) : 0.0;
  p.average_warm_start_ms = warm_n ? warm_sum / static_cast<double>(warm_n) : 0.0;
  if (!records_.empty()) p.last_launch = records_.back();
  p.cold_target_ms = cfg_.cold_target_ms;
  p.warm_target_ms = cfg_.warm_target_ms;
  p.meeting_target = p.average_cold_start_ms <= p.cold_target_ms && p.average_warm_start_ms <= p.warm_target_ms;
  return p;
}

std::vector<model::LaunchRecord> StartupSequencer::get_launch_metrics() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_;
}

bool StartupSequencer::is_ready() const {
  auto s = state_.load();
  return s == model::LaunchState::Interactive || s == model::LaunchState::RunningDeferred ||
         s == model::LaunchState::FullyLoaded;
}

bool StartupSequencer::cold_start() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cold_start_;
}

LaunchConfig StartupSequencer::config() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cfg_;
}

void StartupSequencer::update_config(const LaunchConfig& cfg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
  }
  if (!store_.set(kConfigKey, encode_launch_config(cfg))) {
    util::log_error(kTag, "failed to save launch config");
    util::note_fault(util::FaultKind::Persistence);
  }
}

std::vector<model::ResourceDescriptor> StartupSequencer::resources() const {
  std::lock_guard<std::mutex> lk(mu_);
  return resources_;
}

std::vector<model::DeferredTaskDescriptor> StartupSequencer::deferred_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tasks_;
}

std::vector<std::string> StartupSequencer::attempt_order() const {
  std::lock_guard<std::mutex> lk(mu_);
  return attempt_order_;
}

uint64_t StartupSequencer::late_completions() const {
  std::lock_guard<std::mutex> lk(wave_mu_);
  return late_completions_;
}

std::optional<double> StartupSequencer::interactive_at_ms() const {
  std::lock_guard<std::mutex> lk(mu_);
  return interactive_ms_;
}

std::optional<double> StartupSequencer::critical_path_complete_at_ms() const {
  std::lock_guard<std::mutex> lk(mu_);
  return critical_complete_ms_;
}

void StartupSequencer::load_precache() {
  auto blob = store_.get(kPrecacheKey);
  if (!blob) return;
  auto pc = store::decode_precache(*blob);
  if (!pc) {
    util::log_warn(kTag, "discarding unreadable pre-cache");
    util::note_fault(util::FaultKind::Persistence);
    return;
  }
  int64_t max_age = config().precache_max_age_ms;
  if (util::wall_ms() - pc->timestamp_ms >= max_age) {
    util::log_info(kTag, "pre-cache expired, will refresh");
    return;
  }
  std::lock_guard<std::mutex> lk(precache_mu_);
  for (auto& [k, v] : pc->data) precache_[k] = std::move(v);
  util::log_info(kTag, "loaded %zu pre-cached items", precache_.size());
}

bool StartupSequencer::save_to_precache(const std::string& key, const std::string& value) {
  uint64_t max_bytes = config().precache_max_bytes;
  std::string blob;
  {
    std::lock_guard<std::mutex> lk(precache_mu_);
    precache_[key] = value;
    store::PrecacheBlob pc{util::wall_ms(), precache_};
    blob = store::encode_precache(pc);
  }
  if (blob.size() > max_bytes) {
    util::log_warn(kTag, "pre-cache size limit exceeded (%zu > %llu bytes), will not persist", blob.size(),
                   static_cast<unsigned long long>(max_bytes));
    return false;
  }
  if (!store_.set(kPrecacheKey, blob)) {
    util::log_error(kTag, "failed to save pre-cache");
    util::note_fault(util::FaultKind::Persistence);
    return false;
  }
  return true;
}

std::optional<std::string> StartupSequencer::get_from_precache(const std::string& key) const {
  std::lock_guard<std::mutex> lk(precache_mu_);
  auto it = precache_.find(key);
  if (it == precache_.end()) return std::nullopt;
  return it->second;
}

void StartupSequencer::cleanup_precache() {
  auto blob = store_.get(kPrecacheKey);
  if (!blob) return;
  auto pc = store::decode_precache(*blob);
  int64_t max_age = config().precache_max_age_ms;
  if (pc && util::wall_ms() - pc->timestamp_ms <= max_age) return;
  if (!store_.remove(kPrecacheKey)) throw std::runtime_error("cannot remove pre-cache");
  {
    std::lock_guard<std::mutex> lk(precache_mu_);
    precache_.clear();
  }
  util::log_info(kTag, "pre-cache cleaned up");
}

} // namespace steward::launch

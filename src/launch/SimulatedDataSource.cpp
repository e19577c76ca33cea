#include "launch/SimulatedDataSource.hpp"
#include "util/Log.hpp"

#include <stdexcept>
#include <string>

namespace steward::launch {

void SimulatedDataSource::step(std::stop_token st, std::chrono::milliseconds delay, int priority, const char* what) {
  ++calls_;
  if (!interruptible_sleep(st, delay))
    throw std::runtime_error(std::string(what) + " cancelled");
  if (priority == fail_priority_)
    throw std::runtime_error(std::string(what) + " unavailable");
  util::log_debug("SimulatedDataSource", "%s ready after %lldms", what, static_cast<long long>(delay.count()));
}

void SimulatedDataSource::initialize(std::stop_token st) {
  step(st, delays_.init, 1, "database");
}

void SimulatedDataSource::preload_today_schedule(std::stop_token st) {
  step(st, delays_.schedule, 3, "today's schedule");
}

void SimulatedDataSource::preload_pending_items(std::stop_token st) {
  step(st, delays_.pending, 4, "pending items");
}

void SimulatedDataSource::preload_recent_history(std::stop_token st, int days) {
  // One extra slice of delay per week of history.
  auto delay = delays_.history * (1 + days / 7);
  step(st, delay, 5, "recent history");
}

} // namespace steward::launch

#pragma once
#include <memory>

#include "app/Config.hpp"
#include "app/MetricsServer.hpp"
#include "governor/ResourceGovernor.hpp"
#include "launch/DataSource.hpp"
#include "launch/IdleSignal.hpp"
#include "launch/StartupSequencer.hpp"
#include "perf/PerformanceRecorder.hpp"
#include "probes/MemoryProbe.hpp"
#include "store/KeyValueStore.hpp"

namespace steward::app {

// Owns and wires the three services around one store, probe, data source
// and idle signal. The governor and recorder start from the deferred wave.
class Steward {
public:
  Steward(StewardConfig cfg,
          std::unique_ptr<store::IKeyValueStore> store,
          std::unique_ptr<probes::IMemoryProbe> probe,
          std::unique_ptr<launch::IDataSource> data,
          std::unique_ptr<launch::IIdleSignal> idle);
  ~Steward();

  Steward(const Steward&) = delete;
  Steward& operator=(const Steward&) = delete;

  // Runs the critical wave and starts the metrics server.
  // Throws launch::FatalResourceFailure.
  void start();
  // Stops monitoring, persists everything and stops the metrics server.
  void shutdown();

  [[nodiscard]] MetricsView metrics_view();

  launch::StartupSequencer& sequencer() { return sequencer_; }
  governor::ResourceGovernor& governor() { return governor_; }
  perf::PerformanceRecorder& recorder() { return recorder_; }
  launch::IIdleSignal& idle() { return *idle_; }
  store::IKeyValueStore& store() { return *store_; }
  [[nodiscard]] const StewardConfig& config() const { return cfg_; }

private:
  StewardConfig cfg_;
  std::unique_ptr<store::IKeyValueStore> store_;
  std::unique_ptr<probes::IMemoryProbe> probe_;
  std::unique_ptr<launch::IDataSource> data_;
  std::unique_ptr<launch::IIdleSignal> idle_;
  governor::ResourceGovernor governor_;
  perf::PerformanceRecorder recorder_;
  launch::StartupSequencer sequencer_;
  MetricsServer metrics_;
  bool shut_down_{false};
};

} // namespace steward::app

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "model/Launch.hpp"
#include "model/Memory.hpp"
#include "model/Ui.hpp"

namespace steward::app {

// Point-in-time copy of everything the exporter reports.
struct MetricsView {
  model::MemorySummary memory;
  model::PressureCounters pressure_actions;
  std::vector<model::LeakFinding> leaks;
  model::LaunchPerformance launch;
  model::LaunchState launch_state{model::LaunchState::NotStarted};
  uint64_t late_completions{};
  model::CurrentPerformance ui;
  uint64_t probe_faults{}, persistence_faults{}, loop_faults{};
  int recent_faults_5m{};
};

// Serialize a MetricsView into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string view_to_prometheus(const MetricsView& view);

struct HttpReply {
  int code{200};
  std::string reason{"OK"};
  std::string content_type{"text/plain; charset=utf-8"};
  std::string body;
};

using RenderFn = std::function<std::string()>;
using ReadyFn = std::function<bool()>;

// Answers one request line. GET /metrics renders the exposition text,
// GET /ready is 200 once the application is interactive and 503 before.
[[nodiscard]] HttpReply route_request(std::string_view request_line, const RenderFn& render, const ReadyFn& ready);

// Loopback HTTP endpoint for route_request(). Without liburing start() and
// stop() do nothing.
class MetricsServer {
public:
  MetricsServer(RenderFn render, ReadyFn ready, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

private:
  bool open_sockets();
  void close_sockets();
  void run(std::stop_token st);
  void handle_client(int client_fd);

  RenderFn render_;
  ReadyFn ready_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace steward::app

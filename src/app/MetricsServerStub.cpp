#ifndef STEWARD_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Log.hpp"

namespace steward::app {

MetricsServer::MetricsServer(RenderFn render, ReadyFn ready, uint16_t port)
    : render_(std::move(render)), ready_(std::move(ready)), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  if (port_ != 0)
    util::log_warn("MetricsServer", "built without liburing, HTTP endpoint on :%u disabled", port_);
}

void MetricsServer::stop() {}

} // namespace steward::app

#endif // !STEWARD_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Faults.hpp"
#include "util/Log.hpp"

#include <exception>
#include <utility>

namespace steward::app {

namespace {

HttpReply reply(int code, const char* reason, std::string body) {
  HttpReply r;
  r.code = code;
  r.reason = reason;
  r.body = std::move(body);
  return r;
}

} // namespace

HttpReply route_request(std::string_view line, const RenderFn& render, const ReadyFn& ready) {
  auto sp = line.find(' ');
  if (sp == std::string_view::npos) return reply(400, "Bad Request", "400 Bad Request\n");
  std::string_view method = line.substr(0, sp);
  std::string_view target = line.substr(sp + 1);
  target = target.substr(0, target.find(' '));
  target = target.substr(0, target.find('?'));

  if (method != "GET") return reply(405, "Method Not Allowed", "405 Method Not Allowed\n");

  if (target == "/metrics") {
    if (!render) return reply(503, "Service Unavailable", "503 Service Unavailable\n");
    try {
      HttpReply r = reply(200, "OK", render());
      r.content_type = "text/plain; version=0.0.4; charset=utf-8";
      return r;
    } catch (const std::exception& e) {
      util::log_error("MetricsServer", "render failed: %s", e.what());
      util::note_fault(util::FaultKind::Loop);
      return reply(500, "Internal Server Error", "500 Internal Server Error\n");
    }
  }
  if (target == "/ready") {
    if (ready && ready()) return reply(200, "OK", "ready\n");
    return reply(503, "Service Unavailable", "starting\n");
  }
  if (target == "/") return reply(200, "OK", "steward: use /metrics or /ready\n");
  return reply(404, "Not Found", "404 Not Found\n");
}

} // namespace steward::app

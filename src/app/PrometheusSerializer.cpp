#include "app/MetricsServer.hpp"
#include <charconv>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// name{key="val"} value
void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

// name{k1="v1",k2="v2"} value
void emit_labeled_2d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

} // anonymous namespace

namespace steward::app {

std::string view_to_prometheus(const MetricsView& v) {
  std::string out;
  out.reserve(4096);

  // ---- Memory ----
  const auto& cur = v.memory.current;
  emit_header(out, "steward_memory_heap_used_megabytes", "Heap in use", "gauge");
  emit_gauge_d(out, "steward_memory_heap_used_megabytes", cur.heap_used_mb);
  emit_header(out, "steward_memory_heap_total_megabytes", "Heap reserved", "gauge");
  emit_gauge_d(out, "steward_memory_heap_total_megabytes", cur.heap_total_mb);
  emit_header(out, "steward_memory_budget_used_percent", "Heap in use as percent of the memory budget", "gauge");
  emit_gauge_d(out, "steward_memory_budget_used_percent", cur.percentage_of_budget);
  if (!cur.per_component_mb.empty()) {
    emit_header(out, "steward_memory_component_megabytes", "Self-reported component memory", "gauge");
    for (const auto& [name, mb] : cur.per_component_mb)
      emit_labeled_d(out, "steward_memory_component_megabytes", "component", name, mb);
  }

  // ---- Pressure ----
  const auto& p = v.memory.pressure;
  emit_header(out, "steward_memory_pressure_level", "Current pressure level (1 for the active level)", "gauge");
  for (auto lvl : {model::PressureLevel::Normal, model::PressureLevel::Moderate,
                   model::PressureLevel::High, model::PressureLevel::Critical})
    emit_labeled_u(out, "steward_memory_pressure_level", "level", model::to_string(lvl), p.level == lvl ? 1 : 0);
  emit_header(out, "steward_memory_trend", "Memory trend over recent samples (1 for the active trend)", "gauge");
  for (auto t : {model::MemoryTrend::Stable, model::MemoryTrend::Increasing, model::MemoryTrend::Decreasing})
    emit_labeled_u(out, "steward_memory_trend", "trend", model::to_string(t), p.trend == t ? 1 : 0);
  emit_header(out, "steward_pressure_checks_total", "Pressure evaluations", "counter");
  emit_gauge_u(out, "steward_pressure_checks_total", v.pressure_actions.checks);
  emit_header(out, "steward_pressure_cache_shrinks_total", "Partial cache evictions under high pressure", "counter");
  emit_gauge_u(out, "steward_pressure_cache_shrinks_total", v.pressure_actions.cache_shrinks);
  emit_header(out, "steward_pressure_cache_clears_total", "Full cache clears under critical pressure", "counter");
  emit_gauge_u(out, "steward_pressure_cache_clears_total", v.pressure_actions.cache_clears);
  emit_header(out, "steward_pressure_collection_requests_total", "Memory collection requests", "counter");
  emit_gauge_u(out, "steward_pressure_collection_requests_total", v.pressure_actions.collection_requests);

  // ---- Leaks ----
  emit_header(out, "steward_leak_findings", "Retained leak findings", "gauge");
  emit_gauge_u(out, "steward_leak_findings", v.leaks.size());
  if (!v.leaks.empty()) {
    emit_header(out, "steward_leak_growth_megabytes", "Growth of the most recent finding per component", "gauge");
    std::vector<std::string_view> seen;
    for (auto it = v.leaks.rbegin(); it != v.leaks.rend(); ++it) {
      bool dup = false;
      for (auto s : seen) dup = dup || s == it->component;
      if (dup) continue;
      seen.push_back(it->component);
      emit_labeled_2d(out, "steward_leak_growth_megabytes", "component", it->component,
                      "severity", model::to_string(it->severity), it->growth_mb);
    }
  }

  // ---- Cache ----
  const auto& c = v.memory.cache;
  emit_header(out, "steward_cache_size_bytes", "Accounted cache size", "gauge");
  emit_gauge_u(out, "steward_cache_size_bytes", c.total_size_bytes);
  emit_header(out, "steward_cache_budget_bytes", "Cache byte budget", "gauge");
  emit_gauge_u(out, "steward_cache_budget_bytes", c.budget_bytes);
  emit_header(out, "steward_cache_entries", "Cache entries", "gauge");
  emit_gauge_u(out, "steward_cache_entries", c.entry_count);
  emit_header(out, "steward_cache_hit_rate_percent", "Cache hit rate", "gauge");
  emit_gauge_d(out, "steward_cache_hit_rate_percent", c.hit_rate_pct);
  emit_header(out, "steward_cache_hits_total", "Cache hits", "counter");
  emit_gauge_u(out, "steward_cache_hits_total", c.hits);
  emit_header(out, "steward_cache_misses_total", "Cache misses", "counter");
  emit_gauge_u(out, "steward_cache_misses_total", c.misses);
  emit_header(out, "steward_cache_evictions_total", "Cache evictions", "counter");
  emit_gauge_u(out, "steward_cache_evictions_total", c.evictions);

  // ---- Launch ----
  emit_header(out, "steward_launch_state", "Startup state (1 for the active state)", "gauge");
  for (auto s : {model::LaunchState::NotStarted, model::LaunchState::LoadingCriticalPath,
                 model::LaunchState::Interactive, model::LaunchState::RunningDeferred,
                 model::LaunchState::FullyLoaded, model::LaunchState::Failed})
    emit_labeled_u(out, "steward_launch_state", "state", model::to_string(s), v.launch_state == s ? 1 : 0);
  emit_header(out, "steward_launch_average_interactive_ms", "Average time to interactive", "gauge");
  emit_labeled_d(out, "steward_launch_average_interactive_ms", "start", "cold", v.launch.average_cold_start_ms);
  emit_labeled_d(out, "steward_launch_average_interactive_ms", "start", "warm", v.launch.average_warm_start_ms);
  emit_header(out, "steward_launch_meeting_target", "1 when both launch averages meet their targets", "gauge");
  emit_gauge_u(out, "steward_launch_meeting_target", v.launch.meeting_target ? 1 : 0);
  if (v.launch.last_launch) {
    const auto& l = *v.launch.last_launch;
    emit_header(out, "steward_launch_last_ms", "Milestones of the most recent launch", "gauge");
    emit_labeled_d(out, "steward_launch_last_ms", "milestone", "critical_path_complete", l.critical_path_complete_ms);
    emit_labeled_d(out, "steward_launch_last_ms", "milestone", "interactive", l.interactive_ms);
    emit_labeled_d(out, "steward_launch_last_ms", "milestone", "fully_loaded", l.fully_loaded_ms);
    emit_header(out, "steward_launch_last_failed", "Failed resources and tasks in the most recent launch", "gauge");
    emit_gauge_u(out, "steward_launch_last_failed", static_cast<uint64_t>(l.failed_count));
  }
  emit_header(out, "steward_launch_late_completions_total", "Loaders that settled after their timeout", "counter");
  emit_gauge_u(out, "steward_launch_late_completions_total", v.late_completions);

  // ---- UI ----
  emit_header(out, "steward_ui_fps", "Average FPS over recent samples", "gauge");
  emit_gauge_u(out, "steward_ui_fps", static_cast<uint64_t>(v.ui.fps < 0 ? 0 : v.ui.fps));
  emit_header(out, "steward_ui_response_time_ms", "Average interaction response time", "gauge");
  emit_gauge_d(out, "steward_ui_response_time_ms", v.ui.response_time_ms);
  emit_header(out, "steward_ui_performant", "1 when FPS and response targets are met", "gauge");
  emit_gauge_u(out, "steward_ui_performant", v.ui.is_performant ? 1 : 0);

  // ---- Faults ----
  emit_header(out, "steward_faults_total", "Monitoring faults since start", "counter");
  emit_labeled_u(out, "steward_faults_total", "kind", "probe", v.probe_faults);
  emit_labeled_u(out, "steward_faults_total", "kind", "persistence", v.persistence_faults);
  emit_labeled_u(out, "steward_faults_total", "kind", "loop", v.loop_faults);
  emit_header(out, "steward_faults_recent", "Monitoring faults in the last 5 minutes", "gauge");
  emit_gauge_u(out, "steward_faults_recent", static_cast<uint64_t>(v.recent_faults_5m));

  return out;
}

} // namespace steward::app

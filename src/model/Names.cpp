#include "model/Launch.hpp"
#include "model/Memory.hpp"
#include "model/Ui.hpp"

namespace steward::model {

const char* to_string(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Service: return "service";
    case ResourceKind::Data:    return "data";
    case ResourceKind::Asset:   return "asset";
  }
  return "service";
}

const char* to_string(LaunchState state) {
  switch (state) {
    case LaunchState::NotStarted:          return "not_started";
    case LaunchState::LoadingCriticalPath: return "loading_critical_path";
    case LaunchState::Interactive:         return "interactive";
    case LaunchState::RunningDeferred:     return "running_deferred";
    case LaunchState::FullyLoaded:         return "fully_loaded";
    case LaunchState::Failed:              return "failed";
  }
  return "not_started";
}

const char* to_string(LeakSeverity s) {
  switch (s) {
    case LeakSeverity::Low:      return "low";
    case LeakSeverity::Medium:   return "medium";
    case LeakSeverity::High:     return "high";
    case LeakSeverity::Critical: return "critical";
  }
  return "low";
}

const char* to_string(PressureLevel l) {
  switch (l) {
    case PressureLevel::Normal:   return "normal";
    case PressureLevel::Moderate: return "moderate";
    case PressureLevel::High:     return "high";
    case PressureLevel::Critical: return "critical";
  }
  return "normal";
}

const char* to_string(MemoryTrend t) {
  switch (t) {
    case MemoryTrend::Stable:     return "stable";
    case MemoryTrend::Increasing: return "increasing";
    case MemoryTrend::Decreasing: return "decreasing";
  }
  return "stable";
}

const char* to_string(TraceKind k) {
  switch (k) {
    case TraceKind::Mark:        return "mark";
    case TraceKind::Measure:     return "measure";
    case TraceKind::Navigation:  return "navigation";
    case TraceKind::Render:      return "render";
    case TraceKind::Interaction: return "interaction";
  }
  return "mark";
}

} // namespace steward::model

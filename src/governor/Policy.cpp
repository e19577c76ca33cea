#include "governor/Policy.hpp"

#include <cstdio>

namespace steward::governor {

using model::LeakSeverity;
using model::MemoryTrend;
using model::PressureLevel;

PressureLevel classify_pressure(double percentage) {
  if (percentage >= 90.0) return PressureLevel::Critical;
  if (percentage >= 75.0) return PressureLevel::High;
  if (percentage >= 60.0) return PressureLevel::Moderate;
  return PressureLevel::Normal;
}

LeakSeverity severity_for_growth(double growth_mb) {
  if (growth_mb >= 30.0) return LeakSeverity::Critical;
  if (growth_mb >= 20.0) return LeakSeverity::High;
  if (growth_mb >= 10.0) return LeakSeverity::Medium;
  return LeakSeverity::Low;
}

std::vector<std::string> leak_recommendations(double growth_mb, const std::string& component) {
  std::vector<std::string> out;
  char buf[256];
  std::snprintf(buf, sizeof(buf), "Memory grew by %.1fMB in component '%s'", growth_mb, component.c_str());
  out.emplace_back(buf);
  out.emplace_back("Check for unremoved callbacks and observers");
  out.emplace_back("Verify all timers and worker threads are stopped");
  out.emplace_back("Review component teardown paths");
  out.emplace_back("Check for reference cycles between shared owners");
  if (growth_mb > 20.0) {
    out.emplace_back("Consider implementing object pooling");
    out.emplace_back("Review image caching and cleanup strategies");
  }
  return out;
}

std::vector<std::string> pressure_actions(PressureLevel level) {
  switch (level) {
    case PressureLevel::Critical:
      return {"Clear all non-essential caches", "Force garbage collection",
              "Review active components for memory leaks"};
    case PressureLevel::High:
      return {"Reduce cache size", "Trigger garbage collection"};
    case PressureLevel::Moderate:
      return {"Monitor memory usage closely", "Consider cache cleanup"};
    case PressureLevel::Normal:
      break;
  }
  return {};
}

MemoryTrend memory_trend(const std::vector<double>& used_mb) {
  if (used_mb.size() < 5) return MemoryTrend::Stable;
  const size_t n = used_mb.size();
  double older = (used_mb[n - 5] + used_mb[n - 4]) / 2.0;
  double recent = (used_mb[n - 3] + used_mb[n - 2] + used_mb[n - 1]) / 3.0;
  if (recent > older + 5.0) return MemoryTrend::Increasing;
  if (recent < older - 5.0) return MemoryTrend::Decreasing;
  return MemoryTrend::Stable;
}

model::MemoryPressure assess_pressure(double used_mb, double budget_mb, MemoryTrend trend) {
  model::MemoryPressure p;
  p.percentage = budget_mb > 0.0 ? used_mb / budget_mb * 100.0 : 0.0;
  p.level = classify_pressure(p.percentage);
  p.trend = trend;
  p.action_required = p.level == PressureLevel::High || p.level == PressureLevel::Critical;
  p.recommended_actions = pressure_actions(p.level);
  return p;
}

} // namespace steward::governor

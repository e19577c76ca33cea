#pragma once
// Pure classification rules used by the resource governor.
#include <string>
#include <vector>
#include "model/Memory.hpp"

namespace steward::governor {

// <60 normal, [60,75) moderate, [75,90) high, >=90 critical.
[[nodiscard]] model::PressureLevel classify_pressure(double percentage);

// Half-open bands, lower bound inclusive: [0,10) low, [10,20) medium,
// [20,30) high, [30,inf) critical.
[[nodiscard]] model::LeakSeverity severity_for_growth(double growth_mb);

[[nodiscard]] std::vector<std::string> leak_recommendations(double growth_mb, const std::string& component);

[[nodiscard]] std::vector<std::string> pressure_actions(model::PressureLevel level);

// Trend over the last five heap readings (oldest first): mean of the newest
// three against the mean of the oldest two, with a 5MB dead band.
// Fewer than five readings is stable.
[[nodiscard]] model::MemoryTrend memory_trend(const std::vector<double>& used_mb);

[[nodiscard]] model::MemoryPressure assess_pressure(double used_mb, double budget_mb, model::MemoryTrend trend);

} // namespace steward::governor

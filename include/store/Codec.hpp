#pragma once
// Text codec for the persisted rolling logs.
//
// Every blob starts with a header line "<tag> v1 <count>" followed by one
// line per record. Fields are tab separated; strings escape backslash, tab,
// CR, LF, ';' and '='. Doubles use the shortest round-trip form, so
// encode(decode(blob)) reproduces blob byte for byte. Malformed input
// decodes to std::nullopt.
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/Launch.hpp"
#include "model/Memory.hpp"
#include "model/Ui.hpp"

namespace steward::store {

struct PrecacheBlob {
  int64_t timestamp_ms{};
  std::map<std::string, std::string> data;
};

[[nodiscard]] std::string encode_launch_records(const std::vector<model::LaunchRecord>& v);
[[nodiscard]] std::optional<std::vector<model::LaunchRecord>> decode_launch_records(std::string_view blob);

[[nodiscard]] std::string encode_memory_samples(const std::vector<model::MemorySample>& v);
[[nodiscard]] std::optional<std::vector<model::MemorySample>> decode_memory_samples(std::string_view blob);

[[nodiscard]] std::string encode_leak_findings(const std::vector<model::LeakFinding>& v);
[[nodiscard]] std::optional<std::vector<model::LeakFinding>> decode_leak_findings(std::string_view blob);

[[nodiscard]] std::string encode_cache_stats(const model::CacheStats& s);
[[nodiscard]] std::optional<model::CacheStats> decode_cache_stats(std::string_view blob);

[[nodiscard]] std::string encode_ui_samples(const std::vector<model::UISample>& v);
[[nodiscard]] std::optional<std::vector<model::UISample>> decode_ui_samples(std::string_view blob);

[[nodiscard]] std::string encode_memory_metrics(const std::vector<model::MemoryMetric>& v);
[[nodiscard]] std::optional<std::vector<model::MemoryMetric>> decode_memory_metrics(std::string_view blob);

[[nodiscard]] std::string encode_trace_entries(const std::vector<model::TraceEntry>& v);
[[nodiscard]] std::optional<std::vector<model::TraceEntry>> decode_trace_entries(std::string_view blob);

[[nodiscard]] std::string encode_precache(const PrecacheBlob& b);
[[nodiscard]] std::optional<PrecacheBlob> decode_precache(std::string_view blob);

} // namespace steward::store

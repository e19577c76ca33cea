#include "minitest.hpp"
#include "store/Codec.hpp"

#include <string>
#include <vector>

using namespace steward::store;
namespace model = steward::model;

static model::LaunchRecord sample_launch() {
  model::LaunchRecord r;
  r.cold_start = true;
  r.start_time_ms = 1700000000000;
  r.critical_path_complete_ms = 812.5;
  r.interactive_ms = 900;
  r.fully_loaded_ms = 2400;
  r.phases.initialization_ms = 812.5;
  r.phases.critical_resources_ms = 700;
  r.phases.database_setup_ms = 120;
  r.phases.essential_data_ms = 430;
  r.phases.ui_render_ms = 87.5;
  r.phases.background_tasks_ms = 1500;
  r.loaded_count = 5;
  r.deferred_count = 3;
  r.failed_count = 0;
  return r;
}

TEST(codec_launch_records_exact_bytes) {
  std::string blob = encode_launch_records({sample_launch()});
  ASSERT_EQ(blob, std::string("launch_records v1 1\n"
                              "1\t1700000000000\t812.5\t900\t2400\t812.5\t700\t120\t430\t87.5\t1500\t5\t3\t0\n"));
  auto back = decode_launch_records(blob);
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ(back->size(), 1u);
  ASSERT_EQ(encode_launch_records(*back), blob);
  ASSERT_EQ((*back)[0].interactive_ms, 900.0);
  ASSERT_EQ((*back)[0].loaded_count, 5);
}

TEST(codec_empty_list_is_header_only) {
  ASSERT_EQ(encode_memory_samples({}), std::string("memory_samples v1 0\n"));
  auto v = decode_memory_samples("memory_samples v1 0\n");
  ASSERT_TRUE(v.has_value());
  ASSERT_TRUE(v->empty());
}

TEST(codec_escapes_separators_in_strings) {
  model::LeakFinding f;
  f.detected_at_ms = 42;
  f.component = "odd\tname;with=stuff\\and\nlines";
  f.growth_mb = 12.25;
  f.severity = model::LeakSeverity::Medium;
  f.contributing_samples = {50, 55.5, 62.25};
  f.recommendations = {"a;b", "", "x=y"};
  std::string blob = encode_leak_findings({f});
  // Exactly one record line plus the header.
  size_t newlines = 0;
  for (char c : blob) newlines += c == '\n';
  ASSERT_EQ(newlines, 2u);
  auto back = decode_leak_findings(blob);
  ASSERT_TRUE(back.has_value());
  const auto& g = (*back)[0];
  ASSERT_EQ(g.component, f.component);
  ASSERT_TRUE(g.severity == model::LeakSeverity::Medium);
  ASSERT_EQ(g.contributing_samples, f.contributing_samples);
  ASSERT_EQ(g.recommendations, f.recommendations);
}

TEST(codec_component_maps_survive) {
  model::MemorySample s;
  s.timestamp_ms = 1;
  s.heap_used_mb = 80;
  s.heap_total_mb = 150;
  s.percentage_of_budget = 53.333333333333336;
  s.per_component_mb = {{"list", 3.5}, {"a=b", 1}};
  auto back = decode_memory_samples(encode_memory_samples({s}));
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ((*back)[0].per_component_mb, s.per_component_mb);
  ASSERT_EQ((*back)[0].percentage_of_budget, s.percentage_of_budget);
}

TEST(codec_ui_samples_optional_scroll) {
  model::UISample with;
  with.timestamp_ms = 10;
  with.screen_id = "today";
  with.scroll = model::ScrollMetrics{50, 0.8, 7};
  model::UISample without;
  without.timestamp_ms = 11;
  without.screen_id = "history";
  auto back = decode_ui_samples(encode_ui_samples({with, without}));
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ(back->size(), 2u);
  ASSERT_TRUE((*back)[0].scroll.has_value());
  ASSERT_EQ((*back)[0].scroll->jank_count, 7);
  ASSERT_TRUE(!(*back)[1].scroll.has_value());
}

TEST(codec_trace_entries_keep_kind_and_detail) {
  model::TraceEntry e;
  e.name = "navigation";
  e.kind = model::TraceKind::Navigation;
  e.start_time_ms = 99;
  e.duration_ms = 250;
  e.detail = {{"from", "today"}, {"to", "history"}};
  auto back = decode_trace_entries(encode_trace_entries({e}));
  ASSERT_TRUE(back.has_value());
  ASSERT_TRUE((*back)[0].kind == model::TraceKind::Navigation);
  ASSERT_EQ((*back)[0].detail, e.detail);
}

TEST(codec_cache_stats_single_record) {
  model::CacheStats s;
  s.total_size_bytes = 1234;
  s.budget_bytes = 52428800;
  s.entry_count = 3;
  s.hit_rate_pct = 75;
  s.hits = 3;
  s.misses = 1;
  auto back = decode_cache_stats(encode_cache_stats(s));
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ(back->budget_bytes, 52428800u);
  ASSERT_EQ(back->entry_count, 3u);
  ASSERT_TRUE(!decode_cache_stats("cache_stats v1 0\n").has_value());
}

TEST(codec_precache_blob) {
  PrecacheBlob b{1700000000123, {{"user", "ada"}, {"theme", "dark\tmode"}}};
  std::string blob = encode_precache(b);
  ASSERT_EQ(blob, std::string("precache v1 2\n1700000000123\ntheme\tdark\\tmode\nuser\tada\n"));
  auto back = decode_precache(blob);
  ASSERT_TRUE(back.has_value());
  ASSERT_EQ(back->timestamp_ms, b.timestamp_ms);
  ASSERT_EQ(back->data, b.data);
}

TEST(codec_rejects_malformed_input) {
  std::string good = encode_launch_records({sample_launch()});
  ASSERT_TRUE(!decode_launch_records("").has_value());
  ASSERT_TRUE(!decode_launch_records(good.substr(0, good.size() - 1)).has_value()); // no trailing newline
  ASSERT_TRUE(!decode_memory_samples(good).has_value());                           // wrong tag
  ASSERT_TRUE(!decode_launch_records("launch_records v2 0\n").has_value());
  ASSERT_TRUE(!decode_launch_records("launch_records v1 2\n" + good.substr(good.find('\n') + 1)).has_value());
  ASSERT_TRUE(!decode_launch_records("launch_records v1 1\n1\t2\t3\n").has_value());   // short line
  ASSERT_TRUE(!decode_leak_findings("leak_findings v1 1\n1\tc\t12\tsevere\t0\t0\n").has_value()); // bad enum
  ASSERT_TRUE(!decode_leak_findings("leak_findings v1 1\n1\tc\t12\tlow\t2;1\t0\n").has_value());  // count mismatch
  ASSERT_TRUE(!decode_precache("precache v1 0\nnot-a-number\n").has_value());
}

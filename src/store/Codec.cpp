#include "store/Codec.hpp"

#include <charconv>
#include <cstdint>
#include <initializer_list>

namespace steward::store {

namespace {

constexpr std::string_view kVersion = "v1";

void append_escaped(std::string& out, std::string_view s) {
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '\t': out += "\\t"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case ';':  out += "\\s"; break;
      case '=':  out += "\\e"; break;
      default:   out += c; break;
    }
  }
}

std::optional<std::string> unescape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c != '\\') { out += c; continue; }
    if (++i >= s.size()) return std::nullopt;
    switch (s[i]) {
      case '\\': out += '\\'; break;
      case 't':  out += '\t'; break;
      case 'n':  out += '\n'; break;
      case 'r':  out += '\r'; break;
      case 's':  out += ';'; break;
      case 'e':  out += '='; break;
      default:   return std::nullopt;
    }
  }
  return out;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) { parts.push_back(s.substr(start)); break; }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) out.append(buf, ptr);
  else out += '0';
}

void append_i64(std::string& out, int64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

template <class T>
bool parse_number(std::string_view s, T& v) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

// Builds one record line.
class LineWriter {
public:
  explicit LineWriter(std::string& out) : out_(out) {}
  ~LineWriter() { out_ += '\n'; }

  LineWriter& str(std::string_view s) { sep(); append_escaped(out_, s); return *this; }
  LineWriter& num(double v) { sep(); append_double(out_, v); return *this; }
  LineWriter& i64(int64_t v) { sep(); append_i64(out_, v); return *this; }
  LineWriter& flag(bool b) { sep(); out_ += b ? '1' : '0'; return *this; }

  LineWriter& strs(const std::vector<std::string>& v) {
    sep();
    append_i64(out_, static_cast<int64_t>(v.size()));
    for (const auto& s : v) { out_ += ';'; append_escaped(out_, s); }
    return *this;
  }

  LineWriter& nums(const std::vector<double>& v) {
    sep();
    append_i64(out_, static_cast<int64_t>(v.size()));
    for (double d : v) { out_ += ';'; append_double(out_, d); }
    return *this;
  }

  LineWriter& num_map(const std::map<std::string, double>& m) {
    sep();
    append_i64(out_, static_cast<int64_t>(m.size()));
    for (const auto& [k, v] : m) { out_ += ';'; append_escaped(out_, k); out_ += '='; append_double(out_, v); }
    return *this;
  }

  LineWriter& str_map(const std::map<std::string, std::string>& m) {
    sep();
    append_i64(out_, static_cast<int64_t>(m.size()));
    for (const auto& [k, v] : m) { out_ += ';'; append_escaped(out_, k); out_ += '='; append_escaped(out_, v); }
    return *this;
  }

private:
  void sep() { if (!first_) out_ += '\t'; first_ = false; }
  std::string& out_;
  bool first_{true};
};

// Consumes one record line; any parse error latches ok() to false.
class LineReader {
public:
  explicit LineReader(std::string_view line) : fields_(split(line, '\t')) {}

  [[nodiscard]] bool ok() const { return ok_ && next_ == fields_.size(); }
  void fail() { ok_ = false; }

  std::string str() {
    auto f = take();
    auto s = unescape(f);
    if (!s) { ok_ = false; return {}; }
    return *s;
  }

  double num() {
    double v = 0.0;
    if (!parse_number(take(), v)) ok_ = false;
    return v;
  }

  int64_t i64() {
    int64_t v = 0;
    if (!parse_number(take(), v)) ok_ = false;
    return v;
  }

  bool flag() {
    auto f = take();
    if (f == "1") return true;
    if (f != "0") ok_ = false;
    return false;
  }

  std::vector<std::string> strs() {
    std::vector<std::string> out;
    for (auto item : items()) {
      auto s = unescape(item);
      if (!s) { ok_ = false; return {}; }
      out.push_back(std::move(*s));
    }
    return out;
  }

  std::vector<double> nums() {
    std::vector<double> out;
    for (auto item : items()) {
      double d = 0.0;
      if (!parse_number(item, d)) { ok_ = false; return {}; }
      out.push_back(d);
    }
    return out;
  }

  std::map<std::string, double> num_map() {
    std::map<std::string, double> out;
    for (auto item : items()) {
      auto eq = item.find('=');
      if (eq == std::string_view::npos) { ok_ = false; return {}; }
      auto k = unescape(item.substr(0, eq));
      double d = 0.0;
      if (!k || !parse_number(item.substr(eq + 1), d)) { ok_ = false; return {}; }
      out[*k] = d;
    }
    return out;
  }

  std::map<std::string, std::string> str_map() {
    std::map<std::string, std::string> out;
    for (auto item : items()) {
      auto eq = item.find('=');
      if (eq == std::string_view::npos) { ok_ = false; return {}; }
      auto k = unescape(item.substr(0, eq));
      auto v = unescape(item.substr(eq + 1));
      if (!k || !v) { ok_ = false; return {}; }
      out[*k] = *v;
    }
    return out;
  }

private:
  std::string_view take() {
    if (next_ >= fields_.size()) { ok_ = false; return {}; }
    return fields_[next_++];
  }

  // "<n>;a;b;..." -> the n items, validated against the count.
  std::vector<std::string_view> items() {
    auto parts = split(take(), ';');
    int64_t n = -1;
    if (!parse_number(parts[0], n) || n < 0 || static_cast<size_t>(n) != parts.size() - 1) {
      ok_ = false;
      return {};
    }
    return {parts.begin() + 1, parts.end()};
  }

  std::vector<std::string_view> fields_;
  size_t next_{0};
  bool ok_{true};
};

void write_header(std::string& out, std::string_view tag, size_t count) {
  out += tag;
  out += ' ';
  out += kVersion;
  out += ' ';
  append_i64(out, static_cast<int64_t>(count));
  out += '\n';
}

// Split a blob into record lines after validating the header. The blob must
// end with a newline and hold exactly 'count' + extra lines after the header.
std::optional<std::vector<std::string_view>> read_lines(std::string_view blob, std::string_view tag, size_t extra) {
  if (blob.empty() || blob.back() != '\n') return std::nullopt;
  auto lines = split(blob.substr(0, blob.size() - 1), '\n');
  auto header = split(lines[0], ' ');
  if (header.size() != 3 || header[0] != tag || header[1] != kVersion) return std::nullopt;
  int64_t count = -1;
  if (!parse_number(header[2], count) || count < 0) return std::nullopt;
  if (lines.size() - 1 != static_cast<size_t>(count) + extra) return std::nullopt;
  return std::vector<std::string_view>(lines.begin() + 1, lines.end());
}

template <class T, class Fn>
std::string encode_all(std::string_view tag, const std::vector<T>& v, Fn fn) {
  std::string out;
  write_header(out, tag, v.size());
  for (const auto& rec : v) {
    LineWriter w(out);
    fn(w, rec);
  }
  return out;
}

template <class T, class Fn>
std::optional<std::vector<T>> decode_all(std::string_view tag, std::string_view blob, Fn fn) {
  auto lines = read_lines(blob, tag, 0);
  if (!lines) return std::nullopt;
  std::vector<T> out;
  out.reserve(lines->size());
  for (auto line : *lines) {
    LineReader r(line);
    T rec{};
    fn(r, rec);
    if (!r.ok()) return std::nullopt;
    out.push_back(std::move(rec));
  }
  return out;
}

template <class E>
bool parse_enum(std::string_view s, E& out, std::initializer_list<E> values) {
  for (E e : values) {
    if (s == model::to_string(e)) { out = e; return true; }
  }
  return false;
}

} // namespace

std::string encode_launch_records(const std::vector<model::LaunchRecord>& v) {
  return encode_all("launch_records", v, [](LineWriter& w, const model::LaunchRecord& r) {
    w.flag(r.cold_start).i64(r.start_time_ms)
     .num(r.critical_path_complete_ms).num(r.interactive_ms).num(r.fully_loaded_ms)
     .num(r.phases.initialization_ms).num(r.phases.critical_resources_ms).num(r.phases.database_setup_ms)
     .num(r.phases.essential_data_ms).num(r.phases.ui_render_ms).num(r.phases.background_tasks_ms)
     .i64(r.loaded_count).i64(r.deferred_count).i64(r.failed_count);
  });
}

std::optional<std::vector<model::LaunchRecord>> decode_launch_records(std::string_view blob) {
  return decode_all<model::LaunchRecord>("launch_records", blob, [](LineReader& r, model::LaunchRecord& out) {
    out.cold_start = r.flag();
    out.start_time_ms = r.i64();
    out.critical_path_complete_ms = r.num();
    out.interactive_ms = r.num();
    out.fully_loaded_ms = r.num();
    out.phases.initialization_ms = r.num();
    out.phases.critical_resources_ms = r.num();
    out.phases.database_setup_ms = r.num();
    out.phases.essential_data_ms = r.num();
    out.phases.ui_render_ms = r.num();
    out.phases.background_tasks_ms = r.num();
    out.loaded_count = static_cast<int>(r.i64());
    out.deferred_count = static_cast<int>(r.i64());
    out.failed_count = static_cast<int>(r.i64());
  });
}

std::string encode_memory_samples(const std::vector<model::MemorySample>& v) {
  return encode_all("memory_samples", v, [](LineWriter& w, const model::MemorySample& s) {
    w.i64(s.timestamp_ms).num(s.heap_used_mb).num(s.heap_total_mb).num(s.percentage_of_budget)
     .num_map(s.per_component_mb);
  });
}

std::optional<std::vector<model::MemorySample>> decode_memory_samples(std::string_view blob) {
  return decode_all<model::MemorySample>("memory_samples", blob, [](LineReader& r, model::MemorySample& out) {
    out.timestamp_ms = r.i64();
    out.heap_used_mb = r.num();
    out.heap_total_mb = r.num();
    out.percentage_of_budget = r.num();
    out.per_component_mb = r.num_map();
  });
}

std::string encode_leak_findings(const std::vector<model::LeakFinding>& v) {
  return encode_all("leak_findings", v, [](LineWriter& w, const model::LeakFinding& f) {
    w.i64(f.detected_at_ms).str(f.component).num(f.growth_mb).str(model::to_string(f.severity))
     .nums(f.contributing_samples).strs(f.recommendations);
  });
}

std::optional<std::vector<model::LeakFinding>> decode_leak_findings(std::string_view blob) {
  return decode_all<model::LeakFinding>("leak_findings", blob, [](LineReader& r, model::LeakFinding& out) {
    using model::LeakSeverity;
    out.detected_at_ms = r.i64();
    out.component = r.str();
    out.growth_mb = r.num();
    if (!parse_enum(r.str(), out.severity,
                    {LeakSeverity::Low, LeakSeverity::Medium, LeakSeverity::High, LeakSeverity::Critical}))
      r.fail();
    out.contributing_samples = r.nums();
    out.recommendations = r.strs();
  });
}

std::string encode_cache_stats(const model::CacheStats& s) {
  return encode_all("cache_stats", std::vector<model::CacheStats>{s}, [](LineWriter& w, const model::CacheStats& c) {
    w.i64(static_cast<int64_t>(c.total_size_bytes)).i64(static_cast<int64_t>(c.budget_bytes))
     .i64(static_cast<int64_t>(c.entry_count)).num(c.hit_rate_pct)
     .i64(static_cast<int64_t>(c.hits)).i64(static_cast<int64_t>(c.misses)).i64(static_cast<int64_t>(c.evictions))
     .i64(c.oldest_entry_ms).i64(c.newest_entry_ms).i64(c.oldest_entry_age_ms).i64(c.newest_entry_age_ms);
  });
}

std::optional<model::CacheStats> decode_cache_stats(std::string_view blob) {
  auto v = decode_all<model::CacheStats>("cache_stats", blob, [](LineReader& r, model::CacheStats& out) {
    out.total_size_bytes = static_cast<uint64_t>(r.i64());
    out.budget_bytes = static_cast<uint64_t>(r.i64());
    out.entry_count = static_cast<size_t>(r.i64());
    out.hit_rate_pct = r.num();
    out.hits = static_cast<uint64_t>(r.i64());
    out.misses = static_cast<uint64_t>(r.i64());
    out.evictions = static_cast<uint64_t>(r.i64());
    out.oldest_entry_ms = r.i64();
    out.newest_entry_ms = r.i64();
    out.oldest_entry_age_ms = r.i64();
    out.newest_entry_age_ms = r.i64();
  });
  if (!v || v->size() != 1) return std::nullopt;
  return v->front();
}

std::string encode_ui_samples(const std::vector<model::UISample>& v) {
  return encode_all("ui_samples", v, [](LineWriter& w, const model::UISample& s) {
    w.i64(s.timestamp_ms).str(s.screen_id).num(s.fps).num(s.frame_drops)
     .num(s.render_time_ms).num(s.interaction_delay_ms).flag(s.scroll.has_value());
    model::ScrollMetrics sc = s.scroll.value_or(model::ScrollMetrics{});
    w.num(sc.fps).num(sc.smoothness).i64(sc.jank_count);
  });
}

std::optional<std::vector<model::UISample>> decode_ui_samples(std::string_view blob) {
  return decode_all<model::UISample>("ui_samples", blob, [](LineReader& r, model::UISample& out) {
    out.timestamp_ms = r.i64();
    out.screen_id = r.str();
    out.fps = r.num();
    out.frame_drops = r.num();
    out.render_time_ms = r.num();
    out.interaction_delay_ms = r.num();
    bool has_scroll = r.flag();
    model::ScrollMetrics sc;
    sc.fps = r.num();
    sc.smoothness = r.num();
    sc.jank_count = static_cast<int>(r.i64());
    if (has_scroll) out.scroll = sc;
  });
}

std::string encode_memory_metrics(const std::vector<model::MemoryMetric>& v) {
  return encode_all("memory_metrics", v, [](LineWriter& w, const model::MemoryMetric& m) {
    w.i64(m.timestamp_ms).num(m.used_mb).num(m.limit_mb).num(m.percentage);
  });
}

std::optional<std::vector<model::MemoryMetric>> decode_memory_metrics(std::string_view blob) {
  return decode_all<model::MemoryMetric>("memory_metrics", blob, [](LineReader& r, model::MemoryMetric& out) {
    out.timestamp_ms = r.i64();
    out.used_mb = r.num();
    out.limit_mb = r.num();
    out.percentage = r.num();
  });
}

std::string encode_trace_entries(const std::vector<model::TraceEntry>& v) {
  return encode_all("trace_entries", v, [](LineWriter& w, const model::TraceEntry& e) {
    w.str(e.name).str(model::to_string(e.kind)).i64(e.start_time_ms).num(e.duration_ms).str_map(e.detail);
  });
}

std::optional<std::vector<model::TraceEntry>> decode_trace_entries(std::string_view blob) {
  return decode_all<model::TraceEntry>("trace_entries", blob, [](LineReader& r, model::TraceEntry& out) {
    using model::TraceKind;
    out.name = r.str();
    if (!parse_enum(r.str(), out.kind, {TraceKind::Mark, TraceKind::Measure, TraceKind::Navigation,
                                        TraceKind::Render, TraceKind::Interaction}))
      r.fail();
    out.start_time_ms = r.i64();
    out.duration_ms = r.num();
    out.detail = r.str_map();
  });
}

std::string encode_precache(const PrecacheBlob& b) {
  std::string out;
  write_header(out, "precache", b.data.size());
  append_i64(out, b.timestamp_ms);
  out += '\n';
  for (const auto& [k, v] : b.data) {
    LineWriter w(out);
    w.str(k).str(v);
  }
  return out;
}

std::optional<PrecacheBlob> decode_precache(std::string_view blob) {
  auto lines = read_lines(blob, "precache", 1);
  if (!lines) return std::nullopt;
  PrecacheBlob out;
  if (!parse_number((*lines)[0], out.timestamp_ms)) return std::nullopt;
  for (size_t i = 1; i < lines->size(); ++i) {
    LineReader r((*lines)[i]);
    auto k = r.str();
    auto v = r.str();
    if (!r.ok()) return std::nullopt;
    out.data[std::move(k)] = std::move(v);
  }
  return out;
}

} // namespace steward::store

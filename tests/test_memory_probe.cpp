#include "minitest.hpp"
#include "governor/ResourceGovernor.hpp"
#include "probes/MemoryProbe.hpp"
#include "util/Faults.hpp"
#include "store/KeyValueStore.hpp"
#include "util/Procfs.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace std;
namespace fs = std::filesystem;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / (string("steward_test_probe_") + tag + "_" + to_string(::getpid()));
  fs::create_directories(root / "proc/self");
  return root;
}

TEST(proc_self_probe_parses_status) {
  auto root = make_root("ok");
  ofstream(root / "proc/self/status") <<
    "Name:\tsteward\n"
    "VmPeak:\t  400000 kB\n"
    "VmRSS:\t  102400 kB\n"
    "RssAnon:\t   81920 kB\n"
    "VmData:\t  153600 kB\n";
  setenv("STEWARD_PROC_ROOT", root.c_str(), 1);
  steward::probes::ProcSelfMemoryProbe p;
  steward::model::MemoryReading r;
  ASSERT_TRUE(p.sample(r));
  unsetenv("STEWARD_PROC_ROOT");
  ASSERT_EQ(r.heap_used_mb, 80.0);
  ASSERT_EQ(r.heap_total_mb, 150.0);
  ASSERT_TRUE(r.rss_mb.has_value());
  ASSERT_EQ(*r.rss_mb, 100.0);
  std::error_code ec;
  fs::remove_all(root, ec);
}

TEST(proc_self_probe_fails_without_fields) {
  auto root = make_root("missing");
  ofstream(root / "proc/self/status") << "Name:\tsteward\nVmRSS:\t 1024 kB\n";
  setenv("STEWARD_PROC_ROOT", root.c_str(), 1);
  auto before = steward::util::total_faults(steward::util::FaultKind::Probe);
  steward::probes::ProcSelfMemoryProbe p;
  steward::model::MemoryReading r;
  ASSERT_TRUE(!p.sample(r));
  unsetenv("STEWARD_PROC_ROOT");
  // The caller owns fault accounting; the probe only reports failure.
  ASSERT_EQ(steward::util::total_faults(steward::util::FaultKind::Probe), before);
  std::error_code ec;
  fs::remove_all(root, ec);
}

TEST(proc_self_probe_fails_without_file) {
  auto root = make_root("nofile");
  setenv("STEWARD_PROC_ROOT", root.c_str(), 1);
  steward::probes::ProcSelfMemoryProbe p;
  steward::model::MemoryReading r;
  ASSERT_TRUE(!p.sample(r));
  unsetenv("STEWARD_PROC_ROOT");
  std::error_code ec;
  fs::remove_all(root, ec);
}

TEST(fixed_probe_reports_estimate) {
  steward::probes::FixedMemoryProbe p;
  steward::model::MemoryReading r;
  ASSERT_TRUE(p.sample(r));
  ASSERT_EQ(r.heap_used_mb, 80.0);
  ASSERT_EQ(r.heap_total_mb, 150.0);
  ASSERT_TRUE(!r.rss_mb.has_value());
}

TEST(status_field_kb_matches_whole_field_name) {
  std::string_view status = "VmRSSx:\t 1 kB\nVmRSS:\t  2048 kB\nRssAnon:\tjunk kB\n";
  ASSERT_EQ(steward::util::status_field_kb(status, "VmRSS").value_or(0), 2048u);
  ASSERT_TRUE(!steward::util::status_field_kb(status, "RssAnon").has_value());
  ASSERT_TRUE(!steward::util::status_field_kb(status, "VmData").has_value());
  ASSERT_TRUE(!steward::util::status_field_kb(status, "VmRS").has_value());
}

TEST(governor_counts_one_fault_per_failed_proc_read) {
  auto root = make_root("governor");
  setenv("STEWARD_PROC_ROOT", root.c_str(), 1);
  steward::probes::ProcSelfMemoryProbe p;
  steward::store::MemoryKeyValueStore kv;
  steward::governor::ResourceGovernor g(steward::governor::GovernorConfig{}, p, kv);
  auto before = steward::util::total_faults(steward::util::FaultKind::Probe);
  g.capture_snapshot();
  auto after = steward::util::total_faults(steward::util::FaultKind::Probe);
  unsetenv("STEWARD_PROC_ROOT");
  ASSERT_EQ(after - before, 1u);
  ASSERT_TRUE(g.get_snapshots().empty());
  std::error_code ec;
  fs::remove_all(root, ec);
}

#include "probes/MemoryProbe.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <cstdint>

namespace steward::probes {

static inline double kb_to_mb(uint64_t kb) { return static_cast<double>(kb) / 1024.0; }

bool ProcSelfMemoryProbe::sample(model::MemoryReading& out) {
  auto txt_opt = util::read_file_string("/proc/self/status");
  if (!txt_opt) return false;
  auto rss_anon = util::status_field_kb(*txt_opt, "RssAnon");
  auto vm_data = util::status_field_kb(*txt_opt, "VmData");
  auto vm_rss = util::status_field_kb(*txt_opt, "VmRSS");
  if (!rss_anon || !vm_data) return false;

  out.heap_used_mb = kb_to_mb(*rss_anon);
  out.heap_total_mb = kb_to_mb(*vm_data);
  if (vm_rss && *vm_rss > 0) out.rss_mb = kb_to_mb(*vm_rss);
  else out.rss_mb.reset();
  return true;
}

bool FixedMemoryProbe::sample(model::MemoryReading& out) {
  out.heap_used_mb = used_mb_;
  out.heap_total_mb = total_mb_;
  out.rss_mb.reset();
  return true;
}

std::unique_ptr<IMemoryProbe> make_default_probe() {
  auto proc = std::make_unique<ProcSelfMemoryProbe>();
  model::MemoryReading r;
  if (proc->sample(r)) return proc;
  util::log_warn("MemoryProbe", "/proc/self/status unavailable, using fixed estimate");
  return std::make_unique<FixedMemoryProbe>();
}

} // namespace steward::probes

#pragma once
#include <memory>
#include "model/Memory.hpp"

namespace steward::probes {

class IMemoryProbe {
public:
  virtual ~IMemoryProbe() = default;
  [[nodiscard]] virtual bool sample(model::MemoryReading& out) = 0; // true on success
  [[nodiscard]] virtual const char* name() const = 0;
};

// Reads the calling process from /proc/self/status (honours STEWARD_PROC_ROOT).
// heap_used = RssAnon, heap_total = VmData, rss = VmRSS.
class ProcSelfMemoryProbe : public IMemoryProbe {
public:
  bool sample(model::MemoryReading& out) override;
  const char* name() const override { return "proc_self_status"; }
};

// Fixed estimate for environments without a native probe.
class FixedMemoryProbe : public IMemoryProbe {
public:
  FixedMemoryProbe(double used_mb = 80.0, double total_mb = 150.0) : used_mb_(used_mb), total_mb_(total_mb) {}
  bool sample(model::MemoryReading& out) override;
  const char* name() const override { return "fixed_estimate"; }

private:
  double used_mb_;
  double total_mb_;
};

// /proc/self probe when it yields a reading, else the fixed estimate.
[[nodiscard]] std::unique_ptr<IMemoryProbe> make_default_probe();

} // namespace steward::probes

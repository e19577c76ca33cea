#pragma once
// Rolling ledger of monitoring faults (probe, persistence and loop failures)

#include <chrono>
#include <cstdint>

namespace steward::util {

enum class FaultKind { Probe, Persistence, Loop };

[[nodiscard]] const char* to_string(FaultKind kind);

// Record a fault of a given kind at 'now'.
void note_fault(FaultKind kind);

// Count faults in the last 'ms' milliseconds across all kinds.
[[nodiscard]] int count_recent_faults_ms(int ms);

// Count faults in the last 'ms' milliseconds for a specific kind.
[[nodiscard]] int count_recent_kind_faults_ms(FaultKind kind, int ms);

// Faults of a kind since process start.
[[nodiscard]] uint64_t total_faults(FaultKind kind);

} // namespace steward::util

#pragma once

#include <cstdint>
#include <string>

namespace seedscan {

struct CpuTopology {
  uint32_t logical_cpus = 1;
  uint32_t physical_cores = 1;
  std::string source = "fallback";
};

// Verification units per logical CPU when `workers` is 0. A unit spends most
// of a task waiting on oracle round trips, so the pool oversubscribes.
constexpr uint32_t kUnitsPerLogicalCpu = 4;

// Each unit holds its own oracle session; the default stays below the
// per-client session limits common on public Electrum servers.
constexpr uint32_t kMaxDefaultUnits = 16;

CpuTopology detect_cpu_topology();

uint32_t recommended_worker_count(const CpuTopology& topology, uint32_t max_units = kMaxDefaultUnits);

std::string describe_topology(const CpuTopology& topology);

} // namespace seedscan

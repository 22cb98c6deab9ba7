#include "seedscan/perf.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#ifdef SEEDSCAN_HAVE_HWLOC
#include <hwloc.h>
#endif

namespace seedscan {

namespace {

#ifdef SEEDSCAN_HAVE_HWLOC
class HwlocTopology {
public:
  HwlocTopology() {
    if (hwloc_topology_init(&topology_) != 0) {
      topology_ = nullptr;
      return;
    }
    if (hwloc_topology_load(topology_) != 0) {
      hwloc_topology_destroy(topology_);
      topology_ = nullptr;
    }
  }
  ~HwlocTopology() {
    if (topology_ != nullptr) {
      hwloc_topology_destroy(topology_);
    }
  }

  HwlocTopology(const HwlocTopology&) = delete;
  HwlocTopology& operator=(const HwlocTopology&) = delete;

  bool loaded() const { return topology_ != nullptr; }

  uint32_t count(hwloc_obj_type_t type) const {
    const int n = hwloc_get_nbobjs_by_type(topology_, type);
    return n > 0 ? static_cast<uint32_t>(n) : 0U;
  }

private:
  hwloc_topology_t topology_ = nullptr;
};

bool detect_with_hwloc(CpuTopology* out) {
  HwlocTopology topo;
  if (!topo.loaded()) {
    return false;
  }
  const uint32_t pus = topo.count(HWLOC_OBJ_PU);
  if (pus == 0) {
    return false;
  }
  const uint32_t cores = topo.count(HWLOC_OBJ_CORE);
  out->logical_cpus = pus;
  out->physical_cores = cores == 0 ? pus : std::min(cores, pus);
  out->source = "hwloc";
  return true;
}
#endif

} // namespace

CpuTopology detect_cpu_topology() {
  CpuTopology topology;
#ifdef SEEDSCAN_HAVE_HWLOC
  if (detect_with_hwloc(&topology)) {
    return topology;
  }
#endif
  const uint32_t hw = std::thread::hardware_concurrency();
  topology.logical_cpus = hw == 0 ? 1U : hw;
  topology.physical_cores = topology.logical_cpus;
  topology.source = "hardware_concurrency";
  return topology;
}

uint32_t recommended_worker_count(const CpuTopology& topology, uint32_t max_units) {
  const uint32_t logical = std::max<uint32_t>(1U, topology.logical_cpus);
  const uint64_t wanted = static_cast<uint64_t>(logical) * kUnitsPerLogicalCpu;
  const uint64_t cap = std::max<uint32_t>(1U, max_units);
  return static_cast<uint32_t>(std::min(wanted, cap));
}

std::string describe_topology(const CpuTopology& topology) {
  const char* arch = "unknown";
#if defined(__x86_64__)
  arch = "x86_64";
#elif defined(__i386__)
  arch = "x86";
#elif defined(__aarch64__)
  arch = "arm64";
#elif defined(__arm__)
  arch = "arm";
#endif

  std::ostringstream out;
  out << "arch=" << arch
      << " physical=" << topology.physical_cores
      << " logical=" << topology.logical_cpus
      << " source=" << topology.source;
  return out.str();
}

} // namespace seedscan

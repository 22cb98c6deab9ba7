#pragma once

#include "seedscan/config.hpp"
#include "seedscan/log.hpp"
#include "seedscan/result_handler.hpp"
#include "seedscan/seed_ranker.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace seedscan {

class TaskQueue;
class WorkerPool;

// Owns one recovery run: constraints -> candidates -> beam search -> ranking
// -> verification on the worker pool -> checkpoint and summary.
class Recovery {
public:
  Recovery(const Config& config, RuntimeLog& log, bool colorful = false);

  Recovery(const Recovery&) = delete;
  Recovery& operator=(const Recovery&) = delete;

  // Async-signal-safe. The run loop notices within one poll interval.
  void request_stop();
  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

  // Search and rank only; no network access.
  std::vector<RankedSeed> search_candidates();

  RunSummary run();

private:
  PositionScores build_candidates(CandidateLists& candidates, const ConstraintMap& constraints);
  void feed_pool(WorkerPool& pool, TaskQueue& queue) const;
  void report_progress(const WorkerPool& pool, const RunSummary& summary, uint64_t elapsed_ms) const;

  const Config& config_;
  RuntimeLog& log_;
  bool colorful_ = false;
  std::atomic<bool> stop_{false};
};

} // namespace seedscan

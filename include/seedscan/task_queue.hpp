#pragma once

#include "seedscan/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace seedscan {

struct TaskQueueStats {
  size_t queued = 0;
  size_t processing = 0;
  size_t completed = 0;
  size_t failed = 0;
};

// FIFO of verification tasks keyed by mnemonic. A mnemonic moves
// queued -> processing -> completed|failed once and is never re-admitted.
class TaskQueue {
public:
  // Returns false when the mnemonic is already known in any state.
  bool enqueue(VerificationTask task);
  size_t enqueue_all(std::vector<VerificationTask> tasks);

  std::optional<VerificationTask> dequeue();
  std::vector<VerificationTask> dequeue_batch(size_t max_count);

  bool mark_completed(const std::string& mnemonic);
  bool mark_failed(const std::string& mnemonic);

  void sort_by_probability();
  void clear();

  size_t size() const { return queue_.size(); }
  bool empty() const { return queue_.empty(); }
  size_t processing_count() const { return processing_.size(); }
  size_t completed_count() const { return completed_.size(); }
  size_t failed_count() const { return failed_.size(); }
  bool is_known(const std::string& mnemonic) const;
  TaskQueueStats statistics() const;

private:
  std::deque<VerificationTask> queue_;
  std::unordered_set<std::string> queued_;
  std::unordered_set<std::string> processing_;
  std::unordered_set<std::string> completed_;
  std::unordered_set<std::string> failed_;
};

} // namespace seedscan

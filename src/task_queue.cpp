#include "seedscan/task_queue.hpp"

#include <algorithm>

namespace seedscan {

bool TaskQueue::is_known(const std::string& mnemonic) const {
  return queued_.count(mnemonic) != 0 || processing_.count(mnemonic) != 0 ||
         completed_.count(mnemonic) != 0 || failed_.count(mnemonic) != 0;
}

bool TaskQueue::enqueue(VerificationTask task) {
  if (is_known(task.mnemonic())) {
    return false;
  }
  queued_.insert(task.mnemonic());
  queue_.push_back(std::move(task));
  return true;
}

size_t TaskQueue::enqueue_all(std::vector<VerificationTask> tasks) {
  size_t added = 0;
  for (auto& task : tasks) {
    if (enqueue(std::move(task))) {
      ++added;
    }
  }
  return added;
}

std::optional<VerificationTask> TaskQueue::dequeue() {
  if (queue_.empty()) {
    return std::nullopt;
  }
  VerificationTask task = std::move(queue_.front());
  queue_.pop_front();
  queued_.erase(task.mnemonic());
  processing_.insert(task.mnemonic());
  return task;
}

std::vector<VerificationTask> TaskQueue::dequeue_batch(size_t max_count) {
  std::vector<VerificationTask> batch;
  while (batch.size() < max_count) {
    auto task = dequeue();
    if (!task.has_value()) {
      break;
    }
    batch.push_back(std::move(*task));
  }
  return batch;
}

bool TaskQueue::mark_completed(const std::string& mnemonic) {
  if (processing_.erase(mnemonic) == 0) {
    return false;
  }
  completed_.insert(mnemonic);
  return true;
}

bool TaskQueue::mark_failed(const std::string& mnemonic) {
  if (processing_.erase(mnemonic) == 0) {
    return false;
  }
  failed_.insert(mnemonic);
  return true;
}

void TaskQueue::sort_by_probability() {
  std::stable_sort(queue_.begin(), queue_.end(), [](const VerificationTask& a, const VerificationTask& b) {
    return a.score() > b.score();
  });
}

void TaskQueue::clear() {
  queue_.clear();
  queued_.clear();
  processing_.clear();
  completed_.clear();
  failed_.clear();
}

TaskQueueStats TaskQueue::statistics() const {
  return TaskQueueStats{queue_.size(), processing_.size(), completed_.size(), failed_.size()};
}

} // namespace seedscan

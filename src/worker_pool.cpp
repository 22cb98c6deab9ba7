#include "seedscan/worker_pool.hpp"

#include "seedscan/crypto.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace seedscan {

namespace {

constexpr auto kCompletionPollInterval = std::chrono::milliseconds(100);

bool higher_priority(const VerificationTask& a, const VerificationTask& b) {
  return a.score() > b.score();
}

} // namespace

WorkerPool::WorkerPool(uint32_t unit_count, VerifierFactory factory, RuntimeLog& log)
  : requested_units_(unit_count),
    factory_(std::move(factory)),
    log_(log) {
}

WorkerPool::~WorkerPool() {
  shutdown();
}

void WorkerPool::initialize() {
  if (initialized_) {
    return;
  }
  if (requested_units_ == 0) {
    throw std::runtime_error("worker pool needs at least one unit");
  }
  if (!factory_) {
    throw std::runtime_error("worker pool has no verifier factory");
  }

  // Each unit holds at most one task, so a result and an exit notice per
  // unit always fit.
  results_ = std::make_unique<BoundedChannel<UnitMessage>>(static_cast<size_t>(requested_units_) * 2);
  started_at_ = std::chrono::steady_clock::now();

  for (uint32_t i = 0; i < requested_units_; ++i) {
    auto unit = std::make_unique<Unit>();
    unit->id = i;
    unit->verifier = factory_(i);
    if (!unit->verifier) {
      throw std::runtime_error("verifier factory returned nothing for unit " + std::to_string(i));
    }
    unit->inbox = std::make_unique<BoundedChannel<VerificationTask>>(1);
    unit->thread = std::thread(
      &WorkerPool::run_unit,
      i,
      std::ref(*unit->verifier),
      std::ref(*unit->inbox),
      std::ref(*results_));
    idle_.push_back(i);
    units_.emplace(i, std::move(unit));
  }

  initialized_ = true;
  log_.info("Worker pool started with " + std::to_string(units_.size()) + " units");
}

void WorkerPool::run_unit(
  uint32_t id,
  TaskVerifier& verifier,
  BoundedChannel<VerificationTask>& inbox,
  BoundedChannel<UnitMessage>& results) {

  const auto report_exit = [id, &results](std::string reason) {
    UnitMessage message;
    message.kind = UnitMessage::Kind::UNIT_EXITED;
    message.unit_id = id;
    message.error = std::move(reason);
    // A closed channel means the pool is already shutting down.
    (void)results.push(std::move(message));
  };

  try {
    while (auto task = inbox.pop()) {
      UnitMessage message;
      message.kind = UnitMessage::Kind::RESULT;
      message.unit_id = id;
      message.result = verifier.verify(*task);
      if (!results.push(std::move(message))) {
        return;
      }
    }
  } catch (const std::exception& ex) {
    report_exit(ex.what());
  } catch (...) {
    report_exit("unknown error");
  }
}

void WorkerPool::submit_task(VerificationTask task) {
  if (shutting_down_) {
    return;
  }
  const auto pos = std::upper_bound(pending_.begin(), pending_.end(), task, higher_priority);
  pending_.insert(pos, std::move(task));
  dispatch();
}

void WorkerPool::submit_tasks(std::vector<VerificationTask> tasks) {
  if (shutting_down_) {
    return;
  }
  for (auto& task : tasks) {
    pending_.push_back(std::move(task));
  }
  std::stable_sort(pending_.begin(), pending_.end(), higher_priority);
  dispatch();
}

void WorkerPool::dispatch() {
  while (!shutting_down_ && !idle_.empty() && !pending_.empty()) {
    const uint32_t id = idle_.front();
    idle_.pop_front();
    Unit& unit = *units_.at(id);

    VerificationTask task = std::move(pending_.front());
    pending_.pop_front();
    std::string mnemonic = task.mnemonic();

    if (!unit.inbox->try_push(std::move(task))) {
      // Unit and task both return unchanged; the task keeps its place.
      pending_.push_front(std::move(task));
      idle_.push_front(id);
      log_.warn("dispatch to unit " + std::to_string(id) + " failed; task requeued");
      return;
    }
    unit.assigned = std::move(mnemonic);
  }
}

size_t WorkerPool::poll(std::chrono::milliseconds timeout) {
  if (!initialized_ || shutting_down_) {
    return 0;
  }

  size_t handled = 0;
  auto message = results_->pop_for(timeout);
  while (message.has_value()) {
    handle_message(std::move(*message));
    ++handled;
    if (shutting_down_) {
      break;
    }
    message = results_->pop_for(std::chrono::milliseconds(0));
  }
  return handled;
}

void WorkerPool::handle_message(UnitMessage message) {
  const auto it = units_.find(message.unit_id);
  if (it == units_.end()) {
    return;
  }

  if (message.kind == UnitMessage::Kind::UNIT_EXITED) {
    remove_unit(message.unit_id, message.error);
    return;
  }
  if (!message.result.has_value()) {
    return;
  }
  handle_result(*it->second, std::move(*message.result));
}

void WorkerPool::handle_result(Unit& unit, VerificationResult result) {
  unit.assigned.reset();
  ++results_received_;

  if (result_callback_) {
    result_callback_(result);
  }

  if (result.is_match()) {
    if (!found_.has_value()) {
      FoundWallet wallet;
      wallet.mnemonic = result.mnemonic;
      wallet.address = *result.address;
      wallet.path = *result.path;
      wallet.kind = *result.kind;
      wallet.balance_sats = *result.balance_sats;
      wallet.total_checked = results_received_;
      wallet.total_elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_).count());
      found_ = wallet;
      log_.info("Match found by unit " + std::to_string(unit.id) + " at " + wallet.path);
      if (found_callback_) {
        found_callback_(wallet);
      }
    }
    shutdown();
    return;
  }

  if (!shutting_down_) {
    idle_.push_back(unit.id);
    dispatch();
  }
}

void WorkerPool::remove_unit(uint32_t id, const std::string& reason) {
  auto it = units_.find(id);
  if (it == units_.end()) {
    return;
  }
  Unit& unit = *it->second;

  std::string line = "unit " + std::to_string(id) + " exited abnormally: " + reason;
  if (unit.assigned.has_value()) {
    ++lost_tasks_;
    line += "; task " + short_digest(*unit.assigned) + " lost";
  }
  log_.error(line);

  unit.inbox->close();
  if (unit.thread.joinable()) {
    unit.thread.join();
  }
  idle_.erase(std::remove(idle_.begin(), idle_.end(), id), idle_.end());
  units_.erase(it);

  if (units_.empty()) {
    log_.error("no verification units remain");
  }
}

bool WorkerPool::finished() const {
  if (shutting_down_ || units_.empty()) {
    return true;
  }
  return pending_.empty() && idle_.size() == units_.size();
}

void WorkerPool::wait_for_completion() {
  while (initialized_ && !finished()) {
    (void)poll(kCompletionPollInterval);
  }
}

void WorkerPool::shutdown() {
  if (shutting_down_) {
    return;
  }
  shutting_down_ = true;
  pending_.clear();
  idle_.clear();

  for (auto& [id, unit] : units_) {
    unit->inbox->close();
    unit->verifier->interrupt();
  }
  if (results_) {
    results_->close();
  }
  for (auto& [id, unit] : units_) {
    if (unit->thread.joinable()) {
      unit->thread.join();
    }
  }
  if (initialized_) {
    log_.info("Worker pool stopped after " + std::to_string(results_received_) + " results");
  }
}

PoolStatistics WorkerPool::statistics() const {
  PoolStatistics stats;
  stats.total_units = units_.size();
  stats.idle_units = shutting_down_ ? 0 : idle_.size();
  stats.busy_units = shutting_down_ ? 0 : units_.size() - idle_.size();
  stats.pending_tasks = pending_.size();
  stats.results_received = results_received_;
  stats.lost_tasks = lost_tasks_;
  stats.shutting_down = shutting_down_;
  return stats;
}

} // namespace seedscan

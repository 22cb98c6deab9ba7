#pragma once

#include "seedscan/channel.hpp"
#include "seedscan/log.hpp"
#include "seedscan/types.hpp"
#include "seedscan/verifier.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace seedscan {

using VerifierFactory = std::function<std::unique_ptr<TaskVerifier>(uint32_t unit_index)>;

struct PoolStatistics {
  size_t total_units = 0;
  size_t busy_units = 0;
  size_t idle_units = 0;
  size_t pending_tasks = 0;
  uint64_t results_received = 0;
  uint64_t lost_tasks = 0;
  bool shutting_down = false;
};

// Fixed set of verification units, each an owned thread with a private
// verifier and a one-slot inbox. Units report through a shared bounded
// channel that only the owning thread drains, so every pool field and every
// callback lives on that thread.
class WorkerPool {
public:
  using ResultCallback = std::function<void(const VerificationResult&)>;
  using FoundCallback = std::function<void(const FoundWallet&)>;

  WorkerPool(uint32_t unit_count, VerifierFactory factory, RuntimeLog& log);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void initialize();

  void on_result(ResultCallback callback) { result_callback_ = std::move(callback); }
  void on_found(FoundCallback callback) { found_callback_ = std::move(callback); }

  // Ignored once shutdown has begun.
  void submit_task(VerificationTask task);
  void submit_tasks(std::vector<VerificationTask> tasks);

  // Handles unit messages for up to `timeout`; returns how many were handled.
  size_t poll(std::chrono::milliseconds timeout);

  // Pending queue empty and all units idle, shutdown begun, or no units left.
  bool finished() const;
  void wait_for_completion();

  void shutdown();

  PoolStatistics statistics() const;
  size_t pending_count() const { return pending_.size(); }
  size_t unit_count() const { return units_.size(); }
  bool shutting_down() const { return shutting_down_; }
  const std::optional<FoundWallet>& found_wallet() const { return found_; }

private:
  struct UnitMessage {
    enum class Kind {
      RESULT,
      UNIT_EXITED,
    };

    Kind kind = Kind::RESULT;
    uint32_t unit_id = 0;
    std::optional<VerificationResult> result;
    std::string error;
  };

  struct Unit {
    uint32_t id = 0;
    std::unique_ptr<TaskVerifier> verifier;
    std::unique_ptr<BoundedChannel<VerificationTask>> inbox;
    std::thread thread;
    std::optional<std::string> assigned;
  };

  static void run_unit(
    uint32_t id,
    TaskVerifier& verifier,
    BoundedChannel<VerificationTask>& inbox,
    BoundedChannel<UnitMessage>& results);

  void dispatch();
  void handle_message(UnitMessage message);
  void handle_result(Unit& unit, VerificationResult result);
  void remove_unit(uint32_t id, const std::string& reason);

  uint32_t requested_units_ = 0;
  VerifierFactory factory_;
  RuntimeLog& log_;

  std::map<uint32_t, std::unique_ptr<Unit>> units_;
  std::deque<uint32_t> idle_;
  std::deque<VerificationTask> pending_;
  std::unique_ptr<BoundedChannel<UnitMessage>> results_;

  ResultCallback result_callback_;
  FoundCallback found_callback_;
  std::optional<FoundWallet> found_;
  std::chrono::steady_clock::time_point started_at_{};
  uint64_t results_received_ = 0;
  uint64_t lost_tasks_ = 0;
  bool initialized_ = false;
  bool shutting_down_ = false;
};

} // namespace seedscan

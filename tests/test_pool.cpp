#undef NDEBUG

#include "seedscan/address_deriver.hpp"
#include "seedscan/balance_oracle.hpp"
#include "seedscan/channel.hpp"
#include "seedscan/log.hpp"
#include "seedscan/perf.hpp"
#include "seedscan/verifier.hpp"
#include "seedscan/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace seedscan;

namespace {

const std::string kAbandonAbout =
  "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

// Shared, read-only script plus a mutex-guarded dispatch log.
struct Script {
  std::map<std::string, std::string> behaviour;  // "found" | "crash" | "crash-raw" | "" (miss)
  std::mutex mutex;
  std::vector<std::string> seen;
};

class ScriptedVerifier : public TaskVerifier {
public:
  explicit ScriptedVerifier(Script& script) : script_(script) {}

  VerificationResult verify(const VerificationTask& task) override {
    {
      std::lock_guard<std::mutex> lock(script_.mutex);
      script_.seen.push_back(task.mnemonic());
    }
    const auto it = script_.behaviour.find(task.mnemonic());
    const std::string action = it == script_.behaviour.end() ? std::string() : it->second;
    if (action == "crash") {
      throw std::runtime_error("simulated verifier fault");
    }
    if (action == "crash-raw") {
      throw 42;
    }

    VerificationResult result;
    result.mnemonic = task.mnemonic();
    result.addresses_checked = 12;
    if (action == "found") {
      result.found = true;
      result.address = "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu";
      result.path = "m/84'/0'/0'/0/0";
      result.kind = AddressKind::NATIVE_SEGWIT;
      result.balance_sats = 100000;
    }
    return result;
  }

private:
  Script& script_;
};

VerifierFactory scripted_factory(Script& script) {
  return [&script](uint32_t) -> std::unique_ptr<TaskVerifier> {
    return std::make_unique<ScriptedVerifier>(script);
  };
}

class FakeOracle : public BalanceOracle {
public:
  FakeOracle(std::map<std::string, uint64_t> balances, std::string failing)
    : balances_(std::move(balances)), failing_(std::move(failing)) {}

  uint64_t check_balance(const std::string& address) override {
    ++queries_;
    if (address == failing_) {
      throw OracleError("server went away");
    }
    const auto it = balances_.find(address);
    return it == balances_.end() ? 0 : it->second;
  }

  static inline std::atomic<int> queries_{0};

private:
  std::map<std::string, uint64_t> balances_;
  std::string failing_;
};

MnemonicVerifier make_verifier(std::map<std::string, uint64_t> balances, std::string failing, uint64_t target) {
  AddressDeriver deriver(default_derivation_specs(0, 1), NetworkParams::mainnet());
  return MnemonicVerifier(std::move(deriver), std::make_unique<FakeOracle>(std::move(balances), std::move(failing)), target);
}

} // namespace

void test_bounded_channel() {
  std::cout << "Testing bounded channel..." << std::endl;

  BoundedChannel<int> channel(1);
  assert(channel.try_push(1));
  int rejected = 2;
  assert(!channel.try_push(std::move(rejected)));
  assert(rejected == 2);
  assert(channel.size() == 1);

  std::thread producer([&channel]() {
    assert(channel.push(3));
  });
  assert(channel.pop().value() == 1);
  producer.join();
  assert(channel.pop_for(std::chrono::milliseconds(50)).value() == 3);
  assert(!channel.pop_for(std::chrono::milliseconds(10)).has_value());

  assert(channel.try_push(4));
  channel.close();
  assert(channel.closed());
  assert(!channel.push(5));
  assert(channel.pop().value() == 4);
  assert(!channel.pop().has_value());

  std::cout << "  PASS" << std::endl;
}

void test_pool_stops_on_first_match() {
  std::cout << "Testing pool stops on first match..." << std::endl;

  Script script;
  script.behaviour["task-2"] = "found";

  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(1, scripted_factory(script), log);

  int results = 0;
  int found = 0;
  pool.on_result([&results](const VerificationResult&) { ++results; });
  pool.on_found([&found](const FoundWallet& wallet) {
    ++found;
    assert(wallet.mnemonic == "task-2");
    assert(wallet.kind == AddressKind::NATIVE_SEGWIT);
    assert(wallet.balance_sats == 100000);
    assert(wallet.total_checked == 2);
  });

  pool.initialize();
  pool.submit_tasks({VerificationTask("task-1", 0.9, 1), VerificationTask("task-2", 0.8, 2), VerificationTask("task-3", 0.7, 3)});
  pool.wait_for_completion();

  assert(found == 1);
  assert(results == 2);
  assert(pool.shutting_down());
  assert(pool.pending_count() == 0);
  assert(pool.found_wallet().has_value());
  assert(pool.found_wallet()->mnemonic == "task-2");

  {
    std::lock_guard<std::mutex> lock(script.mutex);
    assert(script.seen.size() == 2);
    assert(script.seen[0] == "task-1");
    assert(script.seen[1] == "task-2");
  }

  std::cout << "  PASS" << std::endl;
}

void test_pool_dispatch_order() {
  std::cout << "Testing pool dispatches by descending score..." << std::endl;

  Script script;
  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(1, scripted_factory(script), log);
  int results = 0;
  pool.on_result([&results](const VerificationResult&) { ++results; });
  pool.initialize();

  // The first submission goes straight to the idle unit; the rest are ordered.
  pool.submit_task(VerificationTask("first", 0.1));
  pool.submit_task(VerificationTask("low", 0.2));
  pool.submit_task(VerificationTask("high", 0.9));
  pool.submit_task(VerificationTask("mid", 0.5));
  pool.wait_for_completion();

  assert(results == 4);
  assert(!pool.shutting_down());
  assert(pool.statistics().idle_units == 1);
  assert(pool.statistics().results_received == 4);

  std::lock_guard<std::mutex> lock(script.mutex);
  assert(script.seen.size() == 4);
  assert(script.seen[0] == "first");
  assert(script.seen[1] == "high");
  assert(script.seen[2] == "mid");
  assert(script.seen[3] == "low");

  std::cout << "  PASS" << std::endl;
}

void test_pool_removes_crashed_unit() {
  std::cout << "Testing pool removes a crashed unit..." << std::endl;

  Script script;
  script.behaviour["boom"] = "crash";

  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(2, scripted_factory(script), log);
  int results = 0;
  pool.on_result([&results](const VerificationResult&) { ++results; });
  pool.initialize();

  pool.submit_tasks({VerificationTask("boom", 0.9), VerificationTask("a", 0.5), VerificationTask("b", 0.4), VerificationTask("c", 0.3)});
  pool.wait_for_completion();

  const auto stats = pool.statistics();
  assert(results == 3);
  assert(stats.total_units == 1);
  assert(stats.lost_tasks == 1);
  assert(stats.pending_tasks == 0);
  assert(pool.unit_count() == 1);

  bool logged = false;
  for (const auto& line : log.snapshot()) {
    if (line.find("exited abnormally") != std::string::npos) {
      logged = true;
    }
  }
  assert(logged);

  std::cout << "  PASS" << std::endl;
}

void test_pool_survives_non_standard_exception() {
  std::cout << "Testing pool removes a unit that throws a non-standard exception..." << std::endl;

  Script script;
  script.behaviour["raw"] = "crash-raw";

  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(2, scripted_factory(script), log);
  int results = 0;
  pool.on_result([&results](const VerificationResult&) { ++results; });
  pool.initialize();

  pool.submit_tasks({VerificationTask("raw", 0.9), VerificationTask("a", 0.5), VerificationTask("b", 0.4)});
  pool.wait_for_completion();

  assert(results == 2);
  assert(pool.unit_count() == 1);
  assert(pool.statistics().lost_tasks == 1);

  bool logged = false;
  for (const auto& line : log.snapshot()) {
    if (line.find("exited abnormally: unknown error") != std::string::npos) {
      logged = true;
    }
  }
  assert(logged);

  std::cout << "  PASS" << std::endl;
}

void test_pool_all_units_lost() {
  std::cout << "Testing pool with every unit lost..." << std::endl;

  Script script;
  script.behaviour["boom"] = "crash";

  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(1, scripted_factory(script), log);
  pool.initialize();
  pool.submit_tasks({VerificationTask("boom", 0.9), VerificationTask("never", 0.1)});
  pool.wait_for_completion();

  assert(pool.unit_count() == 0);
  assert(pool.finished());
  assert(pool.pending_count() == 1);

  std::cout << "  PASS" << std::endl;
}

void test_pool_ignores_submissions_after_shutdown() {
  std::cout << "Testing pool ignores submissions after shutdown..." << std::endl;

  Script script;
  RuntimeLog log(LogLevel::DEBUG, false);
  WorkerPool pool(2, scripted_factory(script), log);
  pool.initialize();
  pool.shutdown();
  pool.shutdown();

  pool.submit_task(VerificationTask("late", 1.0));
  pool.submit_tasks({VerificationTask("later", 1.0)});
  assert(pool.pending_count() == 0);
  assert(pool.poll(std::chrono::milliseconds(10)) == 0);
  assert(pool.finished());
  assert(pool.statistics().shutting_down);

  std::lock_guard<std::mutex> lock(script.mutex);
  assert(script.seen.empty());

  std::cout << "  PASS" << std::endl;
}

void test_verifier_finds_target() {
  std::cout << "Testing verifier finds the target balance..." << std::endl;

  const std::string native = "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu";
  auto verifier = make_verifier({{native, 100000}}, "", 100000);
  const auto result = verifier.verify(VerificationTask(kAbandonAbout, 1.0));
  assert(result.found);
  assert(result.is_match());
  assert(*result.address == native);
  assert(*result.path == "m/84'/0'/0'/0/0");
  assert(*result.kind == AddressKind::NATIVE_SEGWIT);
  assert(*result.balance_sats == 100000);
  assert(result.addresses_checked == 3);
  assert(result.mnemonic == kAbandonAbout);

  std::cout << "  PASS" << std::endl;
}

void test_verifier_skips_oracle_errors() {
  std::cout << "Testing verifier skips oracle errors..." << std::endl;

  const std::string legacy = "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA";
  const std::string taproot = "bc1p5cyxnuxmeuwuvkwfem96lqzszd02n6xdcjrs20cac6yqjjwudpxqkedrcr";

  auto verifier = make_verifier({{taproot, 5}}, legacy, 0);
  const auto result = verifier.verify(VerificationTask(kAbandonAbout, 1.0));
  assert(result.found);
  assert(*result.address == taproot);
  assert(result.addresses_checked == 3);

  // Exact target: a different non-zero balance is not a match.
  auto strict = make_verifier({{taproot, 5}}, "", 100000);
  const auto miss = strict.verify(VerificationTask(kAbandonAbout, 1.0));
  assert(!miss.found);
  assert(!miss.is_match());
  assert(miss.addresses_checked == 4);

  std::cout << "  PASS" << std::endl;
}

void test_verifier_rejects_invalid_mnemonic() {
  std::cout << "Testing verifier with an invalid mnemonic..." << std::endl;

  FakeOracle::queries_ = 0;
  auto verifier = make_verifier({}, "", 0);
  const auto result = verifier.verify(VerificationTask("abandon abandon abandon", 1.0));
  assert(!result.found);
  assert(result.addresses_checked == 0);
  assert(FakeOracle::queries_ == 0);

  auto any = make_verifier({}, "", 0);
  assert(any.balance_matches(1));
  assert(!any.balance_matches(0));

  std::cout << "  PASS" << std::endl;
}

void test_worker_count_defaults() {
  std::cout << "Testing default worker count..." << std::endl;

  CpuTopology single;
  assert(recommended_worker_count(single) == kUnitsPerLogicalCpu);

  CpuTopology wide;
  wide.logical_cpus = 64;
  wide.physical_cores = 32;
  assert(recommended_worker_count(wide) == kMaxDefaultUnits);
  assert(recommended_worker_count(wide, 5) == 5);
  assert(recommended_worker_count(wide, 0) == 1);

  CpuTopology empty;
  empty.logical_cpus = 0;
  assert(recommended_worker_count(empty) == kUnitsPerLogicalCpu);

  const CpuTopology detected = detect_cpu_topology();
  assert(detected.logical_cpus >= 1);
  assert(detected.physical_cores >= 1);
  assert(detected.physical_cores <= detected.logical_cpus);
  assert(!detected.source.empty());
  assert(describe_topology(detected).find("logical=" + std::to_string(detected.logical_cpus)) != std::string::npos);

  std::cout << "  PASS" << std::endl;
}

int main() {
  std::cout << "=== Worker Pool Tests ===" << std::endl;

  test_bounded_channel();
  test_pool_stops_on_first_match();
  test_pool_dispatch_order();
  test_pool_removes_crashed_unit();
  test_pool_survives_non_standard_exception();
  test_pool_all_units_lost();
  test_pool_ignores_submissions_after_shutdown();
  test_verifier_finds_target();
  test_verifier_skips_oracle_errors();
  test_verifier_rejects_invalid_mnemonic();
  test_worker_count_defaults();

  std::cout << std::endl << "All worker pool tests passed" << std::endl;
  return 0;
}

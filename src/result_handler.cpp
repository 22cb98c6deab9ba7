#include "seedscan/result_handler.hpp"

#include "seedscan/crypto.hpp"
#include "seedscan/log.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace seedscan {

namespace {

constexpr const char kCheckpointPrefix[] = "checkpoint-";
constexpr const char kCheckpointSuffix[] = ".jsonl";

bool is_checkpoint_name(const std::string& name) {
  const std::string prefix = kCheckpointPrefix;
  const std::string suffix = kCheckpointSuffix;
  return name.size() > prefix.size() + suffix.size() &&
         name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string fixed2(double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(2);
  out << value;
  return out.str();
}

} // namespace

JsonValue run_summary_to_json(const RunSummary& summary) {
  const double elapsed = static_cast<double>(summary.elapsed_ms);
  const double checked = static_cast<double>(summary.total_checked);

  JsonValue::object out{
    {"totalTasks", JsonValue(summary.total_tasks)},
    {"totalChecked", JsonValue(summary.total_checked)},
    {"totalAddressesQueried", JsonValue(summary.total_addresses)},
    {"totalTimeMs", JsonValue(summary.elapsed_ms)},
    {"durationMinutes", JsonValue(fixed2(elapsed / 60000.0))},
    {"averageTimePerSeed", JsonValue(summary.total_checked == 0 ? std::string("n/a") : fixed2(elapsed / checked) + "ms")},
    {"throughput", JsonValue(summary.elapsed_ms == 0 ? std::string("n/a") : fixed2(checked * 1000.0 / elapsed) + " seeds/s")},
    {"interrupted", JsonValue(summary.interrupted)},
    {"timestamp", JsonValue(iso8601_utc(std::chrono::system_clock::now()))},
  };
  if (summary.found.has_value()) {
    out["foundWallet"] = JsonValue(JsonValue::object{
      {"address", JsonValue(summary.found->address)},
      {"path", JsonValue(summary.found->path)},
      {"balance", JsonValue(summary.found->balance_sats)},
    });
  } else {
    out["foundWallet"] = JsonValue(nullptr);
  }
  return JsonValue(std::move(out));
}

ResultHandler::ResultHandler(std::filesystem::path results_dir, RuntimeLog& log)
  : results_dir_(std::move(results_dir)),
    log_(log),
    run_stamp_(file_timestamp(std::chrono::system_clock::now())) {
  std::error_code ec;
  std::filesystem::create_directories(results_dir_, ec);
  if (ec) {
    throw std::runtime_error("cannot create results directory " + results_dir_.string() + ": " + ec.message());
  }
  load_latest_checkpoint();
  checkpoint_path_ = results_dir_ / (kCheckpointPrefix + run_stamp_ + kCheckpointSuffix);
}

void ResultHandler::load_latest_checkpoint() {
  std::vector<std::filesystem::path> candidates;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(results_dir_, ec)) {
    if (entry.is_regular_file(ec) && is_checkpoint_name(entry.path().filename().string())) {
      candidates.push_back(entry.path());
    }
  }
  if (ec) {
    log_.warn("cannot list " + results_dir_.string() + ": " + ec.message());
    return;
  }
  if (candidates.empty()) {
    return;
  }

  // Timestamped names sort chronologically; only the newest is consulted.
  const auto latest = *std::max_element(candidates.begin(), candidates.end());
  std::ifstream in(latest);
  if (!in) {
    log_.warn("cannot read checkpoint " + latest.string());
    return;
  }

  size_t skipped = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      const JsonValue entry = parse_json(line);
      const std::string hash = entry.string_or("mnemonicHash", "");
      if (hash.empty()) {
        ++skipped;
        continue;
      }
      checked_.insert(hash);
    } catch (const JsonError&) {
      ++skipped;
    }
  }

  loaded_count_ = checked_.size();
  log_.info("Loaded " + std::to_string(loaded_count_) + " checked mnemonics from " + latest.filename().string() +
            (skipped > 0 ? " (" + std::to_string(skipped) + " unreadable lines)" : std::string()));
}

void ResultHandler::handle_result(const VerificationResult& result) {
  const std::string hash = short_digest(result.mnemonic);
  checked_.insert(hash);

  const JsonValue::object record{
    {"mnemonicHash", JsonValue(hash)},
    {"found", JsonValue(result.found)},
    {"addressesChecked", JsonValue(result.addresses_checked)},
    {"durationMs", JsonValue(result.elapsed_ms)},
    {"timestamp", JsonValue(iso8601_utc(std::chrono::system_clock::now()))},
  };

  std::ofstream out(checkpoint_path_, std::ios::app);
  if (out) {
    out << to_json(JsonValue(record), false) << '\n';
  }
  if (!out) {
    if (!checkpoint_warned_) {
      log_.warn("checkpoint write failed: " + checkpoint_path_.string());
      checkpoint_warned_ = true;
    }
    return;
  }
  checkpoint_warned_ = false;
}

bool ResultHandler::already_checked(const std::string& mnemonic) const {
  return checked_.count(short_digest(mnemonic)) != 0;
}

std::vector<VerificationTask> ResultHandler::filter_unchecked(std::vector<VerificationTask> tasks) const {
  const size_t before = tasks.size();
  tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [this](const VerificationTask& task) {
    return already_checked(task.mnemonic());
  }), tasks.end());

  if (tasks.size() < before) {
    log_.info("Skipping " + std::to_string(before - tasks.size()) + " previously checked mnemonics");
  }
  return tasks;
}

bool ResultHandler::write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  if (out) {
    out << content;
    out.flush();
  }
  if (!out) {
    log_.error("failed to write " + path.string());
    return false;
  }
  return true;
}

std::optional<std::filesystem::path> ResultHandler::record_found(const FoundWallet& wallet) {
  const std::string content = to_json(found_wallet_to_json(wallet, true), true) + "\n";

  std::optional<std::filesystem::path> written;
  const auto primary = results_dir_ / ("found-wallet-" + run_stamp_ + ".json");
  if (write_file(primary, content)) {
    written = primary;
  }
  const auto backup = results_dir_ / ("FOUND-" + std::to_string(unix_time_ms()) + ".json");
  if (write_file(backup, content) && !written.has_value()) {
    written = backup;
  }

  if (!written.has_value()) {
    std::cerr << "FOUND WALLET (could not be saved to disk):\n" << content << std::flush;
    return std::nullopt;
  }
  log_.info("Found wallet saved to " + written->string());
  return written;
}

std::optional<std::filesystem::path> ResultHandler::write_summary(const RunSummary& summary) {
  const std::string content = to_json(run_summary_to_json(summary), true) + "\n";
  std::cout << "\n=== Run summary ===\n" << content << std::flush;

  const auto path = results_dir_ / ("summary-" + file_timestamp(std::chrono::system_clock::now()) + ".json");
  if (!write_file(path, content)) {
    return std::nullopt;
  }
  log_.info("Summary saved to " + path.string());
  return path;
}

} // namespace seedscan

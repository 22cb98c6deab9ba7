#pragma once

#include "seedscan/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace seedscan {

class RuntimeLog;

struct RunSummary {
  uint64_t total_tasks = 0;
  uint64_t total_checked = 0;
  uint64_t total_addresses = 0;
  uint64_t elapsed_ms = 0;
  bool interrupted = false;
  std::optional<FoundWallet> found;
};

JsonValue run_summary_to_json(const RunSummary& summary);

// Single-writer store for run outcomes. Checkpoint lines carry only a short
// digest of each mnemonic; the plaintext is written only to the found record.
class ResultHandler {
public:
  ResultHandler(std::filesystem::path results_dir, RuntimeLog& log);

  void handle_result(const VerificationResult& result);
  bool already_checked(const std::string& mnemonic) const;
  std::vector<VerificationTask> filter_unchecked(std::vector<VerificationTask> tasks) const;

  // Returns the path written, or nullopt when only stderr received the record.
  std::optional<std::filesystem::path> record_found(const FoundWallet& wallet);
  std::optional<std::filesystem::path> write_summary(const RunSummary& summary);

  const std::filesystem::path& checkpoint_path() const { return checkpoint_path_; }
  size_t loaded_count() const { return loaded_count_; }
  size_t checked_count() const { return checked_.size(); }

private:
  void load_latest_checkpoint();
  bool write_file(const std::filesystem::path& path, const std::string& content);

  std::filesystem::path results_dir_;
  RuntimeLog& log_;
  std::string run_stamp_;
  std::filesystem::path checkpoint_path_;
  std::unordered_set<std::string> checked_;
  size_t loaded_count_ = 0;
  bool checkpoint_warned_ = false;
};

} // namespace seedscan

#pragma once

#include "seedscan/json.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

// Score given to a candidate the scorer never ranked. Low but non-zero so
// every (position, word) pair has a score and ordering stays total.
constexpr double kUnscoredWordScore = 0.01;

struct PositionConstraint {
  uint32_t position = 0;
  uint32_t length = 0;     // 0 = unconstrained
  uint32_t syllables = 0;  // 0 = unconstrained
  std::string rhyme_with;
  std::vector<std::string> semantic_tags;
  std::string pattern;
  std::string context;

  bool empty() const;
};

using ConstraintMap = std::map<uint32_t, PositionConstraint>;

struct ScoredWord {
  std::string word;
  double score = 0.0;
  std::string rationale;
};

using WordScoreMap = std::map<std::string, double, std::less<>>;
using PositionScores = std::map<uint32_t, WordScoreMap>;
using CandidateLists = std::map<uint32_t, std::vector<std::string>>;

struct PartialMnemonic {
  std::vector<std::string> words;
  double score = 0.0;
  uint32_t depth = 0;
};

struct RankedMnemonic {
  std::string phrase;
  double score = 0.0;
};

class VerificationTask {
public:
  VerificationTask(std::string mnemonic, double score, uint32_t rank = 0);

  const std::string& mnemonic() const { return mnemonic_; }
  double score() const { return score_; }
  uint32_t rank() const { return rank_; }

private:
  std::string mnemonic_;
  double score_ = 0.0;
  uint32_t rank_ = 0;
};

enum class AddressKind {
  LEGACY,
  NESTED_SEGWIT,
  NATIVE_SEGWIT,
  TAPROOT,
};

const char* address_kind_name(AddressKind kind);
std::optional<AddressKind> address_kind_from_name(std::string_view name);

struct DerivedAddress {
  std::string address;
  std::string path;
  AddressKind kind = AddressKind::LEGACY;
  uint32_t account = 0;
  uint32_t index = 0;
};

struct VerificationResult {
  std::string mnemonic;
  bool found = false;
  std::optional<std::string> address;
  std::optional<std::string> path;
  std::optional<AddressKind> kind;
  std::optional<uint64_t> balance_sats;
  uint32_t addresses_checked = 0;
  uint64_t elapsed_ms = 0;

  bool is_match() const;
};

struct FoundWallet {
  std::string mnemonic;
  std::string address;
  std::string path;
  AddressKind kind = AddressKind::LEGACY;
  uint64_t balance_sats = 0;
  uint64_t total_checked = 0;
  uint64_t total_elapsed_ms = 0;
};

PositionConstraint position_constraint_from_json(const JsonValue& value);
JsonValue position_constraint_to_json(const PositionConstraint& constraint);
JsonValue found_wallet_to_json(const FoundWallet& wallet, bool include_mnemonic);

uint64_t unix_time_ms();
std::string iso8601_utc(std::chrono::system_clock::time_point when);
std::string file_timestamp(std::chrono::system_clock::time_point when);

} // namespace seedscan

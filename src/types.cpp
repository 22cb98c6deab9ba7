#include "seedscan/types.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace seedscan {

namespace {

std::tm utc_tm(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  if (gmtime_r(&t, &tm) == nullptr) {
    throw std::runtime_error("gmtime_r failed");
  }
  return tm;
}

} // namespace

bool PositionConstraint::empty() const {
  return length == 0 && syllables == 0 && rhyme_with.empty() && semantic_tags.empty() && pattern.empty();
}

VerificationTask::VerificationTask(std::string mnemonic, double score, uint32_t rank)
  : mnemonic_(std::move(mnemonic)), score_(score), rank_(rank) {
}

const char* address_kind_name(AddressKind kind) {
  switch (kind) {
    case AddressKind::LEGACY: return "legacy";
    case AddressKind::NESTED_SEGWIT: return "nested-segwit";
    case AddressKind::NATIVE_SEGWIT: return "native-segwit";
    case AddressKind::TAPROOT: return "taproot";
  }
  return "unknown";
}

std::optional<AddressKind> address_kind_from_name(std::string_view name) {
  if (name == "legacy") return AddressKind::LEGACY;
  if (name == "nested-segwit") return AddressKind::NESTED_SEGWIT;
  if (name == "native-segwit") return AddressKind::NATIVE_SEGWIT;
  if (name == "taproot") return AddressKind::TAPROOT;
  return std::nullopt;
}

bool VerificationResult::is_match() const {
  return found && address.has_value() && path.has_value() && kind.has_value() && balance_sats.has_value();
}

PositionConstraint position_constraint_from_json(const JsonValue& value) {
  if (!value.is_object()) {
    throw std::runtime_error("constraint entry must be an object");
  }

  PositionConstraint c;
  c.position = static_cast<uint32_t>(value.uint_or("position", 0));
  c.length = static_cast<uint32_t>(value.uint_or("length", 0));
  c.syllables = static_cast<uint32_t>(value.uint_or("syllables", 0));
  c.rhyme_with = value.string_or("rhyme_with", "");
  c.pattern = value.string_or("pattern", "");
  c.context = value.string_or("context", "");

  if (const auto* tags = value.find("semantic_domain"); tags != nullptr && !tags->is_null()) {
    if (tags->is_string()) {
      c.semantic_tags.push_back(tags->as_string());
    } else {
      for (const auto& tag : tags->as_array()) {
        c.semantic_tags.push_back(tag.as_string());
      }
    }
  }
  return c;
}

JsonValue position_constraint_to_json(const PositionConstraint& c) {
  JsonValue::array tags;
  for (const auto& tag : c.semantic_tags) {
    tags.emplace_back(tag);
  }
  return JsonValue(JsonValue::object{
    {"position", JsonValue(c.position)},
    {"length", JsonValue(c.length)},
    {"syllables", JsonValue(c.syllables)},
    {"rhyme_with", JsonValue(c.rhyme_with)},
    {"pattern", JsonValue(c.pattern)},
    {"semantic_domain", JsonValue(std::move(tags))},
    {"context", JsonValue(c.context)},
  });
}

JsonValue found_wallet_to_json(const FoundWallet& wallet, bool include_mnemonic) {
  JsonValue::object obj{
    {"address", JsonValue(wallet.address)},
    {"path", JsonValue(wallet.path)},
    {"type", JsonValue(address_kind_name(wallet.kind))},
    {"balance", JsonValue(wallet.balance_sats)},
    {"totalChecked", JsonValue(wallet.total_checked)},
    {"totalTimeMs", JsonValue(wallet.total_elapsed_ms)},
  };
  if (include_mnemonic) {
    obj["mnemonic"] = JsonValue(wallet.mnemonic);
  }
  return JsonValue(std::move(obj));
}

uint64_t unix_time_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const std::tm tm = utc_tm(when);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(n), buf, static_cast<int>(ms));
  return out;
}

std::string file_timestamp(std::chrono::system_clock::time_point when) {
  const std::tm tm = utc_tm(when);
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return std::string(buf, n);
}

} // namespace seedscan

#include "seedscan/verifier.hpp"

#include "seedscan/checksum.hpp"

#include <chrono>
#include <optional>

namespace seedscan {

MnemonicVerifier::MnemonicVerifier(
  AddressDeriver deriver,
  std::unique_ptr<BalanceOracle> oracle,
  uint64_t target_balance_sats)
  : deriver_(std::move(deriver)),
    oracle_(std::move(oracle)),
    target_balance_sats_(target_balance_sats) {
}

bool MnemonicVerifier::balance_matches(uint64_t balance_sats) const {
  if (target_balance_sats_ == 0) {
    return balance_sats > 0;
  }
  return balance_sats == target_balance_sats_;
}

VerificationResult MnemonicVerifier::verify(const VerificationTask& task) {
  const auto start = std::chrono::steady_clock::now();
  VerificationResult result;
  result.mnemonic = task.mnemonic();

  auto finish = [&]() {
    result.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count());
    return result;
  };

  std::optional<HdKeychain> keychain;
  try {
    keychain.emplace(deriver_.keychain_for(task.mnemonic()));
  } catch (const std::runtime_error&) {
    return finish();
  }

  for (const auto& spec : deriver_.specs()) {
    for (uint32_t i = 0; i < spec.count; ++i) {
      DerivedAddress derived;
      try {
        derived = deriver_.derive_one(*keychain, spec, spec.first_index + i);
      } catch (const std::runtime_error&) {
        continue;
      }

      uint64_t balance = 0;
      try {
        balance = oracle_->check_balance(derived.address);
      } catch (const OracleError&) {
        continue;
      }
      ++result.addresses_checked;

      if (balance_matches(balance)) {
        result.found = true;
        result.address = derived.address;
        result.path = derived.path;
        result.kind = derived.kind;
        result.balance_sats = balance;
        return finish();
      }
    }
  }
  return finish();
}

void MnemonicVerifier::interrupt() {
  oracle_->interrupt();
}

} // namespace seedscan

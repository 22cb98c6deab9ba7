#pragma once

#include "seedscan/address_deriver.hpp"
#include "seedscan/balance_oracle.hpp"
#include "seedscan/types.hpp"

#include <cstdint>
#include <memory>

namespace seedscan {

// Work performed by one pool unit for one task. Each unit owns its instance.
class TaskVerifier {
public:
  virtual ~TaskVerifier() = default;

  virtual VerificationResult verify(const VerificationTask& task) = 0;

  // Called from the orchestrator thread during shutdown.
  virtual void interrupt() {}
};

// Derives the address table for a mnemonic and asks the oracle about each
// address until one holds the target balance. Per-address failures are
// skipped; a mnemonic that cannot be derived at all reports found=false.
class MnemonicVerifier : public TaskVerifier {
public:
  // target_balance_sats == 0 matches any non-zero balance.
  MnemonicVerifier(AddressDeriver deriver, std::unique_ptr<BalanceOracle> oracle, uint64_t target_balance_sats);

  VerificationResult verify(const VerificationTask& task) override;
  void interrupt() override;

  bool balance_matches(uint64_t balance_sats) const;

private:
  AddressDeriver deriver_;
  std::unique_ptr<BalanceOracle> oracle_;
  uint64_t target_balance_sats_ = 0;
};

} // namespace seedscan

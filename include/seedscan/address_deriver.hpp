#pragma once

#include "seedscan/address.hpp"
#include "seedscan/hd_key.hpp"
#include "seedscan/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

struct DerivationSpec {
  AddressKind kind = AddressKind::LEGACY;
  uint32_t account = 0;
  uint32_t first_index = 0;
  uint32_t count = 1;
};

uint32_t purpose_for(AddressKind kind);

// Every standard at `account`, receive chain indices [0, count).
std::vector<DerivationSpec> default_derivation_specs(uint32_t account, uint32_t count);

// Maps a mnemonic to a fixed, ordered address table: specs in order, indices
// ascending within each spec.
class AddressDeriver {
public:
  AddressDeriver(std::vector<DerivationSpec> specs, NetworkParams network);

  // Throws MnemonicError when the phrase is not a checksum-valid mnemonic.
  HdKeychain keychain_for(std::string_view mnemonic) const;

  // purpose'/coin'/account'/0/index for one spec entry. Throws on failure so
  // the caller picks skip or abort.
  DerivedAddress derive_one(HdKeychain& keychain, const DerivationSpec& spec, uint32_t index) const;

  // Whole table; any failure propagates.
  std::vector<DerivedAddress> derive(std::string_view mnemonic) const;

  std::vector<uint32_t> path_for(const DerivationSpec& spec, uint32_t index) const;
  size_t addresses_per_mnemonic() const;

  const std::vector<DerivationSpec>& specs() const { return specs_; }
  const NetworkParams& network() const { return network_; }

private:
  std::vector<DerivationSpec> specs_;
  NetworkParams network_;
};

} // namespace seedscan

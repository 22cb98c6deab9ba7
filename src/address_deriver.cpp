#include "seedscan/address_deriver.hpp"

#include "seedscan/checksum.hpp"

namespace seedscan {

namespace {

constexpr uint32_t kReceiveChain = 0;

} // namespace

uint32_t purpose_for(AddressKind kind) {
  switch (kind) {
    case AddressKind::LEGACY: return 44;
    case AddressKind::NESTED_SEGWIT: return 49;
    case AddressKind::NATIVE_SEGWIT: return 84;
    case AddressKind::TAPROOT: return 86;
  }
  return 44;
}

std::vector<DerivationSpec> default_derivation_specs(uint32_t account, uint32_t count) {
  return {
    DerivationSpec{AddressKind::LEGACY, account, 0, count},
    DerivationSpec{AddressKind::NESTED_SEGWIT, account, 0, count},
    DerivationSpec{AddressKind::NATIVE_SEGWIT, account, 0, count},
    DerivationSpec{AddressKind::TAPROOT, account, 0, count},
  };
}

AddressDeriver::AddressDeriver(std::vector<DerivationSpec> specs, NetworkParams network)
  : specs_(std::move(specs)), network_(std::move(network)) {
}

HdKeychain AddressDeriver::keychain_for(std::string_view mnemonic) const {
  const auto words = split_words(mnemonic);
  if (!validate_mnemonic(words)) {
    throw MnemonicError("not a valid 12-word mnemonic");
  }
  const Hash512 seed = mnemonic_to_seed(join_words(words));
  return HdKeychain(seed);
}

std::vector<uint32_t> AddressDeriver::path_for(const DerivationSpec& spec, uint32_t index) const {
  return {
    purpose_for(spec.kind) | kHardenedBit,
    network_.coin_type | kHardenedBit,
    spec.account | kHardenedBit,
    kReceiveChain,
    index,
  };
}

DerivedAddress AddressDeriver::derive_one(HdKeychain& keychain, const DerivationSpec& spec, uint32_t index) const {
  const auto path = path_for(spec, index);
  const ExtendedKey key = keychain.derive(path);
  const PublicKey pub = keychain.public_key(key);

  DerivedAddress out;
  out.path = format_derivation_path(path);
  out.kind = spec.kind;
  out.account = spec.account;
  out.index = index;

  switch (spec.kind) {
    case AddressKind::LEGACY:
      out.address = p2pkh_address(pub, network_);
      break;
    case AddressKind::NESTED_SEGWIT:
      out.address = p2sh_p2wpkh_address(pub, network_);
      break;
    case AddressKind::NATIVE_SEGWIT:
      out.address = p2wpkh_address(pub, network_);
      break;
    case AddressKind::TAPROOT:
      out.address = p2tr_address(keychain.taproot_output_key(pub), network_);
      break;
  }
  return out;
}

std::vector<DerivedAddress> AddressDeriver::derive(std::string_view mnemonic) const {
  HdKeychain keychain = keychain_for(mnemonic);
  std::vector<DerivedAddress> out;
  out.reserve(addresses_per_mnemonic());
  for (const auto& spec : specs_) {
    for (uint32_t i = 0; i < spec.count; ++i) {
      out.push_back(derive_one(keychain, spec, spec.first_index + i));
    }
  }
  return out;
}

size_t AddressDeriver::addresses_per_mnemonic() const {
  size_t total = 0;
  for (const auto& spec : specs_) {
    total += spec.count;
  }
  return total;
}

} // namespace seedscan

#pragma once

#include "seedscan/crypto.hpp"
#include "seedscan/hd_key.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace seedscan {

class AddressError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct NetworkParams {
  std::string name;
  std::string hrp;
  uint8_t p2pkh_prefix = 0x00;
  uint8_t p2sh_prefix = 0x05;
  uint32_t coin_type = 0;

  static NetworkParams mainnet();
  static NetworkParams testnet();
};

std::optional<NetworkParams> network_from_name(std::string_view name);

std::string base58_encode(std::span<const uint8_t> data);
std::string base58check_encode(std::span<const uint8_t> payload);
Bytes base58check_decode(std::string_view text);

// Version 0 uses bech32, versions 1..16 use bech32m (BIP350).
std::string segwit_encode(std::string_view hrp, uint8_t witness_version, std::span<const uint8_t> program);

struct WitnessProgram {
  uint8_t version = 0;
  Bytes program;
};

WitnessProgram segwit_decode(std::string_view hrp, std::string_view address);

std::string p2pkh_address(const PublicKey& pub, const NetworkParams& net);
std::string p2sh_p2wpkh_address(const PublicKey& pub, const NetworkParams& net);
std::string p2wpkh_address(const PublicKey& pub, const NetworkParams& net);
std::string p2tr_address(const XOnlyKey& output_key, const NetworkParams& net);

// Output script locking funds to `address`; throws AddressError for anything
// that is not a valid address on `net`.
Bytes script_pubkey_for_address(std::string_view address, const NetworkParams& net);

} // namespace seedscan

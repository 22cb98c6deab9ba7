#pragma once

#include "seedscan/crypto.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

constexpr uint32_t kHardenedBit = 0x80000000U;
constexpr uint32_t kSeedPbkdf2Rounds = 2048;

using PublicKey = std::array<uint8_t, 33>;
using XOnlyKey = std::array<uint8_t, 32>;

class KeyDerivationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ExtendedKey {
  std::array<uint8_t, 32> secret{};
  std::array<uint8_t, 32> chain_code{};
  uint8_t depth = 0;
};

// BIP39 seed: PBKDF2-HMAC-SHA512(mnemonic, "mnemonic" + passphrase, 2048).
Hash512 mnemonic_to_seed(std::string_view mnemonic, std::string_view passphrase = {});

// "m/84'/0'/0'/0/1" <-> {84|H, 0|H, 0|H, 0, 1}. Both "'" and "h" mark hardened.
std::vector<uint32_t> parse_derivation_path(std::string_view path);
std::string format_derivation_path(const std::vector<uint32_t>& path);

// BIP32 private derivation on secp256k1. Not thread-safe; each verifier owns one.
class HdKeychain {
public:
  explicit HdKeychain(std::span<const uint8_t> seed);
  ~HdKeychain();

  HdKeychain(const HdKeychain&) = delete;
  HdKeychain& operator=(const HdKeychain&) = delete;
  HdKeychain(HdKeychain&&) noexcept;
  HdKeychain& operator=(HdKeychain&&) noexcept;

  const ExtendedKey& master() const { return master_; }

  ExtendedKey derive_child(const ExtendedKey& parent, uint32_t index);
  ExtendedKey derive(const std::vector<uint32_t>& path);

  PublicKey public_key(const ExtendedKey& key);
  PublicKey public_key(std::span<const uint8_t, 32> secret);

  // BIP341 key-path output key with no script tree: x(lift_x(P) + H_TapTweak(P)·G).
  XOnlyKey taproot_output_key(const PublicKey& internal_key);

private:
  struct Curve;

  std::unique_ptr<Curve> curve_;
  ExtendedKey master_;
};

} // namespace seedscan

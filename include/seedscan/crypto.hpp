#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

using Bytes = std::vector<uint8_t>;
using Hash256 = std::array<uint8_t, 32>;
using Hash160 = std::array<uint8_t, 20>;
using Hash512 = std::array<uint8_t, 64>;

class CryptoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

Hash256 sha256(std::span<const uint8_t> data);
Hash256 sha256(std::string_view text);
Hash256 sha256d(std::span<const uint8_t> data);
Hash160 ripemd160(std::span<const uint8_t> data);
Hash160 hash160(std::span<const uint8_t> data);

// BIP340 tagged hash: sha256(sha256(tag) || sha256(tag) || msg).
Hash256 tagged_hash(std::string_view tag, std::span<const uint8_t> msg);

Hash512 hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data);
Hash512 pbkdf2_hmac_sha512(std::string_view password, std::string_view salt, uint32_t iterations);

std::string to_hex(std::span<const uint8_t> data);
Bytes from_hex(std::string_view hex);

// First 8 hex characters of sha256(text); safe to write to routine logs.
std::string short_digest(std::string_view text);

} // namespace seedscan

#include "seedscan/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>

namespace seedscan {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct EvpMdDeleter {
  void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using EvpMdPtr = std::unique_ptr<EVP_MD, EvpMdDeleter>;

template <size_t N>
std::array<uint8_t, N> evp_digest(const EVP_MD* md, std::span<const uint8_t> data, const char* name) {
  if (md == nullptr) {
    throw CryptoError(std::string("digest unavailable: ") + name);
  }
  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw CryptoError("EVP_MD_CTX_new failed");
  }

  std::array<uint8_t, N> out{};
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 ||
      len != N) {
    throw CryptoError(std::string("digest failed: ") + name);
  }
  return out;
}

int hex_nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

Hash256 sha256(std::span<const uint8_t> data) {
  return evp_digest<32>(EVP_sha256(), data, "sha256");
}

Hash256 sha256(std::string_view text) {
  return sha256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

Hash256 sha256d(std::span<const uint8_t> data) {
  const auto first = sha256(data);
  return sha256(first);
}

Hash160 ripemd160(std::span<const uint8_t> data) {
  // Older OpenSSL 3 builds only ship RIPEMD160 in the legacy provider.
  EvpMdPtr fetched(EVP_MD_fetch(nullptr, "RIPEMD160", nullptr));
  return evp_digest<20>(fetched ? fetched.get() : EVP_ripemd160(), data, "ripemd160");
}

Hash160 hash160(std::span<const uint8_t> data) {
  const auto inner = sha256(data);
  return ripemd160(inner);
}

Hash256 tagged_hash(std::string_view tag, std::span<const uint8_t> msg) {
  const auto tag_hash = sha256(tag);
  Bytes buffer;
  buffer.reserve(64 + msg.size());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), msg.begin(), msg.end());
  return sha256(buffer);
}

Hash512 hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
  Hash512 out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha512(),
           key.data(), static_cast<int>(key.size()),
           data.data(), data.size(),
           out.data(), &len) == nullptr ||
      len != out.size()) {
    throw CryptoError("HMAC-SHA512 failed");
  }
  return out;
}

Hash512 pbkdf2_hmac_sha512(std::string_view password, std::string_view salt, uint32_t iterations) {
  Hash512 out{};
  if (PKCS5_PBKDF2_HMAC(
        password.data(), static_cast<int>(password.size()),
        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha512(),
        static_cast<int>(out.size()), out.data()) != 1) {
    throw CryptoError("PBKDF2-HMAC-SHA512 failed");
  }
  return out;
}

std::string to_hex(std::span<const uint8_t> data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (const uint8_t b : data) {
    out.push_back(kDigits[b >> 4U]);
    out.push_back(kDigits[b & 0x0FU]);
  }
  return out;
}

Bytes from_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw CryptoError("hex string has odd length");
  }
  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = hex_nibble(hex[i]);
    const int lo = hex_nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw CryptoError("invalid hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string short_digest(std::string_view text) {
  const auto digest = sha256(text);
  return to_hex(std::span<const uint8_t>(digest.data(), 4));
}

} // namespace seedscan

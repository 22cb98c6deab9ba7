#include "seedscan/hd_key.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cctype>

namespace seedscan {

namespace {

constexpr std::string_view kMasterKeySalt = "Bitcoin seed";

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct EcGroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

struct EcPointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

BnPtr bn_from_bytes(std::span<const uint8_t> bytes) {
  BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn) {
    throw CryptoError("BN_bin2bn failed");
  }
  return bn;
}

void bn_to_bytes32(const BIGNUM* bn, uint8_t* out) {
  if (BN_bn2binpad(bn, out, 32) != 32) {
    throw CryptoError("BN_bn2binpad failed");
  }
}

void put_be32(uint32_t value, uint8_t* out) {
  out[0] = static_cast<uint8_t>(value >> 24);
  out[1] = static_cast<uint8_t>(value >> 16);
  out[2] = static_cast<uint8_t>(value >> 8);
  out[3] = static_cast<uint8_t>(value);
}

} // namespace

struct HdKeychain::Curve {
  EcGroupPtr group;
  BnCtxPtr ctx;
  const BIGNUM* order = nullptr;

  Curve()
    : group(EC_GROUP_new_by_curve_name(NID_secp256k1)),
      ctx(BN_CTX_new()) {
    if (!group || !ctx) {
      throw CryptoError("failed to initialize secp256k1");
    }
    order = EC_GROUP_get0_order(group.get());
    if (order == nullptr) {
      throw CryptoError("secp256k1 order unavailable");
    }
  }

  // Scalar must be in [1, n-1].
  bool valid_scalar(const BIGNUM* k) const {
    return !BN_is_zero(k) && BN_cmp(k, order) < 0;
  }

  PublicKey encode(const EC_POINT* point) const {
    PublicKey out{};
    const size_t n = EC_POINT_point2oct(
      group.get(), point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), ctx.get());
    if (n != out.size()) {
      throw CryptoError("EC_POINT_point2oct failed");
    }
    return out;
  }
};

Hash512 mnemonic_to_seed(std::string_view mnemonic, std::string_view passphrase) {
  std::string salt = "mnemonic";
  salt.append(passphrase);
  return pbkdf2_hmac_sha512(mnemonic, salt, kSeedPbkdf2Rounds);
}

std::vector<uint32_t> parse_derivation_path(std::string_view path) {
  if (path.empty() || path.front() != 'm') {
    throw KeyDerivationError("derivation path must start with m");
  }
  std::vector<uint32_t> out;
  size_t pos = 1;
  while (pos < path.size()) {
    if (path[pos] != '/') {
      throw KeyDerivationError("malformed derivation path: " + std::string(path));
    }
    ++pos;
    uint64_t value = 0;
    size_t digits = 0;
    while (pos < path.size() && std::isdigit(static_cast<unsigned char>(path[pos])) != 0) {
      value = value * 10 + static_cast<uint64_t>(path[pos] - '0');
      if (value >= kHardenedBit) {
        throw KeyDerivationError("derivation index out of range: " + std::string(path));
      }
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      throw KeyDerivationError("malformed derivation path: " + std::string(path));
    }
    uint32_t index = static_cast<uint32_t>(value);
    if (pos < path.size() && (path[pos] == '\'' || path[pos] == 'h' || path[pos] == 'H')) {
      index |= kHardenedBit;
      ++pos;
    }
    out.push_back(index);
  }
  return out;
}

std::string format_derivation_path(const std::vector<uint32_t>& path) {
  std::string out = "m";
  for (const uint32_t index : path) {
    out += '/';
    out += std::to_string(index & ~kHardenedBit);
    if ((index & kHardenedBit) != 0) {
      out += '\'';
    }
  }
  return out;
}

HdKeychain::HdKeychain(std::span<const uint8_t> seed)
  : curve_(std::make_unique<Curve>()) {
  const std::span<const uint8_t> salt(
    reinterpret_cast<const uint8_t*>(kMasterKeySalt.data()), kMasterKeySalt.size());
  const Hash512 i = hmac_sha512(salt, seed);

  auto il = bn_from_bytes(std::span<const uint8_t>(i.data(), 32));
  if (!curve_->valid_scalar(il.get())) {
    throw KeyDerivationError("seed produces an invalid master key");
  }
  std::copy(i.begin(), i.begin() + 32, master_.secret.begin());
  std::copy(i.begin() + 32, i.end(), master_.chain_code.begin());
}

HdKeychain::~HdKeychain() = default;
HdKeychain::HdKeychain(HdKeychain&&) noexcept = default;
HdKeychain& HdKeychain::operator=(HdKeychain&&) noexcept = default;

ExtendedKey HdKeychain::derive_child(const ExtendedKey& parent, uint32_t index) {
  std::array<uint8_t, 37> data{};
  if ((index & kHardenedBit) != 0) {
    data[0] = 0x00;
    std::copy(parent.secret.begin(), parent.secret.end(), data.begin() + 1);
  } else {
    const PublicKey pub = public_key(parent);
    std::copy(pub.begin(), pub.end(), data.begin());
  }
  put_be32(index, data.data() + 33);

  const Hash512 i = hmac_sha512(parent.chain_code, data);
  auto il = bn_from_bytes(std::span<const uint8_t>(i.data(), 32));
  if (BN_cmp(il.get(), curve_->order) >= 0) {
    throw KeyDerivationError("derived tweak exceeds curve order at index " + std::to_string(index));
  }

  auto k = bn_from_bytes(parent.secret);
  BnPtr child(BN_new());
  if (!child || BN_mod_add(child.get(), il.get(), k.get(), curve_->order, curve_->ctx.get()) != 1) {
    throw CryptoError("BN_mod_add failed");
  }
  if (BN_is_zero(child.get())) {
    throw KeyDerivationError("derived key is zero at index " + std::to_string(index));
  }

  ExtendedKey out;
  bn_to_bytes32(child.get(), out.secret.data());
  std::copy(i.begin() + 32, i.end(), out.chain_code.begin());
  out.depth = static_cast<uint8_t>(parent.depth + 1);
  return out;
}

ExtendedKey HdKeychain::derive(const std::vector<uint32_t>& path) {
  ExtendedKey key = master_;
  for (const uint32_t index : path) {
    key = derive_child(key, index);
  }
  return key;
}

PublicKey HdKeychain::public_key(const ExtendedKey& key) {
  return public_key(std::span<const uint8_t, 32>(key.secret));
}

PublicKey HdKeychain::public_key(std::span<const uint8_t, 32> secret) {
  auto k = bn_from_bytes(secret);
  if (!curve_->valid_scalar(k.get())) {
    throw KeyDerivationError("secret key out of range");
  }
  EcPointPtr point(EC_POINT_new(curve_->group.get()));
  if (!point || EC_POINT_mul(curve_->group.get(), point.get(), k.get(), nullptr, nullptr, curve_->ctx.get()) != 1) {
    throw CryptoError("EC_POINT_mul failed");
  }
  return curve_->encode(point.get());
}

XOnlyKey HdKeychain::taproot_output_key(const PublicKey& internal_key) {
  XOnlyKey x{};
  std::copy(internal_key.begin() + 1, internal_key.end(), x.begin());

  const Hash256 tweak = tagged_hash("TapTweak", x);
  auto t = bn_from_bytes(tweak);
  if (BN_cmp(t.get(), curve_->order) >= 0) {
    throw KeyDerivationError("taproot tweak exceeds curve order");
  }

  // lift_x picks the even-y point for the x coordinate.
  PublicKey even{};
  even[0] = 0x02;
  std::copy(x.begin(), x.end(), even.begin() + 1);
  EcPointPtr p(EC_POINT_new(curve_->group.get()));
  if (!p || EC_POINT_oct2point(curve_->group.get(), p.get(), even.data(), even.size(), curve_->ctx.get()) != 1) {
    throw KeyDerivationError("internal key is not on the curve");
  }

  BnPtr one(BN_new());
  if (!one || BN_one(one.get()) != 1) {
    throw CryptoError("BN_one failed");
  }
  EcPointPtr q(EC_POINT_new(curve_->group.get()));
  if (!q || EC_POINT_mul(curve_->group.get(), q.get(), t.get(), p.get(), one.get(), curve_->ctx.get()) != 1) {
    throw CryptoError("EC_POINT_mul failed");
  }
  if (EC_POINT_is_at_infinity(curve_->group.get(), q.get()) == 1) {
    throw KeyDerivationError("taproot output key is the point at infinity");
  }

  const PublicKey encoded = curve_->encode(q.get());
  XOnlyKey out{};
  std::copy(encoded.begin() + 1, encoded.end(), out.begin());
  return out;
}

} // namespace seedscan

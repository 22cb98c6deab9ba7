#include "seedscan/address.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace seedscan {

namespace {

constexpr char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr char kBech32Charset[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr uint32_t kBech32Const = 1;
constexpr uint32_t kBech32mConst = 0x2bc830a3;
constexpr size_t kChecksumChars = 6;

constexpr uint8_t OP_0 = 0x00;
constexpr uint8_t OP_1 = 0x51;
constexpr uint8_t OP_DUP = 0x76;
constexpr uint8_t OP_HASH160 = 0xa9;
constexpr uint8_t OP_EQUAL = 0x87;
constexpr uint8_t OP_EQUALVERIFY = 0x88;
constexpr uint8_t OP_CHECKSIG = 0xac;

int base58_digit(char c) {
  const char* pos = std::char_traits<char>::find(kBase58Alphabet, 58, c);
  return pos == nullptr ? -1 : static_cast<int>(pos - kBase58Alphabet);
}

int bech32_digit(char c) {
  const char* pos = std::char_traits<char>::find(kBech32Charset, 32, c);
  return pos == nullptr ? -1 : static_cast<int>(pos - kBech32Charset);
}

uint32_t bech32_polymod(const Bytes& values) {
  static constexpr std::array<uint32_t, 5> kGenerator{
    0x3b6a57b2U, 0x26508e6dU, 0x1ea119faU, 0x3d4233ddU, 0x2a1462b3U,
  };
  uint32_t chk = 1;
  for (const uint8_t v : values) {
    const uint32_t top = chk >> 25;
    chk = ((chk & 0x1ffffffU) << 5) ^ v;
    for (size_t i = 0; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1U) != 0) {
        chk ^= kGenerator[i];
      }
    }
  }
  return chk;
}

Bytes bech32_hrp_expand(std::string_view hrp) {
  Bytes out;
  out.reserve(hrp.size() * 2 + 1);
  for (const char c : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
  }
  out.push_back(0);
  for (const char c : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 31));
  }
  return out;
}

bool convert_bits(std::span<const uint8_t> in, int from_bits, int to_bits, bool pad, Bytes* out) {
  uint32_t acc = 0;
  int bits = 0;
  const uint32_t maxv = (1U << to_bits) - 1;
  for (const uint8_t value : in) {
    if ((value >> from_bits) != 0) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad) {
    if (bits > 0) {
      out->push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv) != 0) {
    return false;
  }
  return true;
}

bool starts_with_hrp(std::string_view address, std::string_view hrp) {
  if (address.size() <= hrp.size() || address[hrp.size()] != '1') {
    return false;
  }
  for (size_t i = 0; i < hrp.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(address[i])) != hrp[i]) {
      return false;
    }
  }
  return true;
}

Bytes base58_decode(std::string_view text) {
  size_t zeros = 0;
  while (zeros < text.size() && text[zeros] == '1') {
    ++zeros;
  }

  Bytes b256((text.size() - zeros) * 733 / 1000 + 1, 0);
  for (size_t i = zeros; i < text.size(); ++i) {
    int carry = base58_digit(text[i]);
    if (carry < 0) {
      throw AddressError("invalid base58 character");
    }
    for (auto it = b256.rbegin(); it != b256.rend(); ++it) {
      carry += 58 * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    if (carry != 0) {
      throw AddressError("base58 overflow");
    }
  }

  auto first = std::find_if(b256.begin(), b256.end(), [](uint8_t b) { return b != 0; });
  Bytes out(zeros, 0);
  out.insert(out.end(), first, b256.end());
  return out;
}

} // namespace

NetworkParams NetworkParams::mainnet() {
  return NetworkParams{"mainnet", "bc", 0x00, 0x05, 0};
}

NetworkParams NetworkParams::testnet() {
  return NetworkParams{"testnet", "tb", 0x6f, 0xc4, 1};
}

std::optional<NetworkParams> network_from_name(std::string_view name) {
  if (name == "mainnet") {
    return NetworkParams::mainnet();
  }
  if (name == "testnet") {
    return NetworkParams::testnet();
  }
  return std::nullopt;
}

std::string base58_encode(std::span<const uint8_t> data) {
  size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) {
    ++zeros;
  }

  Bytes b58((data.size() - zeros) * 138 / 100 + 1, 0);
  for (size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    for (auto it = b58.rbegin(); it != b58.rend(); ++it) {
      carry += 256 * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
  }

  auto first = std::find_if(b58.begin(), b58.end(), [](uint8_t b) { return b != 0; });
  std::string out(zeros, '1');
  for (auto it = first; it != b58.end(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::string base58check_encode(std::span<const uint8_t> payload) {
  Bytes data(payload.begin(), payload.end());
  const Hash256 check = sha256d(payload);
  data.insert(data.end(), check.begin(), check.begin() + 4);
  return base58_encode(data);
}

Bytes base58check_decode(std::string_view text) {
  Bytes data = base58_decode(text);
  if (data.size() < 4) {
    throw AddressError("base58check payload too short");
  }
  const size_t body = data.size() - 4;
  const Hash256 check = sha256d(std::span<const uint8_t>(data.data(), body));
  if (!std::equal(check.begin(), check.begin() + 4, data.begin() + static_cast<Bytes::difference_type>(body))) {
    throw AddressError("base58check checksum mismatch");
  }
  data.resize(body);
  return data;
}

std::string segwit_encode(std::string_view hrp, uint8_t witness_version, std::span<const uint8_t> program) {
  if (witness_version > 16) {
    throw AddressError("witness version out of range");
  }
  Bytes data{witness_version};
  if (!convert_bits(program, 8, 5, true, &data)) {
    throw AddressError("witness program conversion failed");
  }

  Bytes values = bech32_hrp_expand(hrp);
  values.insert(values.end(), data.begin(), data.end());
  values.insert(values.end(), kChecksumChars, 0);
  const uint32_t mod = bech32_polymod(values) ^ (witness_version == 0 ? kBech32Const : kBech32mConst);

  std::string out(hrp);
  out.push_back('1');
  for (const uint8_t d : data) {
    out.push_back(kBech32Charset[d]);
  }
  for (size_t i = 0; i < kChecksumChars; ++i) {
    out.push_back(kBech32Charset[(mod >> (5 * (5 - i))) & 31U]);
  }
  return out;
}

WitnessProgram segwit_decode(std::string_view hrp, std::string_view address) {
  bool has_lower = false;
  bool has_upper = false;
  std::string lower;
  lower.reserve(address.size());
  for (const char c : address) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 33 || uc > 126) {
      throw AddressError("invalid bech32 character");
    }
    has_lower = has_lower || std::islower(uc) != 0;
    has_upper = has_upper || std::isupper(uc) != 0;
    lower.push_back(static_cast<char>(std::tolower(uc)));
  }
  if (has_lower && has_upper) {
    throw AddressError("mixed-case bech32 address");
  }

  const size_t sep = lower.rfind('1');
  if (sep == std::string::npos || sep == 0 || sep + 1 + kChecksumChars > lower.size() || lower.size() > 90) {
    throw AddressError("malformed bech32 address");
  }
  if (std::string_view(lower).substr(0, sep) != hrp) {
    throw AddressError("address belongs to another network");
  }

  Bytes data;
  for (size_t i = sep + 1; i < lower.size(); ++i) {
    const int d = bech32_digit(lower[i]);
    if (d < 0) {
      throw AddressError("invalid bech32 character");
    }
    data.push_back(static_cast<uint8_t>(d));
  }

  Bytes values = bech32_hrp_expand(hrp);
  values.insert(values.end(), data.begin(), data.end());
  const uint32_t check = bech32_polymod(values);
  data.resize(data.size() - kChecksumChars);
  if (data.empty()) {
    throw AddressError("empty witness data");
  }

  WitnessProgram out;
  out.version = data.front();
  const uint32_t expected = out.version == 0 ? kBech32Const : kBech32mConst;
  if (check != expected || out.version > 16) {
    throw AddressError("bech32 checksum mismatch");
  }
  if (!convert_bits(std::span<const uint8_t>(data.data() + 1, data.size() - 1), 5, 8, false, &out.program)) {
    throw AddressError("invalid witness program padding");
  }
  if (out.program.size() < 2 || out.program.size() > 40 ||
      (out.version == 0 && out.program.size() != 20 && out.program.size() != 32)) {
    throw AddressError("invalid witness program length");
  }
  return out;
}

std::string p2pkh_address(const PublicKey& pub, const NetworkParams& net) {
  const Hash160 h = hash160(pub);
  Bytes payload{net.p2pkh_prefix};
  payload.insert(payload.end(), h.begin(), h.end());
  return base58check_encode(payload);
}

std::string p2sh_p2wpkh_address(const PublicKey& pub, const NetworkParams& net) {
  const Hash160 key_hash = hash160(pub);
  Bytes redeem{OP_0, 0x14};
  redeem.insert(redeem.end(), key_hash.begin(), key_hash.end());

  const Hash160 script_hash = hash160(redeem);
  Bytes payload{net.p2sh_prefix};
  payload.insert(payload.end(), script_hash.begin(), script_hash.end());
  return base58check_encode(payload);
}

std::string p2wpkh_address(const PublicKey& pub, const NetworkParams& net) {
  const Hash160 h = hash160(pub);
  return segwit_encode(net.hrp, 0, h);
}

std::string p2tr_address(const XOnlyKey& output_key, const NetworkParams& net) {
  return segwit_encode(net.hrp, 1, output_key);
}

Bytes script_pubkey_for_address(std::string_view address, const NetworkParams& net) {
  if (starts_with_hrp(address, net.hrp)) {
    const WitnessProgram wp = segwit_decode(net.hrp, address);
    Bytes script;
    script.push_back(wp.version == 0 ? OP_0 : static_cast<uint8_t>(OP_1 + wp.version - 1));
    script.push_back(static_cast<uint8_t>(wp.program.size()));
    script.insert(script.end(), wp.program.begin(), wp.program.end());
    return script;
  }

  const Bytes payload = base58check_decode(address);
  if (payload.size() != 21) {
    throw AddressError("unexpected base58 payload length");
  }
  Bytes script;
  if (payload[0] == net.p2pkh_prefix) {
    script = {OP_DUP, OP_HASH160, 0x14};
    script.insert(script.end(), payload.begin() + 1, payload.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
  } else if (payload[0] == net.p2sh_prefix) {
    script = {OP_HASH160, 0x14};
    script.insert(script.end(), payload.begin() + 1, payload.end());
    script.push_back(OP_EQUAL);
  } else {
    throw AddressError("address version byte does not match network " + net.name);
  }
  return script;
}

} // namespace seedscan

#undef NDEBUG

#include "seedscan/address.hpp"
#include "seedscan/address_deriver.hpp"
#include "seedscan/balance_oracle.hpp"
#include "seedscan/checksum.hpp"
#include "seedscan/crypto.hpp"
#include "seedscan/hd_key.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace seedscan;

namespace {

const std::string kAbandonAbout =
  "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

template<typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

} // namespace

void test_bip32_vector() {
  std::cout << "Testing BIP32 test vector 1..." << std::endl;

  const Bytes seed = from_hex("000102030405060708090a0b0c0d0e0f");
  HdKeychain chain(seed);

  assert(to_hex(chain.master().secret) == "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
  assert(to_hex(chain.master().chain_code) == "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508");
  assert(to_hex(chain.public_key(chain.master())) == "0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2");

  const ExtendedKey hardened = chain.derive_child(chain.master(), kHardenedBit);
  assert(hardened.depth == 1);
  assert(to_hex(hardened.secret) == "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea");
  assert(to_hex(hardened.chain_code) == "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141");

  const ExtendedKey normal = chain.derive(parse_derivation_path("m/0'/1"));
  assert(normal.depth == 2);
  assert(to_hex(normal.secret) == "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368");
  assert(to_hex(normal.chain_code) == "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19");
  assert(to_hex(chain.public_key(normal)) == "03501e454bf00751f24b1b489aa925215d66af2234e3891c3b21a52bedb3cd711c");

  std::cout << "  PASS" << std::endl;
}

void test_derivation_path_parsing() {
  std::cout << "Testing derivation path parsing..." << std::endl;

  const auto path = parse_derivation_path("m/84'/0h/0H/0/1");
  assert(path.size() == 5);
  assert(path[0] == (84 | kHardenedBit));
  assert(path[1] == kHardenedBit);
  assert(path[2] == kHardenedBit);
  assert(path[3] == 0);
  assert(path[4] == 1);
  assert(format_derivation_path(path) == "m/84'/0'/0'/0/1");
  assert(parse_derivation_path("m").empty());

  assert(throws<KeyDerivationError>([] { (void)parse_derivation_path("84'/0'"); }));
  assert(throws<KeyDerivationError>([] { (void)parse_derivation_path("m/x"); }));
  assert(throws<KeyDerivationError>([] { (void)parse_derivation_path("m/2147483648"); }));

  std::cout << "  PASS" << std::endl;
}

void test_reference_addresses() {
  std::cout << "Testing reference addresses for abandon/about..." << std::endl;

  const AddressDeriver deriver(default_derivation_specs(0, 1), NetworkParams::mainnet());
  const auto table = deriver.derive(kAbandonAbout);
  assert(table.size() == 4);
  assert(deriver.addresses_per_mnemonic() == 4);

  assert(table[0].kind == AddressKind::LEGACY);
  assert(table[0].path == "m/44'/0'/0'/0/0");
  assert(table[0].address == "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");

  assert(table[1].kind == AddressKind::NESTED_SEGWIT);
  assert(table[1].path == "m/49'/0'/0'/0/0");
  assert(table[1].address == "37VucYSaXLCAsxYyAPfbSi9eh4iEcbShgf");

  assert(table[2].kind == AddressKind::NATIVE_SEGWIT);
  assert(table[2].path == "m/84'/0'/0'/0/0");
  assert(table[2].address == "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");

  assert(table[3].kind == AddressKind::TAPROOT);
  assert(table[3].path == "m/86'/0'/0'/0/0");
  assert(table[3].address == "bc1p5cyxnuxmeuwuvkwfem96lqzszd02n6xdcjrs20cac6yqjjwudpxqkedrcr");

  std::cout << "  PASS" << std::endl;
}

void test_default_table_order() {
  std::cout << "Testing default address table order..." << std::endl;

  const AddressDeriver deriver(default_derivation_specs(0, 3), NetworkParams::mainnet());
  const auto table = deriver.derive(kAbandonAbout);
  assert(table.size() == 12);
  assert(deriver.addresses_per_mnemonic() == 12);

  assert(table[0].index == 0 && table[1].index == 1 && table[2].index == 2);
  assert(table[1].kind == AddressKind::LEGACY);
  assert(table[1].address == "1Ak8PffB2meyfYnbXZR9EGfLfFZVpzJvQP");
  assert(table[4].address == "3LtMnn87fqUeHBUG414p9CWwnoV6E2pNKS");
  assert(table[7].address == "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g");
  assert(table[10].address == "bc1p4qhjn9zdvkux4e44uhx8tc55attvtyu358kutcqkudyccelu0was9fqzwh");
  assert(table[11].kind == AddressKind::TAPROOT && table[11].index == 2);

  // Same input, same table.
  const auto again = deriver.derive(kAbandonAbout);
  for (size_t i = 0; i < table.size(); ++i) {
    assert(table[i].address == again[i].address);
    assert(table[i].path == again[i].path);
  }

  std::cout << "  PASS" << std::endl;
}

void test_testnet_addresses() {
  std::cout << "Testing testnet addresses..." << std::endl;

  const AddressDeriver deriver(default_derivation_specs(0, 1), NetworkParams::testnet());
  const auto table = deriver.derive(kAbandonAbout);
  assert(table.size() == 4);
  assert(table[0].path == "m/44'/1'/0'/0/0");
  assert(table[0].address == "mkpZhYtJu2r87Js3pDiWJDmPte2NRZ8bJV");
  assert(table[1].address == "2Mww8dCYPUpKHofjgcXcBCEGmniw9CoaiD2");
  assert(table[2].address == "tb1q6rz28mcfaxtmd6v789l9rrlrusdprr9pqcpvkl");
  assert(table[3].address == "tb1p8wpt9v4frpf3tkn0srd97pksgsxc5hs52lafxwru9kgeephvs7rqlqt9zj");

  std::cout << "  PASS" << std::endl;
}

void test_invalid_mnemonic_rejected() {
  std::cout << "Testing deriver rejects invalid mnemonics..." << std::endl;

  const AddressDeriver deriver(default_derivation_specs(0, 1), NetworkParams::mainnet());
  assert(throws<MnemonicError>([&deriver] {
    (void)deriver.derive("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon");
  }));
  assert(throws<MnemonicError>([&deriver] { (void)deriver.keychain_for("abandon about"); }));

  std::cout << "  PASS" << std::endl;
}

void test_script_pubkeys() {
  std::cout << "Testing script_pubkey_for_address..." << std::endl;

  const auto main = NetworkParams::mainnet();
  assert(to_hex(script_pubkey_for_address("1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA", main)) ==
         "76a914d986ed01b7a22225a70edbf2ba7cfb63a15cb3aa88ac");
  assert(to_hex(script_pubkey_for_address("bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu", main)) ==
         "0014c0cebcd6c3d3ca8c75dc5ec62ebe55330ef910e2");

  const Bytes p2sh = script_pubkey_for_address("37VucYSaXLCAsxYyAPfbSi9eh4iEcbShgf", main);
  assert(p2sh.size() == 23 && p2sh.front() == 0xa9 && p2sh.back() == 0x87);

  const Bytes p2tr = script_pubkey_for_address("bc1p5cyxnuxmeuwuvkwfem96lqzszd02n6xdcjrs20cac6yqjjwudpxqkedrcr", main);
  assert(p2tr.size() == 34 && p2tr[0] == 0x51 && p2tr[1] == 0x20);

  assert(electrum_script_hash(script_pubkey_for_address("1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA", main)) ==
         "1e8750b8a4c0912d8b84f7eb53472cbdcb57f9e0cde263b2e51ecbe30853cd68");

  // Wrong network, broken checksum, bech32 checksum used for a v1 program.
  assert(throws<AddressError>([&main] { (void)script_pubkey_for_address("mkpZhYtJu2r87Js3pDiWJDmPte2NRZ8bJV", main); }));
  assert(throws<AddressError>([&main] { (void)script_pubkey_for_address("1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabB", main); }));
  assert(throws<AddressError>([&main] { (void)script_pubkey_for_address("bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyv", main); }));

  std::cout << "  PASS" << std::endl;
}

void test_segwit_roundtrip() {
  std::cout << "Testing segwit encode/decode..." << std::endl;

  const WitnessProgram wp = segwit_decode("bc", "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
  assert(wp.version == 0);
  assert(wp.program.size() == 20);
  assert(segwit_encode("bc", wp.version, wp.program) == "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");

  const WitnessProgram tr = segwit_decode("bc", "BC1P5CYXNUXMEUWUVKWFEM96LQZSZD02N6XDCJRS20CAC6YQJJWUDPXQKEDRCR");
  assert(tr.version == 1);
  assert(tr.program.size() == 32);

  assert(throws<AddressError>([] { (void)segwit_decode("bc", "bc1Qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu"); }));
  assert(throws<AddressError>([] { (void)segwit_decode("tb", "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu"); }));

  std::cout << "  PASS" << std::endl;
}

void test_base58() {
  std::cout << "Testing base58..." << std::endl;

  const Bytes zeros{0x00, 0x00, 0x01};
  assert(base58_encode(zeros) == "112");
  const Bytes payload = base58check_decode("1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");
  assert(payload.size() == 21 && payload[0] == 0x00);
  assert(base58check_encode(payload) == "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");
  assert(throws<AddressError>([] { (void)base58check_decode("0OIl"); }));

  std::cout << "  PASS" << std::endl;
}

int main() {
  std::cout << "=== Address Tests ===" << std::endl;

  test_bip32_vector();
  test_derivation_path_parsing();
  test_reference_addresses();
  test_default_table_order();
  test_testnet_addresses();
  test_invalid_mnemonic_rejected();
  test_script_pubkeys();
  test_segwit_roundtrip();
  test_base58();

  std::cout << std::endl << "All address tests passed" << std::endl;
  return 0;
}

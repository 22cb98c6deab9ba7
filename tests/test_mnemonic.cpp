#undef NDEBUG

#include "seedscan/checksum.hpp"
#include "seedscan/crypto.hpp"
#include "seedscan/hd_key.hpp"
#include "seedscan/wordlist.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace seedscan;

namespace {

std::vector<std::string> repeat(const std::string& word, size_t n) {
  return std::vector<std::string>(n, word);
}

bool contains(const std::vector<std::string>& words, const std::string& word) {
  return std::find(words.begin(), words.end(), word) != words.end();
}

template<typename Fn>
bool throws_mnemonic_error(Fn&& fn) {
  try {
    fn();
  } catch (const MnemonicError&) {
    return true;
  }
  return false;
}

} // namespace

void test_wordlist() {
  std::cout << "Testing wordlist..." << std::endl;

  assert(english_wordlist().size() == 2048);
  assert(word_at(0) == "abandon");
  assert(word_at(3) == "about");
  assert(word_at(2047) == "zoo");
  assert(word_index("zoo").value() == 2047);
  assert(!word_index("zzz").has_value());
  assert(is_dictionary_word("yellow"));
  assert(!is_dictionary_word("Yellow"));

  std::cout << "  PASS" << std::endl;
}

void test_valid_last_words_abandon() {
  std::cout << "Testing valid last words for abandon x11..." << std::endl;

  const auto words = find_valid_last_words(repeat("abandon", 11));
  assert(words.size() == 128);
  assert(contains(words, "about"));
  assert(!contains(words, "abandon"));
  assert(words[0] == "about");
  assert(words[1] == "actual");
  assert(words[2] == "age");
  assert(words[3] == "alpha");
  assert(words[4] == "angle");
  assert(std::is_sorted(words.begin(), words.end(), [](const std::string& a, const std::string& b) {
    return *word_index(a) < *word_index(b);
  }));

  std::cout << "  PASS" << std::endl;
}

void test_valid_last_words_legal_winner() {
  std::cout << "Testing valid last words for legal winner prefix..." << std::endl;

  const auto prefix = split_words("legal winner thank year wave sausage worth useful legal winner thank");
  assert(prefix.size() == 11);
  const auto words = find_valid_last_words(prefix);
  assert(words.size() == 128);
  assert(contains(words, "yellow"));

  for (const auto& word : words) {
    auto full = prefix;
    full.push_back(word);
    assert(validate_mnemonic(full));
  }

  std::cout << "  PASS" << std::endl;
}

void test_valid_last_words_errors() {
  std::cout << "Testing valid last words rejects bad prefixes..." << std::endl;

  assert(throws_mnemonic_error([] { (void)find_valid_last_words(repeat("abandon", 10)); }));
  assert(throws_mnemonic_error([] { (void)find_valid_last_words(repeat("abandon", 12)); }));
  auto prefix = repeat("abandon", 11);
  prefix[5] = "notaword";
  assert(throws_mnemonic_error([&prefix] { (void)find_valid_last_words(prefix); }));

  std::cout << "  PASS" << std::endl;
}

void test_validate_mnemonic() {
  std::cout << "Testing validate_mnemonic..." << std::endl;

  assert(validate_mnemonic("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about"));
  assert(!validate_mnemonic("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon"));
  assert(!validate_mnemonic("abandon abandon abandon"));
  assert(!validate_mnemonic("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abou"));
  assert(validate_mnemonic("zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo wrong"));

  std::cout << "  PASS" << std::endl;
}

void test_entropy_vectors() {
  std::cout << "Testing entropy <-> mnemonic vectors..." << std::endl;

  Entropy zero{};
  assert(join_words(entropy_to_mnemonic(zero)) ==
         "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about");

  Entropy sevens{};
  sevens.fill(0x7f);
  assert(join_words(entropy_to_mnemonic(sevens)) ==
         "legal winner thank year wave sausage worth useful legal winner thank yellow");

  Entropy ones{};
  ones.fill(0xff);
  const auto zoo = entropy_to_mnemonic(ones);
  assert(zoo.back() == "wrong");
  assert(mnemonic_entropy(zoo) == ones);

  assert(throws_mnemonic_error([] { (void)mnemonic_entropy(repeat("abandon", 12)); }));

  std::cout << "  PASS" << std::endl;
}

void test_split_join() {
  std::cout << "Testing split_words/join_words..." << std::endl;

  const auto words = split_words("  alpha\tbeta \n gamma  ");
  assert(words.size() == 3);
  assert(words[0] == "alpha");
  assert(words[2] == "gamma");
  assert(join_words(words) == "alpha beta gamma");
  assert(split_words("").empty());

  std::cout << "  PASS" << std::endl;
}

void test_digests() {
  std::cout << "Testing digests..." << std::endl;

  assert(to_hex(sha256(std::string_view("abc"))) ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(short_digest("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about") ==
         "c557eec8");
  assert(short_digest("x").size() == 8);

  const Bytes raw = from_hex("00ff10");
  assert(raw.size() == 3 && raw[1] == 0xff);
  assert(to_hex(raw) == "00ff10");

  bool rejected = false;
  try {
    (void)from_hex("abc");
  } catch (const CryptoError&) {
    rejected = true;
  }
  assert(rejected);

  std::cout << "  PASS" << std::endl;
}

void test_mnemonic_to_seed() {
  std::cout << "Testing mnemonic_to_seed..." << std::endl;

  const std::string phrase =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";
  assert(to_hex(mnemonic_to_seed(phrase, "TREZOR")) ==
         "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
  assert(mnemonic_to_seed(phrase) != mnemonic_to_seed(phrase, "TREZOR"));

  std::cout << "  PASS" << std::endl;
}

int main() {
  std::cout << "=== Mnemonic Tests ===" << std::endl;

  test_wordlist();
  test_valid_last_words_abandon();
  test_valid_last_words_legal_winner();
  test_valid_last_words_errors();
  test_validate_mnemonic();
  test_entropy_vectors();
  test_split_join();
  test_digests();
  test_mnemonic_to_seed();

  std::cout << std::endl << "All mnemonic tests passed" << std::endl;
  return 0;
}

#include "seedscan/checksum.hpp"

#include "seedscan/crypto.hpp"
#include "seedscan/wordlist.hpp"

#include <algorithm>
#include <cctype>

namespace seedscan {

namespace {

constexpr size_t kBitsPerWord = 11;
constexpr size_t kEntropyBits = kEntropyBytes * 8;
constexpr size_t kChecksumBits = kEntropyBits / 32;

// 12 words x 11 bits = 132 bits: 128 entropy bits followed by the checksum nibble.
using PackedMnemonic = std::array<uint8_t, kEntropyBytes + 1>;

void put_bits(PackedMnemonic& buf, size_t offset, uint32_t value, size_t width) {
  for (size_t i = 0; i < width; ++i) {
    const size_t pos = offset + i;
    const uint8_t mask = static_cast<uint8_t>(0x80U >> (pos % 8));
    if (((value >> (width - 1 - i)) & 1U) != 0) {
      buf[pos / 8] |= mask;
    } else {
      buf[pos / 8] &= static_cast<uint8_t>(~mask);
    }
  }
}

uint32_t get_bits(const PackedMnemonic& buf, size_t offset, size_t width) {
  uint32_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    const size_t pos = offset + i;
    value = (value << 1U) | ((buf[pos / 8] >> (7 - pos % 8)) & 1U);
  }
  return value;
}

uint8_t checksum_nibble(const PackedMnemonic& buf) {
  const auto digest = sha256(std::span<const uint8_t>(buf.data(), kEntropyBytes));
  return static_cast<uint8_t>(digest[0] >> (8 - kChecksumBits));
}

uint8_t embedded_checksum(const PackedMnemonic& buf) {
  return static_cast<uint8_t>(get_bits(buf, kEntropyBits, kChecksumBits));
}

uint16_t require_index(const std::string& word) {
  const auto index = word_index(word);
  if (!index.has_value()) {
    throw MnemonicError("word is not in the BIP39 dictionary: '" + word + "'");
  }
  return *index;
}

PackedMnemonic pack_words(const std::vector<std::string>& words) {
  PackedMnemonic buf{};
  for (size_t i = 0; i < words.size(); ++i) {
    put_bits(buf, i * kBitsPerWord, require_index(words[i]), kBitsPerWord);
  }
  return buf;
}

} // namespace

std::vector<std::string> find_valid_last_words(const std::vector<std::string>& prefix) {
  if (prefix.size() != kPrefixWords) {
    throw MnemonicError(
      "checksum enumeration needs exactly " + std::to_string(kPrefixWords) +
      " words, got " + std::to_string(prefix.size()));
  }

  PackedMnemonic buf = pack_words(prefix);
  const size_t last_offset = kPrefixWords * kBitsPerWord;

  std::vector<std::string> valid;
  valid.reserve(kWordlistSize / kLastWordBranching);

  // Candidates sharing the top 7 bits share entropy, so the digest is reused
  // across each run of 16 consecutive indices.
  uint8_t expected = 0;
  for (uint32_t candidate = 0; candidate < kWordlistSize; ++candidate) {
    put_bits(buf, last_offset, candidate, kBitsPerWord);
    if (candidate % kLastWordBranching == 0) {
      expected = checksum_nibble(buf);
    }
    if (embedded_checksum(buf) == expected) {
      valid.emplace_back(word_at(static_cast<uint16_t>(candidate)));
    }
  }
  return valid;
}

bool validate_mnemonic(const std::vector<std::string>& words) {
  if (words.size() != kMnemonicWords) {
    return false;
  }
  for (const auto& word : words) {
    if (!is_dictionary_word(word)) {
      return false;
    }
  }
  const PackedMnemonic buf = pack_words(words);
  return embedded_checksum(buf) == checksum_nibble(buf);
}

bool validate_mnemonic(std::string_view phrase) {
  return validate_mnemonic(split_words(phrase));
}

Entropy mnemonic_entropy(const std::vector<std::string>& words) {
  if (words.size() != kMnemonicWords) {
    throw MnemonicError("mnemonic must have " + std::to_string(kMnemonicWords) + " words");
  }
  const PackedMnemonic buf = pack_words(words);
  if (embedded_checksum(buf) != checksum_nibble(buf)) {
    throw MnemonicError("mnemonic checksum mismatch");
  }
  Entropy entropy{};
  std::copy(buf.begin(), buf.begin() + kEntropyBytes, entropy.begin());
  return entropy;
}

std::vector<std::string> entropy_to_mnemonic(const Entropy& entropy) {
  PackedMnemonic buf{};
  std::copy(entropy.begin(), entropy.end(), buf.begin());
  put_bits(buf, kEntropyBits, checksum_nibble(buf), kChecksumBits);

  std::vector<std::string> words;
  words.reserve(kMnemonicWords);
  for (size_t i = 0; i < kMnemonicWords; ++i) {
    words.emplace_back(word_at(static_cast<uint16_t>(get_bits(buf, i * kBitsPerWord, kBitsPerWord))));
  }
  return words;
}

std::vector<std::string> split_words(std::string_view phrase) {
  std::vector<std::string> words;
  std::string current;
  for (const char c : phrase) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::string join_words(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(word);
  }
  return out;
}

} // namespace seedscan

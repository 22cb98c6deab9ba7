#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

constexpr size_t kMnemonicWords = 12;
constexpr size_t kPrefixWords = kMnemonicWords - 1;
constexpr size_t kEntropyBytes = 16;
constexpr uint32_t kLastWordBranching = 16;

using Entropy = std::array<uint8_t, kEntropyBytes>;

class MnemonicError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Every dictionary word that completes the 11-word prefix into a mnemonic
// whose embedded checksum matches sha256(entropy)[0] >> 4. Dictionary order.
std::vector<std::string> find_valid_last_words(const std::vector<std::string>& prefix);

bool validate_mnemonic(const std::vector<std::string>& words);
bool validate_mnemonic(std::string_view phrase);

Entropy mnemonic_entropy(const std::vector<std::string>& words);
std::vector<std::string> entropy_to_mnemonic(const Entropy& entropy);

std::vector<std::string> split_words(std::string_view phrase);
std::string join_words(const std::vector<std::string>& words);

} // namespace seedscan

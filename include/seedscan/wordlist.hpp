#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace seedscan {

constexpr size_t kWordlistSize = 2048;

const std::array<const char*, kWordlistSize>& english_wordlist();
std::string_view word_at(uint16_t index);
std::optional<uint16_t> word_index(std::string_view word);
bool is_dictionary_word(std::string_view word);

} // namespace seedscan

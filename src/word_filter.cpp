#include "seedscan/word_filter.hpp"

#include "seedscan/wordlist.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace seedscan {

namespace {

struct PatternSuffixes {
  std::string_view pattern;
  std::array<std::string_view, 8> suffixes;
};

constexpr std::array<PatternSuffixes, 5> kPatternSuffixes{{
  {"noun", {"tion", "ness", "ment", "ity", "er", "or", "ist", "age"}},
  {"verb", {"ate", "ify", "ize", "en", "ing", "ed"}},
  {"adjective", {"ful", "less", "ous", "ive", "able", "ible", "al", "ic"}},
  {"past_participle", {"ed", "en"}},
  {"plural_noun", {"s", "es", "ies"}},
}};

constexpr size_t kStemLength = 4;

bool is_vowel(char c) {
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

std::string lower_copy(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

const PatternSuffixes* find_pattern(std::string_view pattern) {
  for (const auto& entry : kPatternSuffixes) {
    if (entry.pattern == pattern) {
      return &entry;
    }
  }
  return nullptr;
}

bool full_rhyme(std::string_view a, std::string_view b) {
  if (a.size() < 2 || b.size() < 2) {
    return false;
  }
  if (a.size() >= 3 && b.size() >= 3 && a.substr(a.size() - 3) == b.substr(b.size() - 3)) {
    return true;
  }
  return a.substr(a.size() - 2) == b.substr(b.size() - 2);
}

char last_vowel(std::string_view word) {
  for (auto it = word.rbegin(); it != word.rend(); ++it) {
    if (is_vowel(*it)) {
      return *it;
    }
  }
  return '\0';
}

bool partial_rhyme(std::string_view a, std::string_view b) {
  if (a.size() < 2 || b.size() < 2) {
    return false;
  }
  const char va = last_vowel(a);
  return va != '\0' && va == last_vowel(b);
}

bool semantically_related(std::string_view word, std::string_view tag) {
  if (word == tag) {
    return true;
  }
  if (word.size() >= kStemLength && tag.find(word) != std::string_view::npos) {
    return true;
  }
  if (tag.size() >= kStemLength && word.find(tag) != std::string_view::npos) {
    return true;
  }
  return word.size() >= kStemLength && tag.size() >= kStemLength &&
         word.substr(0, kStemLength) == tag.substr(0, kStemLength);
}

uint32_t abs_diff(uint32_t a, uint32_t b) {
  return a > b ? a - b : b - a;
}

bool has_scoring_facet(const PositionConstraint& c) {
  return c.length > 0 || c.syllables > 0 || !c.rhyme_with.empty() ||
         !c.semantic_tags.empty() || known_pattern(c.pattern);
}

} // namespace

uint32_t count_syllables(std::string_view word) {
  const std::string w = lower_copy(word);
  uint32_t groups = 0;
  bool in_group = false;
  for (const char c : w) {
    const bool vowel = is_vowel(c) || c == 'y';
    if (vowel && !in_group) {
      ++groups;
    }
    in_group = vowel;
  }
  // Silent trailing 'e' ("face", "globe"), but not "-le" after a consonant ("able").
  if (groups > 1 && ends_with(w, "e") && !ends_with(w, "ee")) {
    const bool consonant_le = w.size() >= 3 && ends_with(w, "le") && !is_vowel(w[w.size() - 3]);
    if (!consonant_le) {
      --groups;
    }
  }
  return std::max<uint32_t>(1U, groups);
}

bool known_pattern(std::string_view pattern) {
  return find_pattern(pattern) != nullptr;
}

bool matches_pattern(std::string_view word, std::string_view pattern) {
  const auto* entry = find_pattern(pattern);
  if (entry == nullptr) {
    return true;
  }
  for (const auto suffix : entry->suffixes) {
    if (!suffix.empty() && ends_with(word, suffix)) {
      return true;
    }
  }
  return false;
}

WordCandidateFilter::WordCandidateFilter(FilterWeights weights)
  : weights_(weights) {
}

double WordCandidateFilter::match_score(std::string_view word, const PositionConstraint& constraint) const {
  double score = 0.0;
  double max_score = 0.0;

  if (constraint.length > 0) {
    max_score += weights_.length;
    const uint32_t diff = abs_diff(static_cast<uint32_t>(word.size()), constraint.length);
    if (diff == 0) {
      score += weights_.length;
    } else if (diff <= weights_.length_tolerance) {
      score += weights_.length * 2.0 / 3.0;
    } else if (diff <= weights_.length_tolerance + 1) {
      score += weights_.length / 3.0;
    }
  }

  if (constraint.syllables > 0) {
    max_score += weights_.syllables;
    const uint32_t diff = abs_diff(count_syllables(word), constraint.syllables);
    if (diff == 0) {
      score += weights_.syllables;
    } else if (diff == 1) {
      score += weights_.syllables / 2.0;
    }
  }

  if (!constraint.rhyme_with.empty()) {
    max_score += weights_.rhyme;
    const std::string target = lower_copy(constraint.rhyme_with);
    if (full_rhyme(word, target)) {
      score += weights_.rhyme;
    } else if (partial_rhyme(word, target)) {
      score += weights_.rhyme / 2.0;
    }
  }

  if (known_pattern(constraint.pattern)) {
    max_score += weights_.pattern;
    if (matches_pattern(word, constraint.pattern)) {
      score += weights_.pattern;
    }
  }

  if (!constraint.semantic_tags.empty()) {
    max_score += weights_.semantic;
    size_t related = 0;
    for (const auto& tag : constraint.semantic_tags) {
      if (semantically_related(word, lower_copy(tag))) {
        ++related;
      }
    }
    score += weights_.semantic * static_cast<double>(related) / static_cast<double>(constraint.semantic_tags.size());
  }

  if (max_score <= 0.0) {
    return -1.0;
  }
  return score / max_score;
}

std::vector<FilteredWord> WordCandidateFilter::filter(const PositionConstraint& constraint) const {
  const auto& dictionary = english_wordlist();
  std::vector<FilteredWord> out;

  if (!has_scoring_facet(constraint)) {
    out.reserve(dictionary.size());
    for (const char* word : dictionary) {
      out.push_back(FilteredWord{word, weights_.empty_constraint_score});
    }
    return out;
  }

  for (const char* word : dictionary) {
    const double ratio = match_score(word, constraint);
    if (ratio >= weights_.threshold) {
      out.push_back(FilteredWord{word, ratio});
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const FilteredWord& a, const FilteredWord& b) {
    return a.match_score > b.match_score;
  });
  return out;
}

std::vector<std::string> WordCandidateFilter::filter_last_words(
  const std::vector<std::string>& words,
  const PositionConstraint& constraint) const {

  const std::string rhyme = lower_copy(constraint.rhyme_with);
  std::vector<std::string> kept;
  for (const auto& word : words) {
    if (constraint.length > 0 && abs_diff(static_cast<uint32_t>(word.size()), constraint.length) > 1) {
      continue;
    }
    if (constraint.syllables > 0 && abs_diff(count_syllables(word), constraint.syllables) > 1) {
      continue;
    }
    if (rhyme.size() >= 2 && (word.size() < 2 || !ends_with(word, std::string_view(rhyme).substr(rhyme.size() - 2)))) {
      continue;
    }
    kept.push_back(word);
  }
  return kept.empty() ? words : kept;
}

std::vector<std::string> WordCandidateFilter::top_k(const std::vector<FilteredWord>& words, size_t k) {
  std::vector<std::string> out;
  const size_t n = std::min(k, words.size());
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(words[i].word);
  }
  return out;
}

} // namespace seedscan

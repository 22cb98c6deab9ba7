#pragma once

#include "seedscan/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

// Facet weights for the per-position match score. The score of a word is the
// weighted sum of facet matches divided by the total weight of the facets the
// constraint actually sets.
struct FilterWeights {
  double length = 3.0;
  double syllables = 2.0;
  double pattern = 1.0;
  double semantic = 1.0;
  double rhyme = 2.0;
  double threshold = 0.2;
  uint32_t length_tolerance = 1;
  double empty_constraint_score = 0.05;
};

struct FilteredWord {
  std::string word;
  double match_score = 0.0;
};

uint32_t count_syllables(std::string_view word);
bool matches_pattern(std::string_view word, std::string_view pattern);
bool known_pattern(std::string_view pattern);

class WordCandidateFilter {
public:
  explicit WordCandidateFilter(FilterWeights weights = {});

  // Dictionary words scoring at or above the threshold, best first, ties in
  // dictionary order. An empty constraint yields the whole dictionary.
  std::vector<FilteredWord> filter(const PositionConstraint& constraint) const;
  double match_score(std::string_view word, const PositionConstraint& constraint) const;

  // Narrows checksum-valid last words by length, syllables and rhyme. Returns
  // the input unchanged when nothing would survive.
  std::vector<std::string> filter_last_words(
    const std::vector<std::string>& words,
    const PositionConstraint& constraint) const;

  static std::vector<std::string> top_k(const std::vector<FilteredWord>& words, size_t k);

  const FilterWeights& weights() const { return weights_; }

private:
  FilterWeights weights_;
};

} // namespace seedscan

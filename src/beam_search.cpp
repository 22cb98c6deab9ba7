#include "seedscan/beam_search.hpp"

#include "seedscan/checksum.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace seedscan {

namespace {

constexpr uint32_t kLastPosition = static_cast<uint32_t>(kMnemonicWords);

bool higher_score(const PartialMnemonic& a, const PartialMnemonic& b) {
  return a.score > b.score;
}

} // namespace

BeamSearchEngine::BeamSearchEngine(int64_t beam_width, PositionScores scores)
  : scores_(std::move(scores)) {
  if (beam_width <= 0) {
    throw SearchConfigError("beam width must be positive");
  }
  beam_width_ = static_cast<uint32_t>(std::min<int64_t>(beam_width, std::numeric_limits<uint32_t>::max()));
}

void BeamSearchEngine::set_last_word_constraint(PositionConstraint constraint, WordCandidateFilter filter) {
  last_word_constraint_ = std::move(constraint);
  last_word_filter_ = filter;
}

void BeamSearchEngine::set_step_observer(StepObserver observer) {
  observer_ = std::move(observer);
}

double BeamSearchEngine::word_score(uint32_t position, std::string_view word) const {
  const auto pos_it = scores_.find(position);
  if (pos_it == scores_.end()) {
    return kUnscoredWordScore;
  }
  const auto word_it = pos_it->second.find(word);
  return word_it == pos_it->second.end() ? kUnscoredWordScore : word_it->second;
}

std::vector<PartialMnemonic> BeamSearchEngine::expand(
  const std::vector<PartialMnemonic>& beam,
  const std::vector<std::string>& candidates,
  uint32_t position) const {

  std::vector<PartialMnemonic> next;
  next.reserve(beam.size() * candidates.size());

  for (const auto& state : beam) {
    for (const auto& word : candidates) {
      PartialMnemonic child;
      child.words = state.words;
      child.words.push_back(word);
      child.depth = state.depth + 1;
      child.score = (state.score * state.depth + word_score(position, word)) / child.depth;
      next.push_back(std::move(child));
    }
  }

  const size_t expanded = next.size();
  // stable_sort keeps generation order among equal scores, so the cut is deterministic.
  std::stable_sort(next.begin(), next.end(), higher_score);
  if (next.size() > beam_width_) {
    next.resize(beam_width_);
  }

  if (observer_) {
    BeamStepStats stats;
    stats.position = position;
    stats.expanded = expanded;
    stats.retained = next.size();
    stats.best_score = next.empty() ? 0.0 : next.front().score;
    stats.cutoff_score = next.empty() ? 0.0 : next.back().score;
    observer_(stats, next);
  }
  return next;
}

std::vector<RankedMnemonic> BeamSearchEngine::search(const CandidateLists& candidates, int64_t max_results) const {
  if (max_results <= 0) {
    throw SearchConfigError("max results must be positive");
  }

  for (uint32_t position = 1; position < kLastPosition; ++position) {
    const auto it = candidates.find(position);
    if (it == candidates.end() || it->second.empty()) {
      throw SearchConfigError("no candidates for position " + std::to_string(position));
    }
  }

  std::vector<PartialMnemonic> beam(1);
  for (uint32_t position = 1; position < kLastPosition; ++position) {
    beam = expand(beam, candidates.at(position), position);
  }

  std::vector<RankedMnemonic> results;
  std::unordered_set<std::string> seen;
  const double prefix_weight = static_cast<double>(kPrefixWords);

  for (const auto& state : beam) {
    std::vector<std::string> last_words = find_valid_last_words(state.words);
    if (last_word_constraint_.has_value()) {
      last_words = last_word_filter_.filter_last_words(last_words, *last_word_constraint_);
    }

    std::vector<std::string> words = state.words;
    words.emplace_back();
    for (const auto& last : last_words) {
      words.back() = last;
      std::string phrase = join_words(words);
      if (!seen.insert(phrase).second) {
        continue;
      }
      const double combined =
        (state.score * prefix_weight + word_score(kLastPosition, last)) / static_cast<double>(kMnemonicWords);
      results.push_back(RankedMnemonic{std::move(phrase), combined});
    }
  }

  std::stable_sort(results.begin(), results.end(), [](const RankedMnemonic& a, const RankedMnemonic& b) {
    return a.score > b.score;
  });
  if (results.size() > static_cast<size_t>(max_results)) {
    results.resize(static_cast<size_t>(max_results));
  }
  return results;
}

double BeamSearchEngine::search_space_size(const CandidateLists& candidates) {
  double size = 1.0;
  for (uint32_t position = 1; position < kLastPosition; ++position) {
    const auto it = candidates.find(position);
    size *= it == candidates.end() ? 0.0 : static_cast<double>(it->second.size());
  }
  return size * static_cast<double>(kLastWordBranching);
}

} // namespace seedscan

#include "seedscan/word_scorer.hpp"

#include "seedscan/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace seedscan {

namespace {

constexpr double kFallbackStep = 0.01;

} // namespace

std::vector<ScoredWord> FallbackWordScorer::score(
  const PositionConstraint&,
  const std::vector<std::string>& candidates) {

  std::vector<ScoredWord> out;
  out.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    const double s = std::max(kUnscoredWordScore, 1.0 - static_cast<double>(i) * kFallbackStep);
    out.push_back(ScoredWord{candidates[i], s, "fallback ordering"});
  }
  return out;
}

FileWordScorer::FileWordScorer(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to read word scores file: " + path.string());
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  const JsonValue root = parse_json(text);

  const auto* positions = root.find("positions");
  if (positions == nullptr || !positions->is_object()) {
    throw std::runtime_error("word scores file must contain a 'positions' object");
  }

  for (const auto& [key, list] : positions->as_object()) {
    uint32_t position = 0;
    try {
      position = static_cast<uint32_t>(std::stoul(key));
    } catch (const std::exception&) {
      throw std::runtime_error("word scores position key is not a number: '" + key + "'");
    }

    auto& scored = positions_[position];
    for (const auto& entry : list.as_array()) {
      ScoredWord word;
      word.word = entry.string_or("word", "");
      word.score = std::clamp(entry.double_or("score", kUnscoredWordScore), 0.0, 1.0);
      word.rationale = entry.string_or("reason", "");
      if (!word.word.empty()) {
        scored.push_back(std::move(word));
      }
    }
  }
}

std::vector<ScoredWord> FileWordScorer::score(
  const PositionConstraint& constraint,
  const std::vector<std::string>& candidates) {

  const auto it = positions_.find(constraint.position);
  if (it == positions_.end()) {
    throw std::runtime_error("no stored scores for position " + std::to_string(constraint.position));
  }

  const std::set<std::string, std::less<>> allowed(candidates.begin(), candidates.end());
  std::vector<ScoredWord> out;
  for (const auto& word : it->second) {
    if (allowed.count(word.word) != 0) {
      out.push_back(word);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const ScoredWord& a, const ScoredWord& b) {
    return a.score > b.score;
  });
  return out;
}

std::vector<ScoredWord> score_with_fallback(
  WordScorer& scorer,
  const PositionConstraint& constraint,
  const std::vector<std::string>& candidates,
  RuntimeLog& log) {

  FallbackWordScorer fallback;
  try {
    auto scored = scorer.score(constraint, candidates);
    if (!scored.empty() || candidates.empty()) {
      return scored;
    }
    log.warn("Scorer returned nothing for position " + std::to_string(constraint.position) + ", using fallback ordering");
  } catch (const std::exception& ex) {
    log.warn("Scorer failed for position " + std::to_string(constraint.position) + ": " + ex.what() +
             "; using fallback ordering");
  }
  return fallback.score(constraint, candidates);
}

WordScoreMap to_score_map(const std::vector<ScoredWord>& scored) {
  WordScoreMap map;
  for (const auto& word : scored) {
    map.emplace(word.word, word.score);
  }
  return map;
}

} // namespace seedscan

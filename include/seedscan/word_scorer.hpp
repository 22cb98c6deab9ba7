#pragma once

#include "seedscan/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace seedscan {

class RuntimeLog;

class WordScorer {
public:
  virtual ~WordScorer() = default;

  // Ranked (word, score, rationale) for the given candidates, best first.
  virtual std::vector<ScoredWord> score(
    const PositionConstraint& constraint,
    const std::vector<std::string>& candidates) = 0;
};

// Uniform descending scores in candidate order.
class FallbackWordScorer : public WordScorer {
public:
  std::vector<ScoredWord> score(
    const PositionConstraint& constraint,
    const std::vector<std::string>& candidates) override;
};

// Scores produced offline by a linguistic model and stored as JSON:
// {"positions": {"1": [{"word": "...", "score": 0.9, "reason": "..."}]}}
class FileWordScorer : public WordScorer {
public:
  explicit FileWordScorer(const std::filesystem::path& path);

  std::vector<ScoredWord> score(
    const PositionConstraint& constraint,
    const std::vector<std::string>& candidates) override;

  size_t position_count() const { return positions_.size(); }

private:
  std::map<uint32_t, std::vector<ScoredWord>> positions_;
};

// Runs the scorer and degrades to FallbackWordScorer when it throws or
// returns nothing for a non-empty candidate list.
std::vector<ScoredWord> score_with_fallback(
  WordScorer& scorer,
  const PositionConstraint& constraint,
  const std::vector<std::string>& candidates,
  RuntimeLog& log);

WordScoreMap to_score_map(const std::vector<ScoredWord>& scored);

} // namespace seedscan

#pragma once

#include "seedscan/types.hpp"
#include "seedscan/word_filter.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

class SearchConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct BeamStepStats {
  uint32_t position = 0;
  size_t expanded = 0;
  size_t retained = 0;
  double best_score = 0.0;
  double cutoff_score = 0.0;
};

class BeamSearchEngine {
public:
  using StepObserver = std::function<void(const BeamStepStats&, const std::vector<PartialMnemonic>&)>;

  BeamSearchEngine(int64_t beam_width, PositionScores scores);

  // Optional position-12 narrowing of checksum-valid last words.
  void set_last_word_constraint(PositionConstraint constraint, WordCandidateFilter filter);
  void set_step_observer(StepObserver observer);

  std::vector<RankedMnemonic> search(const CandidateLists& candidates, int64_t max_results) const;

  // One expansion plus pruning step for `position`.
  std::vector<PartialMnemonic> expand(
    const std::vector<PartialMnemonic>& beam,
    const std::vector<std::string>& candidates,
    uint32_t position) const;

  double word_score(uint32_t position, std::string_view word) const;
  uint32_t beam_width() const { return beam_width_; }

  static double search_space_size(const CandidateLists& candidates);

private:
  uint32_t beam_width_ = 0;
  PositionScores scores_;
  std::optional<PositionConstraint> last_word_constraint_;
  WordCandidateFilter last_word_filter_;
  StepObserver observer_;
};

} // namespace seedscan

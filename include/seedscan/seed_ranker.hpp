#pragma once

#include "seedscan/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace seedscan {

struct RankedSeed {
  std::string mnemonic;
  double total_score = 0.0;
  std::vector<double> word_scores;
  uint32_t rank = 0;
};

struct ScoreStatistics {
  size_t count = 0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double median = 0.0;
};

class SeedRanker {
public:
  explicit SeedRanker(PositionScores scores);

  // Recomputes each mnemonic's score from the per-position maps (mean of the
  // twelve word scores) and orders best first with ranks starting at 1.
  std::vector<RankedSeed> rank(const std::vector<std::string>& mnemonics) const;
  std::vector<RankedSeed> rank(const std::vector<RankedMnemonic>& mnemonics) const;

  static std::vector<VerificationTask> to_tasks(const std::vector<RankedSeed>& ranked);
  static std::vector<RankedSeed> filter_by_threshold(const std::vector<RankedSeed>& ranked, double min_score);
  static ScoreStatistics statistics(const std::vector<RankedSeed>& ranked);

private:
  PositionScores scores_;
};

} // namespace seedscan

#include "seedscan/seed_ranker.hpp"

#include "seedscan/checksum.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace seedscan {

SeedRanker::SeedRanker(PositionScores scores)
  : scores_(std::move(scores)) {
}

std::vector<RankedSeed> SeedRanker::rank(const std::vector<std::string>& mnemonics) const {
  std::vector<RankedSeed> ranked;
  ranked.reserve(mnemonics.size());

  for (const auto& mnemonic : mnemonics) {
    RankedSeed seed;
    seed.mnemonic = mnemonic;
    const auto words = split_words(mnemonic);
    seed.word_scores.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
      double s = kUnscoredWordScore;
      if (const auto pos = scores_.find(static_cast<uint32_t>(i + 1)); pos != scores_.end()) {
        if (const auto it = pos->second.find(words[i]); it != pos->second.end()) {
          s = it->second;
        }
      }
      seed.word_scores.push_back(s);
    }
    seed.total_score = seed.word_scores.empty()
      ? 0.0
      : std::accumulate(seed.word_scores.begin(), seed.word_scores.end(), 0.0) /
          static_cast<double>(seed.word_scores.size());
    ranked.push_back(std::move(seed));
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedSeed& a, const RankedSeed& b) {
    return a.total_score > b.total_score;
  });
  for (size_t i = 0; i < ranked.size(); ++i) {
    ranked[i].rank = static_cast<uint32_t>(i + 1);
  }
  return ranked;
}

std::vector<RankedSeed> SeedRanker::rank(const std::vector<RankedMnemonic>& mnemonics) const {
  std::vector<std::string> phrases;
  phrases.reserve(mnemonics.size());
  for (const auto& m : mnemonics) {
    phrases.push_back(m.phrase);
  }
  return rank(phrases);
}

std::vector<VerificationTask> SeedRanker::to_tasks(const std::vector<RankedSeed>& ranked) {
  std::vector<VerificationTask> tasks;
  tasks.reserve(ranked.size());
  for (const auto& seed : ranked) {
    tasks.emplace_back(seed.mnemonic, seed.total_score, seed.rank);
  }
  return tasks;
}

std::vector<RankedSeed> SeedRanker::filter_by_threshold(const std::vector<RankedSeed>& ranked, double min_score) {
  std::vector<RankedSeed> out;
  std::copy_if(ranked.begin(), ranked.end(), std::back_inserter(out), [min_score](const RankedSeed& s) {
    return s.total_score >= min_score;
  });
  return out;
}

ScoreStatistics SeedRanker::statistics(const std::vector<RankedSeed>& ranked) {
  ScoreStatistics stats;
  if (ranked.empty()) {
    return stats;
  }

  std::vector<double> scores;
  scores.reserve(ranked.size());
  for (const auto& seed : ranked) {
    scores.push_back(seed.total_score);
  }
  std::sort(scores.begin(), scores.end());

  stats.count = scores.size();
  stats.min = scores.front();
  stats.max = scores.back();
  stats.mean = std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
  const size_t mid = scores.size() / 2;
  stats.median = scores.size() % 2 == 0 ? (scores[mid - 1] + scores[mid]) / 2.0 : scores[mid];
  return stats;
}

} // namespace seedscan

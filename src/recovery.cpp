#include "seedscan/recovery.hpp"

#include "seedscan/address_deriver.hpp"
#include "seedscan/balance_oracle.hpp"
#include "seedscan/beam_search.hpp"
#include "seedscan/checksum.hpp"
#include "seedscan/task_queue.hpp"
#include "seedscan/ui.hpp"
#include "seedscan/verifier.hpp"
#include "seedscan/word_filter.hpp"
#include "seedscan/word_scorer.hpp"
#include "seedscan/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace seedscan {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr size_t kMinFeedBatch = 16;

uint64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
  return static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

int64_t clamp_to_i64(uint64_t value) {
  return static_cast<int64_t>(std::min<uint64_t>(value, static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
}

std::string format_score(double score) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(4) << score;
  return oss.str();
}

std::string format_search_space(double size) {
  std::ostringstream oss;
  if (size >= 1e9) {
    oss << std::scientific << std::setprecision(2) << size;
  } else {
    oss << std::fixed << std::setprecision(0) << size;
  }
  return oss.str();
}

PositionConstraint constraint_for(const ConstraintMap& constraints, uint32_t position) {
  const auto it = constraints.find(position);
  if (it != constraints.end()) {
    return it->second;
  }
  PositionConstraint empty;
  empty.position = position;
  return empty;
}

std::unique_ptr<WordScorer> make_scorer(const Config& config, RuntimeLog& log) {
  if (!config.word_scores_path.empty()) {
    try {
      auto scorer = std::make_unique<FileWordScorer>(config.word_scores_path);
      log.info("Word scores: " + config.word_scores_path + " (" + std::to_string(scorer->position_count()) + " positions)");
      return scorer;
    } catch (const std::exception& ex) {
      log.warn(std::string("word scores unavailable, using fallback ordering: ") + ex.what());
    }
  }
  return std::make_unique<FallbackWordScorer>();
}

} // namespace

Recovery::Recovery(const Config& config, RuntimeLog& log, bool colorful)
  : config_(config), log_(log), colorful_(colorful) {}

void Recovery::request_stop() {
  stop_.store(true, std::memory_order_relaxed);
}

PositionScores Recovery::build_candidates(CandidateLists& candidates, const ConstraintMap& constraints) {
  const WordCandidateFilter filter(config_.filter);
  auto scorer = make_scorer(config_, log_);

  PositionScores scores;
  for (uint32_t position = 1; position <= kMnemonicWords; ++position) {
    const PositionConstraint constraint = constraint_for(constraints, position);
    const bool is_last = position == kMnemonicWords;
    if (is_last && constraint.empty()) {
      // The last word comes from the checksum; nothing to score against.
      continue;
    }

    const auto shortlist = WordCandidateFilter::top_k(filter.filter(constraint), config_.filter_top_k);
    const auto scored = score_with_fallback(*scorer, constraint, shortlist, log_);
    scores[position] = to_score_map(scored);

    if (is_last) {
      continue;
    }

    auto& words = candidates[position];
    for (const auto& entry : scored) {
      if (words.size() >= config_.candidates_per_position) {
        break;
      }
      words.push_back(entry.word);
    }

    std::string line = "Position " + std::to_string(position) + ": " + std::to_string(shortlist.size()) + " filtered, keeping";
    for (const auto& word : words) {
      line += ' ' + word;
    }
    log_.debug(std::move(line));
  }
  return scores;
}

std::vector<RankedSeed> Recovery::search_candidates() {
  const ConstraintMap constraints = load_position_constraints(config_.constraints_path);
  log_.info("Loaded " + std::to_string(constraints.size()) + " position constraints from " + config_.constraints_path);

  CandidateLists candidates;
  PositionScores scores = build_candidates(candidates, constraints);
  log_.info("Search space estimate: " + format_search_space(BeamSearchEngine::search_space_size(candidates)) + " mnemonics");

  BeamSearchEngine engine(clamp_to_i64(config_.beam_width), scores);
  if (const auto it = constraints.find(static_cast<uint32_t>(kMnemonicWords)); it != constraints.end()) {
    engine.set_last_word_constraint(it->second, WordCandidateFilter(config_.filter));
  }
  engine.set_step_observer([this](const BeamStepStats& stats, const std::vector<PartialMnemonic>&) {
    log_.debug("Beam position " + std::to_string(stats.position) + ": expanded " + std::to_string(stats.expanded) +
               ", kept " + std::to_string(stats.retained) + ", best " + format_score(stats.best_score) +
               ", cutoff " + format_score(stats.cutoff_score));
  });

  const auto started = std::chrono::steady_clock::now();
  const auto mnemonics = engine.search(candidates, clamp_to_i64(config_.max_results));
  log_.info("Beam search produced " + std::to_string(mnemonics.size()) + " checksum-valid mnemonics in " +
            std::to_string(elapsed_ms_since(started)) + " ms");

  const SeedRanker ranker(std::move(scores));
  auto ranked = ranker.rank(mnemonics);
  if (!ranked.empty()) {
    const auto stats = SeedRanker::statistics(ranked);
    log_.info("Scores: min " + format_score(stats.min) + " max " + format_score(stats.max) +
              " mean " + format_score(stats.mean) + " median " + format_score(stats.median));
  }
  return ranked;
}

void Recovery::feed_pool(WorkerPool& pool, TaskQueue& queue) const {
  if (queue.empty() || pool.shutting_down()) {
    return;
  }
  const size_t units = pool.unit_count();
  if (pool.pending_count() >= units * 2) {
    return;
  }
  pool.submit_tasks(queue.dequeue_batch(std::max(units * 4, kMinFeedBatch)));
}

void Recovery::report_progress(const WorkerPool& pool, const RunSummary& summary, uint64_t elapsed_ms) const {
  const auto stats = pool.statistics();
  ProgressSnapshot snapshot;
  snapshot.total_tasks = summary.total_tasks;
  snapshot.checked = summary.total_checked;
  snapshot.addresses = summary.total_addresses;
  snapshot.pending = stats.pending_tasks;
  snapshot.busy_units = stats.busy_units;
  snapshot.total_units = stats.total_units;
  snapshot.lost_tasks = stats.lost_tasks;
  snapshot.elapsed_seconds = elapsed_ms / 1000;
  log_.info(format_progress_line(snapshot));
}

RunSummary Recovery::run() {
  const auto started = std::chrono::steady_clock::now();
  const auto network = network_from_name(config_.network);
  if (!network.has_value()) {
    throw std::runtime_error("unknown network: " + config_.network);
  }

  ResultHandler results(config_.results_dir, log_);
  RunSummary summary;
  TaskQueue queue;

  auto tasks = results.filter_unchecked(SeedRanker::to_tasks(search_candidates()));
  summary.total_tasks = queue.enqueue_all(std::move(tasks));
  queue.sort_by_probability();

  if (stop_requested()) {
    summary.interrupted = true;
  }
  if (queue.empty() || summary.interrupted) {
    if (queue.empty()) {
      log_.info("Nothing to verify");
    }
    summary.elapsed_ms = elapsed_ms_since(started);
    if (!results.write_summary(summary).has_value()) {
      log_.warn("summary was printed but not saved");
    }
    return summary;
  }

  const size_t per_mnemonic = static_cast<size_t>(config_.addresses_per_standard) * 4;
  render_banner(
    "seedscan " SEEDSCAN_VERSION,
    {
      {"Network", network->name},
      {"Electrum", config_.electrum_host + ":" + std::to_string(config_.electrum_port)},
      {"Workers", std::to_string(config_.workers)},
      {"Mnemonics", std::to_string(summary.total_tasks)},
      {"Addresses/mnemonic", std::to_string(per_mnemonic)},
      {"Target balance", config_.target_balance_sats == 0 ? std::string("any non-zero")
                                                          : std::to_string(config_.target_balance_sats) + " sats"},
      {"Checkpoint", results.checkpoint_path().string()},
    },
    colorful_);

  const Config& config = config_;
  const NetworkParams params = *network;
  VerifierFactory factory = [&config, params](uint32_t) -> std::unique_ptr<TaskVerifier> {
    AddressDeriver deriver(default_derivation_specs(config.account, config.addresses_per_standard), params);
    auto oracle = std::make_unique<ElectrumOracle>(config.electrum_host, config.electrum_port, config.oracle_timeout_ms, params);
    return std::make_unique<MnemonicVerifier>(std::move(deriver), std::move(oracle), config.target_balance_sats);
  };

  WorkerPool pool(config_.workers, std::move(factory), log_);
  pool.on_result([&](const VerificationResult& result) {
    results.handle_result(result);
    if (!queue.mark_completed(result.mnemonic)) {
      log_.debug("result for untracked mnemonic " + short_digest(result.mnemonic));
    }
    ++summary.total_checked;
    summary.total_addresses += result.addresses_checked;
  });
  pool.on_found([&](const FoundWallet& wallet) {
    summary.found = wallet;
    if (!results.record_found(wallet).has_value()) {
      log_.error("found wallet could not be saved; record printed to stderr");
    }
    render_found_wallet(wallet, colorful_);
  });
  pool.initialize();

  auto last_progress = std::chrono::steady_clock::now();
  const auto progress_interval = std::chrono::milliseconds(config_.progress_interval_ms);

  while (true) {
    if (stop_requested()) {
      log_.warn("Stop requested, shutting down workers");
      summary.interrupted = true;
      pool.shutdown();
      break;
    }

    feed_pool(pool, queue);
    if (pool.finished()) {
      if (pool.unit_count() == 0 && !pool.shutting_down()) {
        log_.error("no verification units left; " + std::to_string(queue.size() + pool.pending_count()) + " mnemonics unverified");
        summary.interrupted = true;
      }
      break;
    }

    (void)pool.poll(kPollInterval);

    if (std::chrono::steady_clock::now() - last_progress >= progress_interval) {
      report_progress(pool, summary, elapsed_ms_since(started));
      last_progress = std::chrono::steady_clock::now();
    }
  }

  pool.shutdown();
  report_progress(pool, summary, elapsed_ms_since(started));

  const auto queue_stats = queue.statistics();
  if (queue_stats.processing > 0) {
    log_.info(std::to_string(queue_stats.processing) + " dispatched mnemonics were not verified");
  }

  summary.elapsed_ms = elapsed_ms_since(started);
  if (!results.write_summary(summary).has_value()) {
    log_.warn("summary was printed but not saved");
  }
  return summary;
}

} // namespace seedscan

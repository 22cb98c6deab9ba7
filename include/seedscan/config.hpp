#pragma once

#include "seedscan/types.hpp"
#include "seedscan/word_filter.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace seedscan {

struct Config {
  std::string constraints_path = "constraints.json";
  std::string word_scores_path;
  std::string results_dir = "results";
  std::string network = "mainnet";

  std::string electrum_host = "electrum.blockstream.info";
  uint16_t electrum_port = 50001;
  uint32_t oracle_timeout_ms = 10000;

  uint32_t workers = 0;

  uint64_t beam_width = 200;
  uint64_t max_results = 10000;
  uint32_t filter_top_k = 20;
  uint32_t candidates_per_position = 3;

  uint32_t account = 0;
  uint32_t addresses_per_standard = 3;
  uint64_t target_balance_sats = 100000;

  uint64_t progress_interval_ms = 10000;
  std::string log_level = "info";

  FilterWeights filter;
};

Config load_or_create_config(const std::filesystem::path& path, bool& created_default);
Config config_from_json(const JsonValue& value);
JsonValue config_to_json(const Config& config);
void validate_config(const Config& config);

// Reads {"blanks": [{position, length, syllables, ...}]} keyed by position.
ConstraintMap load_position_constraints(const std::filesystem::path& path);

std::string read_text_file(const std::filesystem::path& path);

} // namespace seedscan

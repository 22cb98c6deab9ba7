#include "seedscan/config.hpp"

#include "seedscan/address.hpp"
#include "seedscan/json.hpp"
#include "seedscan/log.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace seedscan {

namespace {

constexpr uint32_t kMaxPosition = 12;

uint32_t as_u32(const JsonValue& value, const char* key) {
  const uint64_t v = value.as_uint64();
  if (v > std::numeric_limits<uint32_t>::max()) {
    throw std::runtime_error(std::string("config ") + key + " is out of range");
  }
  return static_cast<uint32_t>(v);
}

JsonValue filter_weights_to_json(const FilterWeights& w) {
  return JsonValue(JsonValue::object{
    {"length", JsonValue(w.length)},
    {"syllables", JsonValue(w.syllables)},
    {"pattern", JsonValue(w.pattern)},
    {"semantic", JsonValue(w.semantic)},
    {"rhyme", JsonValue(w.rhyme)},
    {"threshold", JsonValue(w.threshold)},
    {"length_tolerance", JsonValue(w.length_tolerance)},
    {"empty_constraint_score", JsonValue(w.empty_constraint_score)},
  });
}

FilterWeights filter_weights_from_json(const JsonValue& value) {
  if (!value.is_object()) {
    throw std::runtime_error("config filter must be an object");
  }
  FilterWeights w;
  w.length = value.double_or("length", w.length);
  w.syllables = value.double_or("syllables", w.syllables);
  w.pattern = value.double_or("pattern", w.pattern);
  w.semantic = value.double_or("semantic", w.semantic);
  w.rhyme = value.double_or("rhyme", w.rhyme);
  w.threshold = value.double_or("threshold", w.threshold);
  if (const auto* v = value.find("length_tolerance"); v != nullptr) w.length_tolerance = as_u32(*v, "filter.length_tolerance");
  w.empty_constraint_score = value.double_or("empty_constraint_score", w.empty_constraint_score);
  return w;
}

} // namespace

std::string read_text_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to read " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

JsonValue config_to_json(const Config& config) {
  JsonValue::object root{
    {"constraints_path", JsonValue(config.constraints_path)},
    {"word_scores_path", JsonValue(config.word_scores_path)},
    {"results_dir", JsonValue(config.results_dir)},
    {"network", JsonValue(config.network)},
    {"electrum_host", JsonValue(config.electrum_host)},
    {"electrum_port", JsonValue(static_cast<uint64_t>(config.electrum_port))},
    {"oracle_timeout_ms", JsonValue(config.oracle_timeout_ms)},
    {"workers", JsonValue(config.workers)},
    {"beam_width", JsonValue(config.beam_width)},
    {"max_results", JsonValue(config.max_results)},
    {"filter_top_k", JsonValue(config.filter_top_k)},
    {"candidates_per_position", JsonValue(config.candidates_per_position)},
    {"account", JsonValue(config.account)},
    {"addresses_per_standard", JsonValue(config.addresses_per_standard)},
    {"target_balance_sats", JsonValue(config.target_balance_sats)},
    {"progress_interval_ms", JsonValue(config.progress_interval_ms)},
    {"log_level", JsonValue(config.log_level)},
    {"filter", filter_weights_to_json(config.filter)},
    {"_note", JsonValue("Fill in constraints_path before running. workers=0 picks one per physical core.")},
  };
  return JsonValue(std::move(root));
}

Config config_from_json(const JsonValue& value) {
  if (!value.is_object()) {
    throw std::runtime_error("config root must be an object");
  }

  Config config;
  const auto& obj = value.as_object();

  if (const auto it = obj.find("constraints_path"); it != obj.end()) config.constraints_path = it->second.as_string();
  if (const auto it = obj.find("word_scores_path"); it != obj.end()) config.word_scores_path = it->second.as_string();
  if (const auto it = obj.find("results_dir"); it != obj.end()) config.results_dir = it->second.as_string();
  if (const auto it = obj.find("network"); it != obj.end()) config.network = it->second.as_string();
  if (const auto it = obj.find("electrum_host"); it != obj.end()) config.electrum_host = it->second.as_string();
  if (const auto it = obj.find("electrum_port"); it != obj.end()) {
    const uint64_t port = it->second.as_uint64();
    if (port > std::numeric_limits<uint16_t>::max()) {
      throw std::runtime_error("config electrum_port must be <= 65535");
    }
    config.electrum_port = static_cast<uint16_t>(port);
  }
  if (const auto it = obj.find("oracle_timeout_ms"); it != obj.end()) config.oracle_timeout_ms = as_u32(it->second, "oracle_timeout_ms");
  if (const auto it = obj.find("workers"); it != obj.end()) config.workers = as_u32(it->second, "workers");
  if (const auto it = obj.find("beam_width"); it != obj.end()) config.beam_width = it->second.as_uint64();
  if (const auto it = obj.find("max_results"); it != obj.end()) config.max_results = it->second.as_uint64();
  if (const auto it = obj.find("filter_top_k"); it != obj.end()) config.filter_top_k = as_u32(it->second, "filter_top_k");
  if (const auto it = obj.find("candidates_per_position"); it != obj.end()) config.candidates_per_position = as_u32(it->second, "candidates_per_position");
  if (const auto it = obj.find("account"); it != obj.end()) config.account = as_u32(it->second, "account");
  if (const auto it = obj.find("addresses_per_standard"); it != obj.end()) config.addresses_per_standard = as_u32(it->second, "addresses_per_standard");
  if (const auto it = obj.find("target_balance_sats"); it != obj.end()) config.target_balance_sats = it->second.as_uint64();
  if (const auto it = obj.find("progress_interval_ms"); it != obj.end()) config.progress_interval_ms = it->second.as_uint64();
  if (const auto it = obj.find("log_level"); it != obj.end()) config.log_level = it->second.as_string();
  if (const auto it = obj.find("filter"); it != obj.end()) config.filter = filter_weights_from_json(it->second);

  return config;
}

Config load_or_create_config(const std::filesystem::path& path, bool& created_default) {
  created_default = false;

  if (!std::filesystem::exists(path)) {
    created_default = true;
    const Config config;
    std::ofstream out(path);
    if (!out) {
      throw std::runtime_error("failed to create config file: " + path.string());
    }
    out << to_json(config_to_json(config), true) << '\n';
    return config;
  }

  return config_from_json(parse_json(read_text_file(path)));
}

void validate_config(const Config& config) {
  if (config.constraints_path.empty()) {
    throw std::runtime_error("config constraints_path is missing");
  }
  if (config.results_dir.empty()) {
    throw std::runtime_error("config results_dir is missing");
  }
  if (!network_from_name(config.network).has_value()) {
    throw std::runtime_error("config network must be 'mainnet' or 'testnet'");
  }
  if (config.electrum_host.empty()) {
    throw std::runtime_error("config electrum_host is missing");
  }
  if (config.electrum_port == 0) {
    throw std::runtime_error("config electrum_port must be > 0");
  }
  if (config.oracle_timeout_ms == 0) {
    throw std::runtime_error("config oracle_timeout_ms must be > 0");
  }
  if (config.beam_width == 0) {
    throw std::runtime_error("config beam_width must be > 0");
  }
  if (config.max_results == 0) {
    throw std::runtime_error("config max_results must be > 0");
  }
  if (config.filter_top_k == 0) {
    throw std::runtime_error("config filter_top_k must be > 0");
  }
  if (config.candidates_per_position == 0) {
    throw std::runtime_error("config candidates_per_position must be > 0");
  }
  if (config.addresses_per_standard == 0) {
    throw std::runtime_error("config addresses_per_standard must be > 0");
  }
  if (config.account >= 0x80000000U) {
    throw std::runtime_error("config account must be < 2^31");
  }
  if (config.progress_interval_ms == 0) {
    throw std::runtime_error("config progress_interval_ms must be > 0");
  }
  if (!log_level_from_name(config.log_level).has_value()) {
    throw std::runtime_error("config log_level must be debug, info, warn or error");
  }
  if (config.filter.threshold < 0.0 || config.filter.threshold > 1.0) {
    throw std::runtime_error("config filter.threshold must be within [0, 1]");
  }
  if (config.filter.length < 0.0 || config.filter.syllables < 0.0 || config.filter.pattern < 0.0 ||
      config.filter.semantic < 0.0 || config.filter.rhyme < 0.0) {
    throw std::runtime_error("config filter weights must be >= 0");
  }
}

ConstraintMap load_position_constraints(const std::filesystem::path& path) {
  const JsonValue root = parse_json(read_text_file(path));
  const JsonValue* blanks = root.find("blanks");
  if (blanks == nullptr || !blanks->is_array()) {
    throw std::runtime_error("constraints file " + path.string() + " has no blanks array");
  }

  ConstraintMap out;
  for (const auto& entry : blanks->as_array()) {
    PositionConstraint constraint = position_constraint_from_json(entry);
    if (constraint.position < 1 || constraint.position > kMaxPosition) {
      throw std::runtime_error("constraint position must be within 1..12, got " + std::to_string(constraint.position));
    }
    const uint32_t position = constraint.position;
    if (!out.emplace(position, std::move(constraint)).second) {
      throw std::runtime_error("duplicate constraint for position " + std::to_string(position));
    }
  }
  return out;
}

} // namespace seedscan

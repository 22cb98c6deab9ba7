#include "seedscan/address_deriver.hpp"
#include "seedscan/balance_oracle.hpp"
#include "seedscan/config.hpp"
#include "seedscan/log.hpp"
#include "seedscan/perf.hpp"
#include "seedscan/recovery.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

constexpr size_t kDryRunListed = 20;

seedscan::Recovery* g_recovery = nullptr;

void handle_signal(int) {
  if (g_recovery != nullptr) {
    g_recovery->request_stop();
  }
}

bool stdout_is_terminal() {
  return isatty(STDOUT_FILENO) != 0;
}

struct CliOptions {
  std::filesystem::path config_path = "config.json";
  bool dry_run = false;
  bool validate_oracle = false;
  std::optional<std::string> derive_mnemonic;
};

CliOptions parse_cli(int argc, char** argv) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path");
      }
      opts.config_path = argv[++i];
      continue;
    }

    if (arg == "--dry-run") {
      opts.dry_run = true;
      continue;
    }

    if (arg == "--derive") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--derive requires a quoted mnemonic");
      }
      opts.derive_mnemonic = argv[++i];
      continue;
    }

    if (arg == "--validate-oracle") {
      opts.validate_oracle = true;
      continue;
    }

    if (arg == "--help" || arg == "-h") {
      std::cout << "seedscan " << SEEDSCAN_VERSION << "\n\n"
                << "Usage:\n"
                << "  seedscan [--config <path>] [--dry-run | --derive \"<mnemonic>\" | --validate-oracle]\n\n"
                << "Options:\n"
                << "  --config <path>      Path to config JSON (default: ./config.json)\n"
                << "  --dry-run            Search and rank candidates without querying balances\n"
                << "  --derive <mnemonic>  Print the address table derived from a mnemonic\n"
                << "  --validate-oracle    Check Electrum server connectivity and exit\n"
                << "  -h, --help           Show this help\n";
      std::exit(0);
    }

    throw std::runtime_error("unknown argument: " + arg);
  }

  return opts;
}

std::vector<std::string> sanitize_runtime_config(seedscan::Config& config) {
  std::vector<std::string> notes;
  const auto topology = seedscan::detect_cpu_topology();
  notes.push_back("cpu profile: " + seedscan::describe_topology(topology));

  if (config.workers == 0) {
    config.workers = seedscan::recommended_worker_count(topology);
    notes.push_back(
      "workers was 0; using " + std::to_string(config.workers) + " units (" +
      std::to_string(seedscan::kUnitsPerLogicalCpu) + " per logical CPU, at most " +
      std::to_string(seedscan::kMaxDefaultUnits) + ")");
  }

  return notes;
}

void validate_oracle(const seedscan::Config& config) {
  const auto network = seedscan::network_from_name(config.network);
  seedscan::ElectrumOracle oracle(config.electrum_host, config.electrum_port, config.oracle_timeout_ms, *network);
  oracle.connect();

  std::cout << "Oracle validation OK\n";
  std::cout << "  endpoint: " << config.electrum_host << ':' << config.electrum_port << '\n';
  std::cout << "  server: " << oracle.server_version() << '\n';
  std::cout << "  network: " << network->name << '\n';
}

void print_derived_addresses(const seedscan::Config& config, const std::string& mnemonic) {
  const auto network = seedscan::network_from_name(config.network);
  const seedscan::AddressDeriver deriver(
    seedscan::default_derivation_specs(config.account, config.addresses_per_standard), *network);

  for (const auto& entry : deriver.derive(mnemonic)) {
    std::cout << std::left << std::setw(15) << seedscan::address_kind_name(entry.kind)
              << std::setw(22) << entry.path
              << entry.address << '\n';
  }
}

void print_dry_run(const std::vector<seedscan::RankedSeed>& ranked) {
  std::cout << ranked.size() << " candidate mnemonics ranked\n";
  const size_t listed = std::min(ranked.size(), kDryRunListed);
  for (size_t i = 0; i < listed; ++i) {
    std::cout << std::right << std::setw(5) << ranked[i].rank << "  "
              << std::fixed << std::setprecision(4) << ranked[i].total_score << "  "
              << ranked[i].mnemonic << '\n';
  }
  if (ranked.size() > listed) {
    std::cout << "  ... " << (ranked.size() - listed) << " more\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto cli = parse_cli(argc, argv);

    bool created_default = false;
    auto config = seedscan::load_or_create_config(cli.config_path, created_default);

    if (created_default) {
      std::cout << "Created default config at: " << cli.config_path << '\n';
      std::cout << "Point constraints_path at your constraints file, then run seedscan again." << '\n';
      return 0;
    }

    seedscan::validate_config(config);

    if (cli.derive_mnemonic.has_value()) {
      print_derived_addresses(config, *cli.derive_mnemonic);
      return 0;
    }

    if (cli.validate_oracle) {
      validate_oracle(config);
      return 0;
    }

    const auto level = seedscan::log_level_from_name(config.log_level);
    seedscan::RuntimeLog log(level.value_or(seedscan::LogLevel::INFO));

    const auto tuning_notes = sanitize_runtime_config(config);
    const seedscan::Config& runtime_config = config;

    seedscan::Recovery recovery(runtime_config, log, stdout_is_terminal());

    if (cli.dry_run) {
      print_dry_run(recovery.search_candidates());
      return 0;
    }

    log.info("Starting seedscan " SEEDSCAN_VERSION " | network=" + config.network +
             " | electrum=" + config.electrum_host + ':' + std::to_string(config.electrum_port) +
             " | workers=" + std::to_string(config.workers));
    for (const auto& note : tuning_notes) {
      log.info("Auto-tuning: " + note);
    }

    g_recovery = &recovery;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    recovery.run();
    g_recovery = nullptr;

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << '\n';
    return 1;
  }
}

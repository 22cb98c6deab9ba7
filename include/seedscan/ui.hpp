#pragma once

#include "seedscan/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace seedscan {

struct ProgressSnapshot {
  uint64_t total_tasks = 0;
  uint64_t checked = 0;
  uint64_t addresses = 0;
  uint64_t pending = 0;
  uint64_t busy_units = 0;
  uint64_t total_units = 0;
  uint64_t lost_tasks = 0;
  uint64_t elapsed_seconds = 0;
};

std::string human_rate(double per_second, const char* unit);
std::string uptime_string(uint64_t seconds);
std::string colorize(const std::string& text, const char* code, bool enabled);

// "Progress: 120/10000 (1.20%) | 0.85 seeds/s | ETA 3h 12m 4s | units 8/8 busy"
std::string format_progress_line(const ProgressSnapshot& snapshot);

// Boxed key/value block printed once at startup.
void render_banner(const std::string& title, const std::vector<std::pair<std::string, std::string>>& rows, bool colorful);

void render_found_wallet(const FoundWallet& wallet, bool colorful);

} // namespace seedscan

#include "seedscan/ui.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace seedscan {

namespace {

constexpr size_t kInnerWidth = 78;
constexpr size_t kKeyWidth = 22;

size_t visible_length(const std::string& text) {
  size_t visible = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      i += 2;
      while (i < text.size() && text[i] != 'm') {
        ++i;
      }
      if (i < text.size()) {
        ++i;
      }
      continue;
    }
    ++visible;
    ++i;
  }
  return visible;
}

std::string pad_right_visible(const std::string& text, size_t width) {
  const size_t vis = visible_length(text);
  if (vis >= width) {
    return text;
  }
  return text + std::string(width - vis, ' ');
}

std::string box_border() {
  return "+" + std::string(kInnerWidth, '-') + "+";
}

std::string box_row(const std::string& text) {
  return "|" + pad_right_visible(text, kInnerWidth) + "|";
}

std::string btc_amount(uint64_t sats) {
  constexpr uint64_t kSatsPerBtc = 100000000ULL;
  std::ostringstream oss;
  oss << sats / kSatsPerBtc << '.' << std::setw(8) << std::setfill('0') << sats % kSatsPerBtc;
  return oss.str();
}

} // namespace

std::string colorize(const std::string& text, const char* code, bool enabled) {
  if (!enabled) {
    return text;
  }
  return std::string(code) + text + "\x1b[0m";
}

std::string uptime_string(uint64_t seconds) {
  const auto h = seconds / 3600;
  const auto m = (seconds % 3600) / 60;
  const auto s = seconds % 60;
  std::ostringstream oss;
  oss << h << "h " << m << "m " << s << "s";
  return oss.str();
}

std::string human_rate(double per_second, const char* unit) {
  std::ostringstream oss;
  if (per_second > 0.0 && per_second < 1.0) {
    oss << std::fixed << std::setprecision(2) << per_second * 60.0 << ' ' << unit << "/min";
  } else {
    oss << std::fixed << std::setprecision(2) << per_second << ' ' << unit << "/s";
  }
  return oss.str();
}

std::string format_progress_line(const ProgressSnapshot& s) {
  const double rate = s.elapsed_seconds == 0 ? 0.0
    : static_cast<double>(s.checked) / static_cast<double>(s.elapsed_seconds);
  const double percent = s.total_tasks == 0 ? 0.0
    : 100.0 * static_cast<double>(s.checked) / static_cast<double>(s.total_tasks);

  std::ostringstream oss;
  oss << "Progress: " << s.checked << '/' << s.total_tasks
      << " (" << std::fixed << std::setprecision(2) << percent << "%)"
      << " | " << human_rate(rate, "seeds")
      << " | addresses " << s.addresses;
  if (rate > 0.0 && s.total_tasks > s.checked) {
    const auto remaining = static_cast<uint64_t>(static_cast<double>(s.total_tasks - s.checked) / rate);
    oss << " | ETA " << uptime_string(remaining);
  }
  oss << " | units " << s.busy_units << '/' << s.total_units << " busy"
      << " | pending " << s.pending;
  if (s.lost_tasks > 0) {
    oss << " | lost " << s.lost_tasks;
  }
  return oss.str();
}

void render_banner(const std::string& title, const std::vector<std::pair<std::string, std::string>>& rows, bool colorful) {
  std::cout << box_border() << '\n';
  std::cout << box_row(" " + colorize(title, "\x1b[1;36m", colorful)) << '\n';
  std::cout << box_border() << '\n';
  for (const auto& [key, value] : rows) {
    std::cout << box_row(" " + pad_right_visible(key + ":", kKeyWidth) + value) << '\n';
  }
  std::cout << box_border() << '\n';
  std::cout.flush();
}

void render_found_wallet(const FoundWallet& wallet, bool colorful) {
  render_banner(
    "TARGET WALLET FOUND",
    {
      {"Address", colorize(wallet.address, "\x1b[1;32m", colorful)},
      {"Type", address_kind_name(wallet.kind)},
      {"Path", wallet.path},
      {"Balance", btc_amount(wallet.balance_sats) + " BTC (" + std::to_string(wallet.balance_sats) + " sats)"},
      {"Mnemonics checked", std::to_string(wallet.total_checked)},
      {"Elapsed", uptime_string(wallet.total_elapsed_ms / 1000)},
    },
    colorful);
}

} // namespace seedscan

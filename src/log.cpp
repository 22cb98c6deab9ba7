#include "seedscan/log.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace seedscan {

namespace {

constexpr size_t kMaxRuntimeLogLines = 5000;

std::string clock_prefix() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  if (localtime_r(&now, &tm) == nullptr) {
    return "[--:--:--]";
  }
  char buf[16];
  const size_t n = std::strftime(buf, sizeof(buf), "[%H:%M:%S]", &tm);
  return std::string(buf, n);
}

} // namespace

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "debug";
    case LogLevel::INFO: return "info";
    case LogLevel::WARN: return "warn";
    case LogLevel::ERROR: return "error";
  }
  return "info";
}

std::optional<LogLevel> log_level_from_name(std::string_view name) {
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  return std::nullopt;
}

RuntimeLog::RuntimeLog(LogLevel threshold, bool echo)
  : threshold_(threshold), echo_(echo) {
}

void RuntimeLog::push(LogLevel level, std::string line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < threshold_) {
    return;
  }

  std::string entry = clock_prefix() + ' ' + log_level_name(level) + ": " + line;
  if (echo_) {
    auto& stream = level >= LogLevel::WARN ? std::cerr : std::cout;
    stream << entry << '\n';
  }

  if (lines_.size() >= kMaxRuntimeLogLines) {
    const size_t drop = lines_.size() - kMaxRuntimeLogLines + 1;
    lines_.erase(lines_.begin(), lines_.begin() + static_cast<std::vector<std::string>::difference_type>(drop));
  }
  lines_.push_back(std::move(entry));
}

void RuntimeLog::set_threshold(LogLevel threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_ = threshold;
}

std::vector<std::string> RuntimeLog::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_;
}

size_t RuntimeLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_.size();
}

} // namespace seedscan

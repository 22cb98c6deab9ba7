#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seedscan {

enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
};

const char* log_level_name(LogLevel level);
std::optional<LogLevel> log_level_from_name(std::string_view name);

// Bounded in-memory runtime log shared by the orchestrator and the pool.
// Lines at or above the threshold are also echoed to stdout/stderr.
class RuntimeLog {
public:
  explicit RuntimeLog(LogLevel threshold = LogLevel::INFO, bool echo = true);

  RuntimeLog(const RuntimeLog&) = delete;
  RuntimeLog& operator=(const RuntimeLog&) = delete;

  void push(LogLevel level, std::string line);
  void debug(std::string line) { push(LogLevel::DEBUG, std::move(line)); }
  void info(std::string line) { push(LogLevel::INFO, std::move(line)); }
  void warn(std::string line) { push(LogLevel::WARN, std::move(line)); }
  void error(std::string line) { push(LogLevel::ERROR, std::move(line)); }

  void set_threshold(LogLevel threshold);
  std::vector<std::string> snapshot() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  LogLevel threshold_;
  bool echo_ = true;
};

} // namespace seedscan

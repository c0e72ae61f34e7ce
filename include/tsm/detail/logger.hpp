#pragma once

#include <cstdio>
#include <memory>
#include <mutex>
#include <string_view>

#ifndef TSM_DEFAULT_LOG_LEVEL
#define TSM_DEFAULT_LOG_LEVEL ::tsm::LogLevel::Warn
#endif

namespace tsm {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

constexpr std::string_view to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

// Log sink interface. Machines hold a shared_ptr to one and ask enabled()
// before formatting a message.
struct Logger {
  virtual ~Logger() = default;
  virtual bool enabled(LogLevel level) const = 0;
  virtual void log(LogLevel level, std::string_view message) = 0;
};

// Writes "[tsm] LEVEL message" lines to stderr.
class StderrLogger : public Logger {
 public:
  explicit StderrLogger(LogLevel min_level = TSM_DEFAULT_LOG_LEVEL)
      : min_level_(min_level) {}

  bool enabled(LogLevel level) const override {
    return level != LogLevel::Off && level >= min_level_;
  }

  void log(LogLevel level, std::string_view message) override {
    if (!enabled(level)) return;
    auto name = to_string(level);
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[tsm] %.*s %.*s\n", static_cast<int>(name.size()),
            name.data(), static_cast<int>(message.size()), message.data());
  }

  LogLevel min_level() const { return min_level_; }

 private:
  LogLevel min_level_;
  std::mutex mutex_;
};

class NullLogger : public Logger {
 public:
  bool enabled(LogLevel /*level*/) const override { return false; }
  void log(LogLevel /*level*/, std::string_view /*message*/) override {}
};

// Builds the message only when the level is enabled.
template <typename MakeMessage>
void log_lazy(Logger& logger, LogLevel level, MakeMessage&& make_message) {
  if (logger.enabled(level)) {
    logger.log(level, make_message());
  }
}

// Global default logger
inline std::shared_ptr<Logger> default_logger() {
  static auto logger = std::make_shared<StderrLogger>();
  return logger;
}

}  // namespace tsm

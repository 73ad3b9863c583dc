#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace enginebridge {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* log_level_name(LogLevel level);

/**
 * Level gate in front of a LoggerCallback. Calls into the callback are
 * serialized, including across copies of the same Logger, so the trigger
 * task and the stream consumer never run it concurrently.
 */
class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback)
      : level_(level), callback_(std::move(callback)) {}

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  [[nodiscard]] bool enabled(LogLevel level) const;
  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
  std::shared_ptr<std::mutex> mutex_ = std::make_shared<std::mutex>();
};

}  // namespace enginebridge

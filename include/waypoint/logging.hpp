#pragma once

#include <optional>
#include <string_view>

namespace waypoint {
namespace logging {

enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5,
  OFF = 6
};

/**
 * @brief Map a configuration level name to a LogLevel
 * @return std::nullopt for an unknown name
 */
inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "trace") return LogLevel::TRACE;
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  if (name == "critical") return LogLevel::CRITICAL;
  if (name == "off") return LogLevel::OFF;
  return std::nullopt;
}

}  // namespace logging
}  // namespace waypoint

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace waypoint {
namespace logging {

/**
 * @brief Process-wide handle on the "waypoint" spdlog logger
 *
 * Hosts that already run spdlog can hand their own logger over with
 * setLogger(); the current level carries over to it.
 */
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    level_ = toSpdlog(level);
    logger_->set_level(level_);
  }

  /**
   * @brief Set the level from its configuration name; unknown names mean info
   */
  void setLogLevel(std::string_view name) {
    setLevel(parseLogLevel(name).value_or(LogLevel::INFO));
  }

  /**
   * @brief Route router output through another logger
   * @param logger Replacement; nullptr restores the console logger
   */
  void setLogger(std::shared_ptr<spdlog::logger> logger) {
    logger_ = logger ? std::move(logger) : console();
    logger_->set_level(level_);
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

 private:
  Logger() : logger_(console()) { logger_->set_level(level_); }

  static std::shared_ptr<spdlog::logger> console() {
    auto logger = spdlog::get("waypoint");
    if (!logger) {
      logger = spdlog::stdout_color_mt("waypoint");
      logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    }
    return logger;
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::info;
  }

  spdlog::level::level_enum level_ = spdlog::level::info;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace waypoint

#define WPT_LOG_TRACE(...) \
  waypoint::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define WPT_LOG_DEBUG(...) \
  waypoint::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define WPT_LOG_INFO(...) \
  waypoint::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define WPT_LOG_WARN(...) \
  waypoint::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define WPT_LOG_ERROR(...) \
  waypoint::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define WPT_LOG_CRITICAL(...) \
  waypoint::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else

#define WPT_LOG_TRACE(...)
#define WPT_LOG_DEBUG(...)
#define WPT_LOG_INFO(...)
#define WPT_LOG_WARN(...)
#define WPT_LOG_ERROR(...)
#define WPT_LOG_CRITICAL(...)

namespace waypoint {
namespace logging {

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(std::string_view) {}
};

}  // namespace logging
}  // namespace waypoint

#endif

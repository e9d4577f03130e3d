/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for TCHAT.
 * Provides TCHAT_LOG_DEBUG, TCHAT_LOG_INFO, TCHAT_LOG_WARN, TCHAT_LOG_ERROR macros.
 */

#ifndef TCHAT_LOG_HPP_
#define TCHAT_LOG_HPP_

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace tchat {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }
  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(threshold().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level) || level == Level::kOff) {
      return;
    }
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};

    char stamp[16] = "??:??:??";
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    if (::localtime_r(&now, &tm_buf) != nullptr) {
      std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_buf);
    }

    // One lock per line so sessions on different threads never interleave.
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << "[" << stamp << "] " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

// Parse "debug", "info", "warn", "error" or "off". Returns false on unknown names.
inline bool parse_log_level(std::string_view name, Logger::Level& out) {
  if (name == "debug") {
    out = Logger::Level::kDebug;
  } else if (name == "info") {
    out = Logger::Level::kInfo;
  } else if (name == "warn" || name == "warning") {
    out = Logger::Level::kWarn;
  } else if (name == "error") {
    out = Logger::Level::kError;
  } else if (name == "off") {
    out = Logger::Level::kOff;
  } else {
    return false;
  }
  return true;
}

#define TCHAT_LOG_DEBUG(msg)                                               \
  do {                                                                     \
    if (::tchat::Logger::enabled(::tchat::Logger::Level::kDebug)) {        \
      ::tchat::Logger::log(::tchat::Logger::Level::kDebug, msg);           \
    }                                                                      \
  } while (0)
#define TCHAT_LOG_INFO(msg) ::tchat::Logger::log(::tchat::Logger::Level::kInfo, msg)
#define TCHAT_LOG_WARN(msg) ::tchat::Logger::log(::tchat::Logger::Level::kWarn, msg)
#define TCHAT_LOG_ERROR(msg) ::tchat::Logger::log(::tchat::Logger::Level::kError, msg)

}  // namespace tchat

#endif  // TCHAT_LOG_HPP_

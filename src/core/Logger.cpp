/* @file Logger.cpp
 * @brief mutex-serialised line sink with wall-clock stamps
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/Logger.hpp"

#include <chrono>
#include <ctime>

namespace spectackler {
  namespace core {

    const char* toString(Logger::Level level) {
      switch (level) {
      case Logger::Level::Info:
        return "INFO";
      case Logger::Level::Warn:
        return "WARN";
      case Logger::Level::Error:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

    void Logger::log(Level level, std::string_view tag, std::string_view message) {
      if (level < minimum_)
        return;

      const auto now = std::chrono::system_clock::now();
      const std::time_t t = std::chrono::system_clock::to_time_t(now);
      std::tm local{};
      localtime_r(&t, &local);
      char stamp[16];
      std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

      std::lock_guard<std::mutex> lock(mtx_);
      sink_ << stamp << ' ' << toString(level) << " [" << tag << "] " << message << '\n';
      sink_.flush();
    }

  } // namespace core
} // namespace spectackler

#pragma once
/** @file  Logger.hpp
 *  @brief Thread-safe tagged diagnostic logger shared by pollers, links and the scheduler.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <iostream>
#include <mutex>
#include <string_view>

namespace spectackler {
  namespace core {

    class Logger {

    public:
      enum class Level { Info, Warn, Error };

      explicit Logger(std::ostream& sink = std::cerr, Level minimum = Level::Info)
          : sink_{ sink }, minimum_{ minimum } {}
      ~Logger() = default;

      // --- public API ---
      /// One complete line per call; concurrent callers never interleave characters.
      void log(Level level, std::string_view tag, std::string_view message);

      void info(std::string_view tag, std::string_view message) { log(Level::Info, tag, message); }
      void warn(std::string_view tag, std::string_view message) { log(Level::Warn, tag, message); }
      void error(std::string_view tag, std::string_view message) {
        log(Level::Error, tag, message);
      }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      std::ostream& sink_;
      Level minimum_;
      std::mutex mtx_;
    };

    const char* toString(Logger::Level level);

  } // namespace core
} // namespace spectackler

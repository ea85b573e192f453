/* @file ShutdownSequence.cpp
 * @brief best-effort ordered shutdown
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/ShutdownSequence.hpp"

#include <exception>

using namespace spectackler::core;

bool ShutdownSequence::run() {
  bool clean = true;
  for (const auto& s : steps_) {
    try {
      logger_->info("Shutdown", s.name);
      s.step();
    } catch (const std::exception& e) {
      clean = false;
      const std::string msg = "[Shutdown] " + s.name + " failed: " + e.what();
      logger_->error("Shutdown", s.name + " failed: " + e.what());
      if (errorMonitor_)
        errorMonitor_->notifyFailure(msg);
    }
  }
  return clean;
}

/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"

#include <algorithm>

namespace spectackler {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      // called outside the lock so the callback may itself report failures
      if (cb)
        cb(message);
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace spectackler

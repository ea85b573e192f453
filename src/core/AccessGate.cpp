/* @file AccessGate.cpp
 * @brief free/busy gate between a poller and direct commands
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/AccessGate.hpp"

using namespace spectackler::core;

bool AccessGate::enterSampling(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!cv_.wait(lock, stop, [this] { return holds_ == 0; }))
    return false;
  sampling_ = true;
  return true;
}

void AccessGate::leaveSampling() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    sampling_ = false;
  }
  cv_.notify_all();
}

void AccessGate::acquire() {
  std::unique_lock<std::mutex> lock(mtx_);
  ++holds_;
  cv_.wait(lock, [this] { return !sampling_; });
}

void AccessGate::release() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (holds_ > 0)
      --holds_;
  }
  cv_.notify_all();
}

bool AccessGate::isFree() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return holds_ == 0;
}

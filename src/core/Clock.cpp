/* @file Clock.cpp
 * @brief interruptible steady-clock sleep
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/Clock.hpp"

using namespace spectackler::core;

bool SteadyClock::sleepUntil(time_point deadline, std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait_until(lock, stop, deadline, [] { return false; });
  return !stop.stop_requested();
}

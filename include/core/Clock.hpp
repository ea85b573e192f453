#pragma once
/** @file  Clock.hpp
 *  @brief Time source for the scheduler; swapped for a virtual clock in tests.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace spectackler::core {

  using Seconds = std::chrono::duration<double>;

  class Clock {
  public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    /// Returns false if \p stop was triggered before \p deadline.
    virtual bool sleepUntil(time_point deadline, std::stop_token stop) = 0;
  };

  class SteadyClock final : public Clock {
  public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
    bool sleepUntil(time_point deadline, std::stop_token stop) override;

  private:
    std::mutex mtx_;
    std::condition_variable_any cv_;
  };

} // namespace spectackler::core

#pragma once
/** @file  FakeClock.hpp
 *  @brief Virtual time: sleepUntil() jumps straight to the deadline.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>

#include "core/Clock.hpp"

namespace spectackler {
  namespace test {

    class FakeClock : public spectackler::core::Clock {
    public:
      /// Runs after every advance; tests publish the simulated plant's next Sample here.
      std::function<void(time_point)> onAdvance{};

      /// How late the n-th sleep wakes up past its deadline; on time when unset.
      std::function<time_point::duration(std::size_t)> lateness{};

      time_point now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      bool sleepUntil(time_point deadline, std::stop_token stop) override {
        if (stop.stop_requested())
          return false;
        time_point t;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (deadline > now_)
            now_ = deadline;
          if (lateness)
            now_ += lateness(sleeps_);
          t = now_;
          ++sleeps_;
        }
        if (onAdvance)
          onAdvance(t);
        return !stop.stop_requested();
      }

      /// Seconds since the clock's epoch.
      double elapsed() const {
        return spectackler::core::Seconds(now() - time_point{}).count();
      }

      std::size_t sleeps() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sleeps_;
      }

    private:
      mutable std::mutex mtx_;
      time_point now_{};
      std::size_t sleeps_{ 0 };
    };

    inline spectackler::core::Clock::time_point at(double seconds) {
      return spectackler::core::Clock::time_point{} +
             std::chrono::duration_cast<spectackler::core::Clock::time_point::duration>(
                 spectackler::core::Seconds(seconds));
    }

  } // namespace test
} // namespace spectackler

#pragma once
/** @file  Poller.hpp
 *  @brief Background sampling loop for one instrument, publishing into its mailbox.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>

#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Instrument.hpp"
#include "core/Logger.hpp"

namespace spectackler::core {

  /**
 * @class Poller
 * @brief wait for free gate → sample() → publish → yield → repeat.
 *
 *  * Transport errors are logged, reported to the ErrorMonitor and retried
 *    after `retryBackoff` for as long as the poller runs.
 *  * Protocol errors skip the update for this cycle only.
 *  * Cancellation through stop() interrupts an in-flight read.
 */
  class Poller {
  public:
    struct Options {
      std::chrono::milliseconds period{ 0 };         ///< yield between cycles
      std::chrono::milliseconds retryBackoff{ 500 }; ///< pause after a transport error
    };

    Poller(Instrument& instrument, Clock& clock, std::shared_ptr<Logger> logger,
           std::shared_ptr<ErrorMonitor> errorMonitor, Options options);
    ~Poller(); ///< stop + join

    void start();
    void stop();

    bool running() const { return worker_.joinable(); }
    std::uint64_t published() const { return published_.load(); }
    std::uint64_t failures() const { return failures_.load(); }

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

  private:
    void loop(std::stop_token stop);
    void reportFailure(const std::string& what);

    Instrument& instrument_;
    Clock& clock_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    Options options_;

    std::stop_source stopSource_;
    std::thread worker_;
    std::atomic<std::uint64_t> published_{ 0 };
    std::atomic<std::uint64_t> failures_{ 0 };
  };

} // namespace spectackler::core

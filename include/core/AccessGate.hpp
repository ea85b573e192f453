#pragma once
/** @file  AccessGate.hpp
 *  @brief Two-state free/busy gate that pauses an instrument's poller around direct commands.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace spectackler::core {

  /**
 * @class AccessGate
 * @brief Poller side calls enterSampling()/leaveSampling() around each sampling
 *        cycle; the scheduler takes a Hold around each direct command.
 *
 *  * A Hold marks the gate busy and waits for an in-flight sampling cycle to
 *    finish, so the two never interleave frames on the same wire.
 *  * Holds nest (counted), the gate reopens when the last one is released.
 */
  class AccessGate {
  public:
    /// Blocks while busy. Returns false (without entering) if \p stop is triggered.
    bool enterSampling(std::stop_token stop);
    void leaveSampling();

    void acquire(); ///< mark busy, wait out any sampling cycle
    void release(); ///< mark free once every acquire is released

    bool isFree() const;

    class Hold {
    public:
      explicit Hold(AccessGate& gate) : gate_{ gate } { gate_.acquire(); }
      ~Hold() { gate_.release(); }
      Hold(const Hold&) = delete;
      Hold& operator=(const Hold&) = delete;

    private:
      AccessGate& gate_;
    };

  private:
    mutable std::mutex mtx_;
    std::condition_variable_any cv_;
    int holds_{ 0 };
    bool sampling_{ false };
  };

} // namespace spectackler::core

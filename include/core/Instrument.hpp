#pragma once
/** @file  Instrument.hpp
 *  @brief Capability interface every device driver implements.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <stdexcept>
#include <stop_token>
#include <string>

#include "core/AccessGate.hpp"
#include "core/Mailbox.hpp"
#include "core/Sample.hpp"

namespace spectackler::core {

  /// Self-test, configuration or plan problem detected before any motion command.
  class SetupError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
 * @class Instrument
 * @brief One connected device: its sampling query set, shutdown behaviour,
 *        latest-Sample mailbox and free/busy gate.
 *
 *  * Drivers run their identity handshake in the constructor and throw
 *    SetupError if the device does not answer like the expected model.
 *  * `sample()` is only ever called from the device's Poller.
 */
  class Instrument {
  public:
    explicit Instrument(std::string name) : name_{ std::move(name) } {}
    virtual ~Instrument() = default;

    const std::string& name() const { return name_; }

    /// One pass of the device's standard query set.
    virtual Fields sample(std::stop_token stop) = 0;

    /// Puts the device in its safe resting state (motion paused, outputs off).
    virtual void shutdown(std::stop_token stop) = 0;

    /// Drains and releases the port. Idempotent.
    virtual void disconnect() = 0;

    Mailbox& mailbox() { return mailbox_; }
    const Mailbox& mailbox() const { return mailbox_; }
    AccessGate& gate() { return gate_; }

    Instrument(const Instrument&) = delete;
    Instrument& operator=(const Instrument&) = delete;

  private:
    std::string name_;
    Mailbox mailbox_;
    AccessGate gate_;
  };

} // namespace spectackler::core

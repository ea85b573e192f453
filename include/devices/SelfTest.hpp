#pragma once
/** @file  SelfTest.hpp
 *  @brief Turns communication failures during a connection handshake into SetupError.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <string>
#include <utility>

#include "core/Instrument.hpp"
#include "io/TransportError.hpp"
#include "protocols/Frame.hpp"

namespace spectackler::devices {

  /// Runs \p check; a transport or protocol failure means the port is not the expected model.
  template <typename Check> auto selfTest(const std::string& model, const std::string& port,
                                          Check&& check) {
    try {
      return std::forward<Check>(check)();
    } catch (const io::OperationCancelled&) {
      throw;
    } catch (const io::TransportError& e) {
      throw core::SetupError("[" + model + "] " + port + " is not answering: " + e.what());
    } catch (const protocols::ProtocolError& e) {
      throw core::SetupError("[" + model + "] " + port + " is not behaving like an " + model +
                             ": " + e.what());
    }
  }

} // namespace spectackler::devices

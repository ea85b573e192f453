#pragma once
/** @file  TransportError.hpp
 *  @brief Exceptions raised when a serial link cannot deliver a command/response cycle.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace spectackler {
  namespace io {

    /// Port disconnect, write failure, read timeout, or exhausted protocol retries.
    class TransportError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A blocking call gave up because its stop_token was triggered.
    class OperationCancelled : public std::runtime_error {
    public:
      OperationCancelled() : std::runtime_error("operation cancelled") {}
      explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
    };

  } // namespace io
} // namespace spectackler

#pragma once
/** @file  DeviceLink.hpp
 *  @brief Serial transport + lock + bounded-retry command/response cycle for one device.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

// spectackler headers
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Response.hpp"
#include "protocols/WireProtocol.hpp"

namespace spectackler {
  namespace core {

    /**
 * @class DeviceLink
 * @brief Owns one SerialChannel and the WireProtocol spoken over it.
 *
 *  * `query()` holds the link mutex for the whole cycle, so at most one
 *    command frame is in flight per device.
 *  * Protocol errors (checksum, echoed leader, handshake signal) are logged
 *    with attempt count and retried up to `maxAttempts`; exhausting the bound
 *    is reported as io::TransportError.
 *  * protocols::UnsupportedCommand, io::TransportError and
 *    io::OperationCancelled propagate immediately.
 */
    class DeviceLink {
    public:
      static constexpr std::size_t kDefaultAttempts = 5;

      DeviceLink(std::string name, std::unique_ptr<io::SerialChannel> channel,
                 std::unique_ptr<protocols::WireProtocol> protocol,
                 std::shared_ptr<Logger> logger, std::size_t maxAttempts = kDefaultAttempts);
      ~DeviceLink();

      /// Opens \p config.port with a fresh SerialChannel; throws io::TransportError on failure.
      static std::unique_ptr<DeviceLink> open(std::string name, const io::SerialConfig& config,
                                              std::unique_ptr<protocols::WireProtocol> protocol,
                                              std::shared_ptr<Logger> logger,
                                              std::size_t maxAttempts = kDefaultAttempts);

      //---public API------------------------------------------------------
      protocols::Response query(const protocols::Bytes& frame, std::stop_token stop = {});

      /// Runs \p fn with the link lock held (line housekeeping outside a query cycle).
      void exclusive(const std::function<void(io::SerialChannel&, protocols::WireProtocol&)>& fn);

      /// Drains both directions and closes the port. Idempotent.
      void disconnect();

      const std::string& name() const { return name_; }
      std::size_t maxAttempts() const { return maxAttempts_; }

      DeviceLink(const DeviceLink&) = delete;
      DeviceLink& operator=(const DeviceLink&) = delete;

    private:
      std::string name_;
      std::unique_ptr<io::SerialChannel> channel_;
      std::unique_ptr<protocols::WireProtocol> protocol_;
      std::shared_ptr<Logger> logger_;
      std::size_t maxAttempts_;
      std::mutex mtx_; ///< one in-flight frame per device
    };

  } // namespace core
} // namespace spectackler

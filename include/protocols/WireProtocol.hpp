#pragma once
/** @file  WireProtocol.hpp
 *  @brief Abstract command/response cycle over one serial link.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <stop_token>
#include <string>

#include "protocols/Frame.hpp"
#include "protocols/Response.hpp"

namespace spectackler::io {
  class SerialChannel;
}

namespace spectackler::protocols {

  /**
 * @class WireProtocol
 * @brief One implementation per instrument family (DASNET, NESLAB binary,
 *        Shimadzu handshake, plain ASCII).
 *
 *  * Called by DeviceLink with the link lock held and stale input flushed.
 *  * Performs exactly one attempt; retrying is DeviceLink's job.
 */
  class WireProtocol {
  public:
    virtual ~WireProtocol() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Send an encoded request frame and read back its validated reply.
     *
     * @throws ProtocolError          reply arrived but failed validation (retryable)
     * @throws io::TransportError     write failed, timed out or the port dropped
     * @throws io::OperationCancelled \p stop was triggered mid-exchange
     */
    virtual Response exchange(io::SerialChannel& channel, const Bytes& frame,
                              std::stop_token stop) = 0;

  protected:
    // shared plumbing: translate SerialChannel's optional/bool results into exceptions
    void send(io::SerialChannel& channel, const Bytes& bytes) const;
    Bytes receive(io::SerialChannel& channel, std::size_t count, const std::stop_token& stop) const;
    Bytes receiveUntil(io::SerialChannel& channel, std::uint8_t terminator,
                       const std::stop_token& stop) const;
  };

} // namespace spectackler::protocols

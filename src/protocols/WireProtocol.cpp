/* @file WireProtocol.cpp
 * @brief shared send/receive helpers for the concrete wire protocols
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/WireProtocol.hpp"

#include "io/SerialChannel.hpp"
#include "io/TransportError.hpp"

using namespace spectackler::protocols;
using spectackler::io::OperationCancelled;
using spectackler::io::TransportError;

void WireProtocol::send(io::SerialChannel& channel, const Bytes& bytes) const {
  if (!channel.write(bytes))
    throw TransportError("[" + name() + "] write failed");
}

Bytes WireProtocol::receive(io::SerialChannel& channel, std::size_t count,
                            const std::stop_token& stop) const {
  auto bytes = channel.read(count, stop);
  if (bytes)
    return *bytes;
  if (stop.stop_requested())
    throw OperationCancelled("[" + name() + "] read cancelled");
  if (!channel.isOpen())
    throw TransportError("[" + name() + "] port closed");
  throw TransportError("[" + name() + "] read timeout waiting for " + std::to_string(count) +
                       " byte(s)");
}

Bytes WireProtocol::receiveUntil(io::SerialChannel& channel, std::uint8_t terminator,
                                 const std::stop_token& stop) const {
  auto bytes = channel.readUntil(terminator, stop);
  if (bytes)
    return *bytes;
  if (stop.stop_requested())
    throw OperationCancelled("[" + name() + "] read cancelled");
  if (!channel.isOpen())
    throw TransportError("[" + name() + "] port closed");
  throw TransportError("[" + name() + "] read timeout waiting for terminator " +
                       hexByte(terminator));
}

/* @file DeviceLink.cpp
 * @brief locked, bounded-retry command/response cycles over one serial link
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// spectackler headers
#include "core/DeviceLink.hpp"
#include "core/Retry.hpp"
#include "io/TransportError.hpp"

using namespace spectackler::core;
using spectackler::io::TransportError;
using spectackler::protocols::ProtocolError;
using spectackler::protocols::Response;
using spectackler::protocols::UnsupportedCommand;

DeviceLink::DeviceLink(std::string name, std::unique_ptr<io::SerialChannel> channel,
                       std::unique_ptr<protocols::WireProtocol> protocol,
                       std::shared_ptr<Logger> logger, std::size_t maxAttempts)
    : name_(std::move(name)), channel_(std::move(channel)), protocol_(std::move(protocol)),
      logger_(std::move(logger)), maxAttempts_(maxAttempts) {
  if (!channel_ || !protocol_ || !logger_)
    throw std::invalid_argument("[DeviceLink] " + name_ + ": channel, protocol and logger required");
  if (maxAttempts_ == 0)
    throw std::invalid_argument("[DeviceLink] " + name_ + ": retry bound must be at least 1");
}

DeviceLink::~DeviceLink() { disconnect(); }

std::unique_ptr<DeviceLink> DeviceLink::open(std::string name, const io::SerialConfig& config,
                                             std::unique_ptr<protocols::WireProtocol> protocol,
                                             std::shared_ptr<Logger> logger,
                                             std::size_t maxAttempts) {
  auto channel = std::make_unique<io::SerialChannel>();
  if (!channel->open(config))
    throw TransportError("[DeviceLink] " + name + ": serial device " + config.port +
                         " open failed");
  logger->info("DeviceLink", name + " connected on " + config.port + " (" + protocol->name() + ")");
  return std::make_unique<DeviceLink>(std::move(name), std::move(channel), std::move(protocol),
                                      std::move(logger), maxAttempts);
}

Response DeviceLink::query(const protocols::Bytes& frame, std::stop_token stop) {
  std::lock_guard<std::mutex> lock(mtx_);

  if (!channel_->isOpen())
    throw TransportError("[DeviceLink] " + name_ + ": not connected");

  Response response;
  std::string lastError;
  const auto result = retryBounded(maxAttempts_, [&](std::size_t attempt) {
    channel_->flushInput();
    try {
      response = protocol_->exchange(*channel_, frame, stop);
      return true;
    } catch (const UnsupportedCommand&) {
      throw; // same frame would fail again
    } catch (const ProtocolError& e) {
      lastError = e.what();
      logger_->warn(name_, "attempt " + std::to_string(attempt) + "/" +
                               std::to_string(maxAttempts_) + ": " + lastError);
      return false;
    }
  });

  if (!result)
    throw TransportError("[DeviceLink] " + name_ + ": no valid reply after " +
                         std::to_string(result.attempts) + " attempts (" + lastError + ")");
  return response;
}

void DeviceLink::exclusive(
    const std::function<void(io::SerialChannel&, protocols::WireProtocol&)>& fn) {
  std::lock_guard<std::mutex> lock(mtx_);
  fn(*channel_, *protocol_);
}

void DeviceLink::disconnect() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (channel_ && channel_->isOpen()) {
    channel_->drain();
    channel_->close();
    logger_->info("DeviceLink", name_ + " disconnected");
  }
}

/* @file Spectrofluorometer.cpp
 * @brief RF-5301 command set on top of the handshake protocol
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/Spectrofluorometer.hpp"

#include <cstdio>
#include <cstdlib>

#include "devices/SelfTest.hpp"
#include "protocols/ShimadzuCodec.hpp"

using namespace spectackler::devices;
using spectackler::core::AccessGate;
using spectackler::core::SetupError;
using spectackler::protocols::ProtocolError;
namespace shimadzu = spectackler::protocols::shimadzu;

namespace {
  constexpr const char* kPost = "#";
  constexpr const char* kSerial = "V";
  constexpr const char* kRom = "CR";
  constexpr const char* kMemoryCheck = "C";
  constexpr const char* kOpticsCheck = "I";
  constexpr const char* kLampHours = "E";
  constexpr const char* kShutterOpen = "N1";
  constexpr const char* kShutterClose = "N2";
  constexpr const char* kReading = "R";
  constexpr const char* kExcitation = "WX";
  constexpr const char* kEmission = "WM";

  long parseHex(const std::string& hex, const std::string& what) {
    char* end = nullptr;
    const long v = std::strtol(hex.c_str(), &end, 16);
    if (hex.empty() || *end != '\0')
      throw ProtocolError("[RF5301] " + what + ": bad hex '" + hex + "'");
    return v;
  }
} // namespace

Spectrofluorometer::Spectrofluorometer(std::string name, std::unique_ptr<core::DeviceLink> link,
                                       std::stop_token stop)
    : Instrument(std::move(name)), link_(std::move(link)) {
  selfTest("RF-5301", this->name(), [&] {
    link_->exclusive([&](io::SerialChannel& ch, protocols::WireProtocol& wire) {
      if (auto* handshake = dynamic_cast<protocols::ShimadzuProtocol*>(&wire))
        handshake->clearLine(ch, stop);
    });

    // POST flag "1": instrument was just powered on and wants its self-test
    if (ask(kPost, stop) == "1") {
      memoryCheck(stop);
      opticsCheck(stop);
    }
    serial_ = ask(kSerial, stop);
    rom_ = ask(kRom, stop);
    lampHours_ = static_cast<double>(parseHex(ask(kLampHours, stop), "lamp hours"));
  });
}

std::string Spectrofluorometer::ask(const std::string& message, std::stop_token stop) {
  return shimadzu::stripEcho(link_->query(shimadzu::encode(message), stop).text(), message);
}

// ROM, RAM and EEPROM all pass: "R1"
void Spectrofluorometer::memoryCheck(std::stop_token stop) {
  const std::string result = ask(kMemoryCheck, stop);
  if (result != "R1")
    throw SetupError("[RF5301] memory check failed: '" + result + "'");
}

// Block 0 is the receipt; each further block is "I" + checkpoint letter + status digit, 0 = pass.
void Spectrofluorometer::opticsCheck(std::stop_token stop) {
  const auto reply = link_->query(shimadzu::encode(kOpticsCheck), stop);
  if (reply.blocks.size() < 2)
    throw SetupError("[RF5301] optics check failed: no checkpoints reported");

  for (std::size_t i = 1; i < reply.blocks.size(); ++i) {
    std::string status = protocols::toString(reply.blocks[i]);
    if (status.rfind(kOpticsCheck, 0) == 0)
      status.erase(0, 1);
    if (status.size() < 2 || status.back() != '0')
      throw SetupError("[RF5301] optics check failed: checkpoint '" + status + "'");
  }
}

double Spectrofluorometer::wavelength(const std::string& message, std::stop_token stop) {
  return Wavelength::fromCounts(static_cast<std::int32_t>(parseHex(ask(message, stop), message)))
      .value();
}

spectackler::core::Fields Spectrofluorometer::sample(std::stop_token stop) {
  const std::string reading = ask(kReading, stop);
  if (reading.size() < 6)
    throw ProtocolError("[RF5301] reading too short: '" + reading + "'");

  core::Fields f;
  f["intensity"] = shimadzu::hex24(reading.substr(reading.size() - 6)) / 1000.0;
  f["wl_ex"] = wavelength(kExcitation, stop);
  f["wl_em"] = wavelength(kEmission, stop);
  return f;
}

void Spectrofluorometer::setShutter(bool open, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  ask(open ? kShutterOpen : kShutterClose, stop);
}

std::pair<double, double> Spectrofluorometer::wavelengths(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return { wavelength(kExcitation, stop), wavelength(kEmission, stop) };
}

std::string Spectrofluorometer::wavelengthMessage(double excitation, double emission) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "WA%04X%04X",
                static_cast<unsigned>(Wavelength::fromValue(excitation).counts()),
                static_cast<unsigned>(Wavelength::fromValue(emission).counts()));
  return buf;
}

bool Spectrofluorometer::supportsWavelengths(double excitation, double emission) {
  if (excitation <= 0 || emission <= 0 || excitation >= 6553.5 || emission >= 6553.5)
    return false;
  const std::string msg = wavelengthMessage(excitation, emission);
  protocols::Bytes framed{ shimadzu::kStx };
  const auto body = shimadzu::toWire(msg);
  framed.insert(framed.end(), body.begin(), body.end());
  framed.push_back(shimadzu::kEtx);
  return shimadzu::knownChecksum(framed).has_value();
}

void Spectrofluorometer::setWavelengths(double excitation, double emission, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  ask(wavelengthMessage(excitation, emission), stop); // UnsupportedCommand outside the presets
}

bool Spectrofluorometer::wavelengthsAre(double excitation, double emission, std::stop_token stop) {
  const auto [ex, em] = wavelengths(stop);
  return Wavelength::fromValue(ex) == Wavelength::fromValue(excitation) &&
         Wavelength::fromValue(em) == Wavelength::fromValue(emission);
}

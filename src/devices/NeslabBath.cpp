/* @file NeslabBath.cpp
 * @brief NESLAB RTE register reads/writes
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/NeslabBath.hpp"

#include "devices/SelfTest.hpp"

using namespace spectackler::devices;
using spectackler::core::AccessGate;
using spectackler::core::PidDrive;
using spectackler::core::PidGains;
using spectackler::core::SetupError;
using spectackler::protocols::Bytes;
using spectackler::protocols::ProtocolError;
namespace neslab = spectackler::protocols::neslab;

namespace {
  // register map
  constexpr std::uint8_t kTempInternal = 0x20;
  constexpr std::uint8_t kTempExternal = 0x21;
  constexpr std::uint8_t kReadLowFault = 0x40;
  constexpr std::uint8_t kReadHighFault = 0x60;
  constexpr std::uint8_t kReadSetpoint = 0x70;
  constexpr std::uint8_t kReadHeatP = 0x71; // +1 I, +2 D, +3 for the cool drive
  constexpr std::uint8_t kWriteBit = 0x80;
  constexpr std::uint8_t kStatus = 0x09;
  constexpr std::uint8_t kStatusSet = 0x81;
  constexpr std::uint8_t kNoChange = 0x02;

  std::uint8_t pidRegister(PidDrive drive, int term) {
    return static_cast<std::uint8_t>(kReadHeatP + (drive == PidDrive::Cool ? 3 : 0) + term);
  }

  using Integral = spectackler::core::Decimal<2>;
} // namespace

NeslabBath::Options NeslabBath::Options::fromJson(const nlohmann::json& j) {
  Options o;
  if (auto it = j.find("multidrop"); it != j.end()) {
    if (!it->is_boolean())
      throw SetupError("[NESLAB] option 'multidrop' must be true or false");
    o.addressing.multidrop = it->get<bool>();
  }
  if (auto it = j.find("address"); it != j.end()) {
    if (!it->is_number_unsigned() || it->get<unsigned>() < 1 || it->get<unsigned>() > 63)
      throw SetupError("[NESLAB] option 'address' must be in range [1,63]");
    o.addressing.address = static_cast<std::uint8_t>(it->get<unsigned>());
  }
  if (auto it = j.find("rtd_cal"); it != j.end()) {
    if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number() || !(*it)[1].is_number() ||
        (*it)[0].get<double>() == 0.0)
      throw SetupError("[NESLAB] option 'rtd_cal' must be [slope, intercept] with slope != 0");
    o.calibration = { (*it)[0].get<double>(), (*it)[1].get<double>() };
  }
  if (auto it = j.find("probe"); it != j.end()) {
    if (!it->is_string() || (*it != "ext" && *it != "int"))
      throw SetupError("[NESLAB] option 'probe' must be \"ext\" or \"int\"");
    o.externalProbe = (*it == "ext");
  }
  return o;
}

NeslabBath::NeslabBath(std::string name, std::unique_ptr<core::DeviceLink> link, Options options,
                       std::stop_token stop)
    : Instrument(std::move(name)), link_(std::move(link)), options_(options) {
  selfTest("NESLAB RTE", this->name(), [&] { neslab::decodeStatus(query(kStatus, {}, stop)); });
}

Bytes NeslabBath::query(std::uint8_t command, const Bytes& data, std::stop_token stop) {
  return link_->query(neslab::encode({ command }, data, options_.addressing), stop).payload();
}

double NeslabBath::value(std::uint8_t command, std::stop_token stop) {
  return neslab::decodeValue(query(command, {}, stop));
}

spectackler::core::Fields NeslabBath::sample(std::stop_token stop) {
  const double internal = value(kTempInternal, stop);
  const double external = value(kTempExternal, stop);
  core::Fields f;
  f["T_int"] = internal;
  f["T_ext"] = external;
  f["T_act"] = options_.calibration.ref2act(options_.externalProbe ? external : internal);
  return f;
}

double NeslabBath::temperatureSetpoint(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return options_.calibration.ref2act(value(kReadSetpoint, stop));
}

void NeslabBath::setTemperatureSetpoint(double actual, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  const auto ref = Setpoint::fromValue(options_.calibration.act2ref(actual));
  query(kReadSetpoint | kWriteBit, neslab::encodeInt16(ref.toInt16()), stop);
}

bool NeslabBath::temperatureSetpointIs(double actual, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  const auto read = Setpoint::fromValue(value(kReadSetpoint, stop));
  return read == Setpoint::fromValue(options_.calibration.act2ref(actual));
}

void NeslabBath::setRunning(bool on, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  Bytes switches(8, kNoChange);
  switches[0] = on ? 0x01 : 0x00;
  const Bytes echoed = query(kStatusSet, switches, stop);
  if (echoed != switches)
    throw ProtocolError("[NESLAB] status switches not accepted: sent " +
                        protocols::hexDump(switches) + "; read " + protocols::hexDump(echoed));
}

PidGains NeslabBath::pid(PidDrive drive, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return { value(pidRegister(drive, 0), stop), value(pidRegister(drive, 1), stop),
           value(pidRegister(drive, 2), stop) };
}

void NeslabBath::setPid(PidDrive drive, const PidGains& gains, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  query(pidRegister(drive, 0) | kWriteBit, neslab::encodeInt16(Band::fromValue(gains.p).toInt16()),
        stop);
  query(pidRegister(drive, 1) | kWriteBit,
        neslab::encodeInt16(Integral::fromValue(gains.i).toInt16()), stop);
  query(pidRegister(drive, 2) | kWriteBit, neslab::encodeInt16(Band::fromValue(gains.d).toInt16()),
        stop);
}

bool NeslabBath::pidIs(PidDrive drive, const PidGains& gains, std::stop_token stop) {
  const PidGains read = pid(drive, stop);
  return Band::fromValue(read.p) == Band::fromValue(gains.p) &&
         Integral::fromValue(read.i) == Integral::fromValue(gains.i) &&
         Band::fromValue(read.d) == Band::fromValue(gains.d);
}

std::vector<std::pair<std::string, bool>> NeslabBath::status(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return neslab::decodeStatus(query(kStatus, {}, stop));
}

double NeslabBath::lowFault(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return value(kReadLowFault, stop);
}

void NeslabBath::setLowFault(double limit, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  query(kReadLowFault | kWriteBit, neslab::encodeInt16(Band::fromValue(limit).toInt16()), stop);
}

double NeslabBath::highFault(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return value(kReadHighFault, stop);
}

void NeslabBath::setHighFault(double limit, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  query(kReadHighFault | kWriteBit, neslab::encodeInt16(Band::fromValue(limit).toInt16()), stop);
}

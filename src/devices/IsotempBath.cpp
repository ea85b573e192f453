/* @file IsotempBath.cpp
 * @brief Isotemp 6200 serial command table
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/IsotempBath.hpp"

#include <cstdio>

#include "devices/SelfTest.hpp"
#include "protocols/AsciiCodec.hpp"

using namespace spectackler::devices;
using spectackler::core::AccessGate;
using spectackler::core::PidDrive;
using spectackler::core::PidGains;
using spectackler::core::SetupError;
using spectackler::protocols::ProtocolError;
namespace ascii = spectackler::protocols::ascii;

namespace {
  using Band = spectackler::core::Decimal<1>;
  using Integral = spectackler::core::Decimal<2>;

  std::string formatted(const char* command, double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %.2f", command, value);
    return buf;
  }

  // heat drive suffix H, cool drive suffix C ("RPH", "SIC" ...)
  std::string pidCommand(char op, char term, PidDrive drive) {
    return std::string{ op, term, drive == PidDrive::Heat ? 'H' : 'C' };
  }
} // namespace

IsotempBath::Options IsotempBath::Options::fromJson(const nlohmann::json& j) {
  Options o;
  if (auto it = j.find("rtd_cal"); it != j.end()) {
    if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number() || !(*it)[1].is_number() ||
        (*it)[0].get<double>() == 0.0)
      throw SetupError("[Isotemp6200] option 'rtd_cal' must be [slope, intercept] with slope != 0");
    o.calibration = { (*it)[0].get<double>(), (*it)[1].get<double>() };
  }
  if (auto it = j.find("probe"); it != j.end()) {
    if (!it->is_string() || (*it != "ext" && *it != "int"))
      throw SetupError("[Isotemp6200] option 'probe' must be \"ext\" or \"int\"");
    o.externalProbe = (*it == "ext");
  }
  return o;
}

IsotempBath::IsotempBath(std::string name, std::unique_ptr<core::DeviceLink> link,
                         Options options, std::stop_token stop)
    : Instrument(std::move(name)), link_(std::move(link)), options_(options) {
  rsum_ = selfTest("Isotemp 6200", this->name(), [&] { return ask("RSUM", stop); });
  if (rsum_.size() != 4)
    throw SetupError("[Isotemp6200] " + this->name() + " is not behaving like an Isotemp 6200: " +
                     "RSUM returned '" + rsum_ + "'");
}

std::string IsotempBath::ask(const std::string& command, std::stop_token stop) {
  return link_->query(ascii::encode(command), stop).text();
}

double IsotempBath::number(const std::string& command, std::stop_token stop) {
  const std::string reply = ask(command, stop);
  const auto v = ascii::parseNumber(reply);
  if (!v)
    throw ProtocolError("[Isotemp6200] " + command + ": no number in reply '" + reply + "'");
  return *v;
}

void IsotempBath::set(const std::string& command, std::stop_token stop) {
  const std::string reply = ask(command, stop);
  if (!ascii::isOk(reply))
    throw ProtocolError("[Isotemp6200] '" + command + "' rejected: " + reply);
}

spectackler::core::Fields IsotempBath::sample(std::stop_token stop) {
  const double internal = number("RT", stop);
  const double external = number("RT2", stop);
  core::Fields f;
  f["T_int"] = internal;
  f["T_ext"] = external;
  f["T_act"] = options_.calibration.ref2act(options_.externalProbe ? external : internal);
  return f;
}

double IsotempBath::temperatureSetpoint(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return options_.calibration.ref2act(number("RS", stop));
}

void IsotempBath::setTemperatureSetpoint(double actual, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  const auto ref = Setpoint::fromValue(options_.calibration.act2ref(actual));
  set(formatted("SS", ref.value()), stop);
}

bool IsotempBath::temperatureSetpointIs(double actual, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return Setpoint::fromValue(number("RS", stop)) ==
         Setpoint::fromValue(options_.calibration.act2ref(actual));
}

void IsotempBath::setRunning(bool on, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  set(on ? "SO 1" : "SO 0", stop);
}

void IsotempBath::setExternalProbe(bool on, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  set(on ? "SE 1" : "SE 0", stop);
}

PidGains IsotempBath::pid(PidDrive drive, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return { number(pidCommand('R', 'P', drive), stop), number(pidCommand('R', 'I', drive), stop),
           number(pidCommand('R', 'D', drive), stop) };
}

void IsotempBath::setPid(PidDrive drive, const PidGains& gains, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  set(formatted(pidCommand('S', 'P', drive).c_str(), gains.p), stop);
  set(formatted(pidCommand('S', 'I', drive).c_str(), gains.i), stop);
  set(formatted(pidCommand('S', 'D', drive).c_str(), gains.d), stop);
}

bool IsotempBath::pidIs(PidDrive drive, const PidGains& gains, std::stop_token stop) {
  const PidGains read = pid(drive, stop);
  return Band::fromValue(read.p) == Band::fromValue(gains.p) &&
         Integral::fromValue(read.i) == Integral::fromValue(gains.i) &&
         Band::fromValue(read.d) == Band::fromValue(gains.d);
}

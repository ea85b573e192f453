/* @file SyringePump.cpp
 * @brief ISCO 260D command set over DASNET
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/SyringePump.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "devices/SelfTest.hpp"
#include "protocols/DasnetCodec.hpp"

using namespace spectackler::devices;
using spectackler::core::AccessGate;
using spectackler::core::SetupError;
using spectackler::protocols::ProtocolError;

namespace {
  char digit(const nlohmann::json& j, const char* key, char fallback) {
    auto it = j.find(key);
    if (it == j.end())
      return fallback;
    if (!it->is_number_unsigned() || it->get<unsigned>() > 9)
      throw SetupError(std::string("[ISCO260D] option '") + key + "' must be a digit 0-9");
    return static_cast<char>('0' + it->get<unsigned>());
  }
} // namespace

std::optional<double> spectackler::devices::dasnetValue(const std::string& reply) {
  const auto eq = reply.find('=');
  if (eq == std::string::npos)
    return std::nullopt;
  const std::string field = reply.substr(eq + 1, reply.find(',', eq) - eq - 1);
  char* end = nullptr;
  const double v = std::strtod(field.c_str(), &end);
  if (field.empty() || end == field.c_str())
    return std::nullopt;
  return v;
}

SyringePump::Options SyringePump::Options::fromJson(const nlohmann::json& j) {
  Options o;
  o.dest = digit(j, "dest", o.dest);
  o.source = digit(j, "source", o.source);
  if (auto it = j.find("air_output"); it != j.end()) {
    if (!it->is_number_unsigned())
      throw SetupError("[ISCO260D] option 'air_output' must be a non-negative integer");
    o.airOutput = it->get<unsigned>();
  }
  if (auto it = j.find("pressure_resolution"); it != j.end()) {
    if (!it->is_number() || it->get<double>() <= 0)
      throw SetupError("[ISCO260D] option 'pressure_resolution' must be positive");
    o.pressureResolution = it->get<double>();
  }
  return o;
}

SyringePump::SyringePump(std::string name, std::unique_ptr<core::DeviceLink> link,
                         Options options, std::stop_token stop)
    : Instrument(std::move(name)), link_(std::move(link)), options_(options) {
  selfTest("ISCO260D", this->name(), [&] {
    command("REMOTE", stop);
    command("CLEAR", stop);
  });
}

std::string SyringePump::command(const std::string& body, std::stop_token stop) {
  protocols::dasnet::Message msg;
  msg.dest = options_.dest;
  msg.source = options_.source;
  msg.body = body;
  return link_->query(protocols::dasnet::encode(msg), stop).text();
}

double SyringePump::numberFrom(const std::string& body, std::stop_token stop) {
  const std::string reply = command(body, stop);
  const auto v = dasnetValue(reply);
  if (!v)
    throw ProtocolError("[ISCO260D] " + body + ": no value in reply '" + reply + "'");
  return *v;
}

spectackler::core::Fields SyringePump::sample(std::stop_token stop) {
  core::Fields f;
  f["vol"] = numberFrom("VOLA", stop);
  f["P_act"] = numberFrom("PRESSA", stop);
  f["air"] = numberFrom("DIGITAL" + std::to_string(options_.airOutput), stop) != 0.0;
  return f;
}

double SyringePump::pressureSetpoint(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return numberFrom("PRESS", stop);
}

void SyringePump::setPressureSetpoint(double value, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  char body[32];
  std::snprintf(body, sizeof(body), "PRESS=%g", value);
  command(body, stop);
  command("RUN", stop);
}

bool SyringePump::pressureSetpointIs(double value, std::stop_token stop) {
  return std::fabs(pressureSetpoint(stop) - value) <= options_.pressureResolution / 2.0;
}

double SyringePump::volume(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return numberFrom("VOLA", stop);
}

void SyringePump::setAir(bool on, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  command("DIGITAL" + std::to_string(options_.airOutput) + "=" + (on ? "1" : "0"), stop);
}

bool SyringePump::air(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  return numberFrom("DIGITAL" + std::to_string(options_.airOutput), stop) != 0.0;
}

void SyringePump::pause(std::stop_token stop) {
  AccessGate::Hold hold(gate());
  command("STOP", stop);
}

void SyringePump::shutdown(std::stop_token stop) {
  setAir(false, stop);
  pause(stop);
}

/* @file AuxController.cpp
 * @brief newline-terminated command set of the aux MCU
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/AuxController.hpp"

#include <algorithm>

#include "core/SafetyMonitor.hpp" // dewpoint()
#include "devices/SelfTest.hpp"
#include "protocols/AsciiCodec.hpp"

using namespace spectackler::devices;
using spectackler::core::AccessGate;
using spectackler::core::SetupError;
using spectackler::core::Wheel;
using spectackler::protocols::ProtocolError;
namespace ascii = spectackler::protocols::ascii;

namespace {
  std::vector<std::string> labels(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
      return { "0" };
    if (!it->is_array() || it->empty())
      throw SetupError(std::string("[AuxMCU] option '") + key + "' must be a non-empty array");
    std::vector<std::string> out;
    for (const auto& v : *it) {
      if (!v.is_string())
        throw SetupError(std::string("[AuxMCU] option '") + key + "' must hold strings");
      out.push_back(v.get<std::string>());
    }
    return out;
  }

  const char* prefix(Wheel wheel) { return wheel == Wheel::Excitation ? "EX" : "EM"; }
} // namespace

AuxController::Options AuxController::Options::fromJson(const nlohmann::json& j) {
  Options o;
  o.excitationFilters = labels(j, "filters_ex");
  o.emissionFilters = labels(j, "filters_em");
  return o;
}

AuxController::AuxController(std::string name, std::unique_ptr<core::DeviceLink> link,
                             Options options, std::stop_token stop)
    : Instrument(std::move(name)), link_(std::move(link)), options_(std::move(options)) {
  selfTest("AuxMCU", this->name(), [&] {
    number("TEM", stop);
    setLamp(true, stop);
    moveWheel(Wheel::Excitation, 0, stop);
    moveWheel(Wheel::Emission, 0, stop);
  });
}

std::string AuxController::ask(const std::string& command, std::stop_token stop) {
  return link_->query(ascii::encode(command, "\n"), stop).text();
}

double AuxController::number(const std::string& command, std::stop_token stop) {
  const std::string reply = ask(command, stop);
  const auto v = ascii::parseNumber(reply);
  if (!v)
    throw ProtocolError("[AuxMCU] " + command + ": no number in reply '" + reply + "'");
  return *v;
}

spectackler::core::Fields AuxController::sample(std::stop_token stop) {
  const double temp = number("TEM", stop);
  const double hum = number("HUM", stop);
  core::Fields f;
  f["T_amb"] = temp;
  f["H_amb"] = hum;
  f["dewpt"] = core::dewpoint(hum, temp);
  f["pol_ex"] = filter(Wheel::Excitation);
  f["pol_em"] = filter(Wheel::Emission);
  return f;
}

void AuxController::setLamp(bool on, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  const std::string reply = ask(on ? "LON" : "LOF", stop);
  if (reply != (on ? "1" : "0"))
    throw ProtocolError(std::string("[AuxMCU] lamp ") + (on ? "on" : "off") +
                        " not confirmed: '" + reply + "'");
}

void AuxController::moveWheel(Wheel wheel, std::size_t index, std::stop_token stop) {
  AccessGate::Hold hold(gate());
  const std::string command = prefix(wheel) + std::to_string(index);
  const std::string reply = ask(command, stop);
  const auto reached = ascii::parseNumber(reply);
  // compared as double: a negative or fractional echo never converts to an index
  if (!reached || *reached != static_cast<double>(index))
    throw ProtocolError("[AuxMCU] " + command + ": wheel reports '" + reply + "'");
  (wheel == Wheel::Excitation ? positionEx_ : positionEm_) = index;
}

std::string AuxController::filter(Wheel wheel) const {
  const auto& names =
      wheel == Wheel::Excitation ? options_.excitationFilters : options_.emissionFilters;
  const std::size_t pos = wheel == Wheel::Excitation ? positionEx_ : positionEm_;
  return pos < names.size() ? names[pos] : std::to_string(pos);
}

bool AuxController::hasFilter(Wheel wheel, const std::string& label) const {
  const auto& names =
      wheel == Wheel::Excitation ? options_.excitationFilters : options_.emissionFilters;
  return std::find(names.begin(), names.end(), label) != names.end();
}

void AuxController::setFilter(Wheel wheel, const std::string& label, std::stop_token stop) {
  const auto& names =
      wheel == Wheel::Excitation ? options_.excitationFilters : options_.emissionFilters;
  auto it = std::find(names.begin(), names.end(), label);
  if (it == names.end())
    throw SetupError(std::string("[AuxMCU] no filter '") + label + "' on the " +
                     (wheel == Wheel::Excitation ? "excitation" : "emission") + " wheel");
  moveWheel(wheel, static_cast<std::size_t>(it - names.begin()), stop);
}

void AuxController::shutdown(std::stop_token stop) {
  setLamp(false, stop);
  moveWheel(Wheel::Excitation, 0, stop);
  moveWheel(Wheel::Emission, 0, stop);
}

/* @file SystemCoordinator.cpp
 * @brief run lifecycle: connect, bind, supervise, shut down
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/SystemCoordinator.hpp"

#include <algorithm>
#include <optional>

#include "core/Capabilities.hpp"
#include "core/ShutdownSequence.hpp"
#include "io/TransportError.hpp"

using namespace spectackler::core;

namespace {
  constexpr const char* kTag = "SystemCoordinator";

  double numberIn(const ExperimentState& state, const std::string& field) {
    const auto v = state.number(field);
    if (!v)
      throw SetupError("[SystemCoordinator] column '" + field + "' must be numeric");
    return *v;
  }

  std::string labelIn(const ExperimentState& state, const std::string& field) {
    const auto v = state.get(field);
    if (!v)
      throw SetupError("[SystemCoordinator] state has no column '" + field + "'");
    return formatValue(*v);
  }

  PidGains gainsIn(const ExperimentState& state, char prefix) {
    const std::string p(1, prefix);
    return PidGains{ numberIn(state, p + "p"), numberIn(state, p + "i"), numberIn(state, p + "d") };
  }

  bool hasColumn(const StatePlan& plan, const std::string& field) {
    return std::find(plan.columns().begin(), plan.columns().end(), field) != plan.columns().end();
  }
} // namespace

const char* spectackler::core::toString(SystemCoordinator::State s) {
  switch (s) {
  case SystemCoordinator::State::BOOT:
    return "BOOT";
  case SystemCoordinator::State::INIT:
    return "INIT";
  case SystemCoordinator::State::RUNNING:
    return "RUNNING";
  case SystemCoordinator::State::FINISHED:
    return "FINISHED";
  case SystemCoordinator::State::ERROR:
    return "ERROR";
  default:
    return "Unknown";
  }
}

SystemCoordinator::SystemCoordinator(ExperimentConfig config, const InstrumentFactory& factory,
                                     Clock& clock, std::shared_ptr<Logger> logger,
                                     std::shared_ptr<ErrorMonitor> errorMonitor)
    : config_{ std::move(config) }, factory_{ factory }, clock_{ clock },
      logger_{ std::move(logger) }, errorMonitor_{ std::move(errorMonitor) },
      safety_{ config_.safety } {
  errorMonitor_->registerEscalation(
      [log = logger_](const std::string& msg) { log->error(kTag, "fault: " + msg); });
}

SystemCoordinator::~SystemCoordinator() {
  stopPollers();
  for (auto& c : instruments_)
    c.instrument->disconnect();
}

void SystemCoordinator::transitionTo(State next) {
  logger_->info(kTag, std::string(toString(currentState_)) + " -> " + toString(next));
  currentState_ = next;
}

Instrument* SystemCoordinator::instrument(const std::string& role) const {
  for (const auto& c : instruments_)
    if (c.role == role)
      return c.instrument.get();
  return nullptr;
}

//------------------------------------------------------------------------------
// INIT
//------------------------------------------------------------------------------
void SystemCoordinator::connect(std::stop_token stop) {
  for (const auto& ic : config_.instruments) {
    logger_->info(kTag, "connecting " + ic.role + " (" + ic.driver + ") on " + ic.serial.port);
    DriverContext ctx{ ic, logger_, config_.retryAttempts, stop };
    try {
      instruments_.push_back({ ic.role, factory_.create(ctx) });
    } catch (const io::TransportError& e) {
      throw SetupError("[SystemCoordinator] cannot connect " + ic.role + ": " + e.what());
    }
  }
}

std::vector<SetpointBinding> SystemCoordinator::buildBindings() const {
  std::vector<SetpointBinding> bindings;

  if (auto* bath = find<Thermostat>()) {
    bindings.push_back(
        { "bath temperature",
          { "T_set" },
          [bath](const ExperimentState& s, std::stop_token stop) {
            return bath->temperatureSetpointIs(numberIn(s, "T_set"), stop);
          },
          [bath](const ExperimentState& s, std::stop_token stop) {
            bath->setTemperatureSetpoint(numberIn(s, "T_set"), stop);
          } });
    for (const auto& [prefix, drive] : { std::pair{ 'H', PidDrive::Heat },
                                         std::pair{ 'C', PidDrive::Cool } }) {
      const std::string p(1, prefix);
      bindings.push_back(
          { drive == PidDrive::Heat ? "bath heat PID" : "bath cool PID",
            { p + "p", p + "i", p + "d" },
            [bath, prefix = prefix, drive = drive](const ExperimentState& s, std::stop_token stop) {
              return bath->pidIs(drive, gainsIn(s, prefix), stop);
            },
            [bath, prefix = prefix, drive = drive](const ExperimentState& s, std::stop_token stop) {
              bath->setPid(drive, gainsIn(s, prefix), stop);
            } });
    }
  }

  if (auto* pump = find<PressureRegulator>()) {
    bindings.push_back({ "pump pressure",
                         { "P_set" },
                         [pump](const ExperimentState& s, std::stop_token stop) {
                           return pump->pressureSetpointIs(numberIn(s, "P_set"), stop);
                         },
                         [pump](const ExperimentState& s, std::stop_token stop) {
                           pump->setPressureSetpoint(numberIn(s, "P_set"), stop);
                         } });
  }

  if (auto* mono = find<Monochromator>()) {
    bindings.push_back({ "wavelengths",
                         { "wl_ex", "wl_em" },
                         [mono](const ExperimentState& s, std::stop_token stop) {
                           return mono->wavelengthsAre(numberIn(s, "wl_ex"),
                                                       numberIn(s, "wl_em"), stop);
                         },
                         [mono](const ExperimentState& s, std::stop_token stop) {
                           mono->setWavelengths(numberIn(s, "wl_ex"), numberIn(s, "wl_em"),
                                                stop);
                         } });
  }

  if (auto* wheels = find<FilterSelector>()) {
    for (const auto& [field, wheel] : { std::pair{ "pol_ex", Wheel::Excitation },
                                        std::pair{ "pol_em", Wheel::Emission } }) {
      const std::string column = field;
      bindings.push_back({ column == "pol_ex" ? "excitation polarizer" : "emission polarizer",
                           { column },
                           [wheels, column, wheel = wheel](const ExperimentState& s,
                                                           std::stop_token) {
                             return wheels->filter(wheel) == labelIn(s, column);
                           },
                           [wheels, column, wheel = wheel](const ExperimentState& s,
                                                           std::stop_token stop) {
                             wheels->setFilter(wheel, labelIn(s, column), stop);
                           } });
    }
  }

  return bindings;
}

void SystemCoordinator::checkPlan(const StatePlan& plan) const {
  auto* mono = find<Monochromator>();
  auto* wheels = find<FilterSelector>();
  for (std::size_t i = 0; i < plan.size(); ++i) {
    const auto& s = plan[i];
    const std::string where = "[SystemCoordinator] state " + std::to_string(i) + ": ";

    for (const char* f : { "T_set", "P_set", "wl_ex", "wl_em", "Hp", "Hi", "Hd", "Cp", "Ci", "Cd" })
      if (hasColumn(plan, f) && !s.number(f))
        throw SetupError(where + "column '" + f + "' must be numeric");

    if (mono && hasColumn(plan, "wl_ex") && hasColumn(plan, "wl_em")) {
      const double ex = *s.number("wl_ex");
      const double em = *s.number("wl_em");
      if (!mono->supports(ex, em))
        throw SetupError(where + "wavelength pair " + formatValue(ex) + "/" + formatValue(em) +
                         " nm cannot be set");
    }

    if (wheels) {
      if (hasColumn(plan, "pol_ex") && !wheels->hasFilter(Wheel::Excitation, labelIn(s, "pol_ex")))
        throw SetupError(where + "no excitation filter '" + labelIn(s, "pol_ex") + "'");
      if (hasColumn(plan, "pol_em") && !wheels->hasFilter(Wheel::Emission, labelIn(s, "pol_em")))
        throw SetupError(where + "no emission filter '" + labelIn(s, "pol_em") + "'");
    }
  }
}

void SystemCoordinator::prepareHardware(std::stop_token stop) {
  if (auto* pump = find<PressureRegulator>()) {
    const double vol = pump->volume(stop);
    safety_.setBaselineVolume(vol);
    logger_->info(kTag, "initial pump volume " + formatValue(vol) + " mL");
  }
  if (auto* bath = find<Thermostat>())
    bath->setRunning(true, stop);
}

void SystemCoordinator::startPollers() {
  for (auto& c : instruments_) {
    pollers_.push_back(std::make_unique<Poller>(*c.instrument, clock_, logger_, errorMonitor_,
                                                Poller::Options{ config_.poll }));
    pollers_.back()->start();
  }
}

void SystemCoordinator::stopPollers() {
  for (auto& p : pollers_)
    p->stop();
  pollers_.clear();
}

//------------------------------------------------------------------------------
// Shutdown: pause motion, close shutter, de-energize, release ports
//------------------------------------------------------------------------------
bool SystemCoordinator::shutdown() {
  stopPollers();

  ShutdownSequence sequence(logger_, errorMonitor_);
  for (const char* role : { "pump", "spec", "aux", "bath" })
    if (auto* inst = instrument(role))
      sequence.add(std::string(role) + " safe state", [inst] { inst->shutdown(std::stop_token{}); });
  for (auto& c : instruments_)
    sequence.add(c.role + " disconnect", [inst = c.instrument.get()] { inst->disconnect(); });

  const bool ok = sequence.run();
  if (dataLogger_)
    dataLogger_->close();
  return ok;
}

int SystemCoordinator::fail(const std::string& reason, int code) {
  logger_->error(kTag, reason);
  shutdown();
  transitionTo(State::ERROR);
  return code;
}

//------------------------------------------------------------------------------
// Public API
//------------------------------------------------------------------------------
int SystemCoordinator::run(const StatePlan& plan, const std::string& logPath,
                           std::stop_token stop) {
  try {
    transitionTo(State::INIT);
    connect(stop);

    std::vector<Instrument*> all;
    for (auto& c : instruments_)
      all.push_back(c.instrument.get());
    scheduler_ = std::make_unique<StateScheduler>(config_.scheduler, all, buildBindings(), safety_,
                                                  clock_, logger_);
    StateScheduler& scheduler = *scheduler_;
    scheduler.validate(plan);
    checkPlan(plan);

    dataLogger_ = std::make_unique<DataLogger>(config_.scheduler.headline);
    if (!dataLogger_->open(logPath))
      throw SetupError("[SystemCoordinator] cannot create log file " + logPath +
                       " (exists or not writable)");
    scheduler.setDataLogger(dataLogger_.get());
    scheduler.setShutter(find<Shutter>());
    scheduler.setAirValve(find<AirValve>());
    if (callback_)
      scheduler.registerCallback(callback_);

    prepareHardware(stop);
    startPollers();
    transitionTo(State::RUNNING);

    if (!scheduler.run(plan, stop))
      return fail("run cancelled", kExitAborted);
    if (!shutdown()) {
      transitionTo(State::ERROR);
      return kExitAborted;
    }
    transitionTo(State::FINISHED);
    return kExitCompleted;
  } catch (const SetupError& e) {
    return fail(std::string("setup failed: ") + e.what(), kExitSetupFailed);
  } catch (const SafetyViolation& e) {
    return fail(std::string("safety abort: ") + e.what(), kExitAborted);
  } catch (const io::OperationCancelled& e) {
    return fail(std::string("run cancelled: ") + e.what(), kExitAborted);
  } catch (const std::exception& e) {
    return fail(std::string("run aborted: ") + e.what(), kExitAborted);
  }
}

#pragma once
/** @file  Capabilities.hpp
 *  @brief Direct-command interfaces a driver may offer besides sampling.
 *
 *  Each method is a direct command: implementations hold their instrument's
 *  AccessGate for the duration so the poller never interleaves frames.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <stop_token>
#include <string>
#include <utility>

namespace spectackler::core {

  enum class PidDrive { Heat, Cool };

  struct PidGains {
    double p{ 0.0 }; ///< proportional band, %
    double i{ 0.0 }; ///< integral, repeats/min
    double d{ 0.0 }; ///< derivative, min
  };

  /// Circulating bath. Temperatures are actual (calibrated) values.
  class Thermostat {
  public:
    virtual ~Thermostat() = default;
    virtual double temperatureSetpoint(std::stop_token stop) = 0;
    virtual void setTemperatureSetpoint(double actual, std::stop_token stop) = 0;
    /// Read-back equals \p actual at the device's own resolution.
    virtual bool temperatureSetpointIs(double actual, std::stop_token stop) = 0;
    virtual void setRunning(bool on, std::stop_token stop) = 0;

    virtual PidGains pid(PidDrive drive, std::stop_token stop) = 0;
    virtual void setPid(PidDrive drive, const PidGains& gains, std::stop_token stop) = 0;
    virtual bool pidIs(PidDrive drive, const PidGains& gains, std::stop_token stop) = 0;
  };

  /// Syringe pump in constant-pressure mode.
  class PressureRegulator {
  public:
    virtual ~PressureRegulator() = default;
    virtual double pressureSetpoint(std::stop_token stop) = 0;
    virtual void setPressureSetpoint(double value, std::stop_token stop) = 0;
    virtual bool pressureSetpointIs(double value, std::stop_token stop) = 0;
    /// Cylinder volume, mL.
    virtual double volume(std::stop_token stop) = 0;
  };

  class Shutter {
  public:
    virtual ~Shutter() = default;
    virtual void setShutter(bool open, std::stop_token stop) = 0;
  };

  class AirValve {
  public:
    virtual ~AirValve() = default;
    virtual void setAir(bool on, std::stop_token stop) = 0;
  };

  /// Excitation/emission wavelength pair, nm.
  class Monochromator {
  public:
    virtual ~Monochromator() = default;
    virtual std::pair<double, double> wavelengths(std::stop_token stop) = 0;
    virtual void setWavelengths(double excitation, double emission, std::stop_token stop) = 0;
    virtual bool wavelengthsAre(double excitation, double emission, std::stop_token stop) = 0;
    /// False if the pair cannot be commanded at all (checked before the run starts).
    virtual bool supports(double excitation, double emission) const = 0;
  };

  enum class Wheel { Excitation, Emission };

  /// Filter wheels addressed by configured label ("0", "V", "H" ...).
  class FilterSelector {
  public:
    virtual ~FilterSelector() = default;
    virtual std::string filter(Wheel wheel) const = 0;
    virtual void setFilter(Wheel wheel, const std::string& label, std::stop_token stop) = 0;
    virtual bool hasFilter(Wheel wheel, const std::string& label) const = 0;
  };

} // namespace spectackler::core

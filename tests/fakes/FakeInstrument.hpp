#pragma once
/** @file  FakeInstrument.hpp
 *  @brief In-memory instruments for poller, scheduler and coordinator tests.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <atomic>
#include <cmath>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/Capabilities.hpp"
#include "core/Instrument.hpp"

namespace spectackler {
  namespace test {

    using spectackler::core::Fields;

    /**
 * @class FakeInstrument
 * @brief sample() returns `sampler()` (or the fixed `fields`); shutdown and
 *        disconnect are counted and may be told to throw.
 */
    class FakeInstrument : public spectackler::core::Instrument {
    public:
      explicit FakeInstrument(std::string name, Fields fixed = {})
          : Instrument(std::move(name)), fields{ std::move(fixed) } {}

      Fields fields;
      std::function<Fields()> sampler{};
      bool failShutdown = false;
      std::atomic<int> samples{ 0 };
      std::atomic<int> shutdowns{ 0 };
      std::atomic<int> disconnects{ 0 };

      Fields sample(std::stop_token) override {
        ++samples;
        if (sampler)
          return sampler();
        std::lock_guard<std::mutex> lock(mtx_);
        return fields;
      }

      void shutdown(std::stop_token) override {
        ++shutdowns;
        if (failShutdown)
          throw std::runtime_error("[" + name() + "] refused to stop");
      }

      void disconnect() override { ++disconnects; }

      void set(const std::string& key, spectackler::core::FieldValue v) {
        std::lock_guard<std::mutex> lock(mtx_);
        fields[key] = std::move(v);
      }

    protected:
      std::mutex mtx_;
    };

    /// Thermostat whose setpoint read-back is exact and whose T_act follows instantly.
    class FakeBath : public FakeInstrument, public spectackler::core::Thermostat {
    public:
      explicit FakeBath(std::string name = "bath") : FakeInstrument(std::move(name)) {
        fields["T_act"] = 20.0;
      }

      double setpoint{ 20.0 };
      bool running = false;
      bool stuck = false; ///< ignores setpoint writes
      int writes = 0;
      spectackler::core::PidGains heat{}, cool{};

      double temperatureSetpoint(std::stop_token) override { return setpoint; }
      void setTemperatureSetpoint(double actual, std::stop_token) override {
        ++writes;
        if (stuck)
          return;
        setpoint = actual;
        set("T_act", actual);
      }
      bool temperatureSetpointIs(double actual, std::stop_token) override {
        return std::abs(setpoint - actual) <= 0.005;
      }
      void setRunning(bool on, std::stop_token) override { running = on; }

      spectackler::core::PidGains pid(spectackler::core::PidDrive d, std::stop_token) override {
        return d == spectackler::core::PidDrive::Heat ? heat : cool;
      }
      void setPid(spectackler::core::PidDrive d, const spectackler::core::PidGains& g,
                  std::stop_token) override {
        (d == spectackler::core::PidDrive::Heat ? heat : cool) = g;
      }
      bool pidIs(spectackler::core::PidDrive d, const spectackler::core::PidGains& g,
                 std::stop_token s) override {
        const auto cur = pid(d, s);
        return cur.p == g.p && cur.i == g.i && cur.d == g.d;
      }
    };

    class FakePump : public FakeInstrument,
                     public spectackler::core::PressureRegulator,
                     public spectackler::core::AirValve {
    public:
      explicit FakePump(std::string name = "pump") : FakeInstrument(std::move(name)) {
        fields["vol"] = 100.0;
        fields["P_act"] = 0.0;
        fields["air"] = false;
      }

      double pressure{ 0.0 };
      double vol{ 100.0 };
      std::vector<bool> airCommands;

      double pressureSetpoint(std::stop_token) override { return pressure; }
      void setPressureSetpoint(double v, std::stop_token) override {
        pressure = v;
        set("P_act", v);
      }
      bool pressureSetpointIs(double v, std::stop_token) override {
        return std::abs(pressure - v) <= 0.5;
      }
      double volume(std::stop_token) override { return vol; }
      void setAir(bool on, std::stop_token) override {
        airCommands.push_back(on);
        set("air", on);
      }
    };

    class FakeSpectrometer : public FakeInstrument,
                             public spectackler::core::Shutter,
                             public spectackler::core::Monochromator {
    public:
      explicit FakeSpectrometer(std::string name = "spec") : FakeInstrument(std::move(name)) {
        fields["intensity"] = 1.0;
      }

      std::pair<double, double> wl{ 340.0, 445.0 };
      std::vector<bool> shutterCommands;

      void setShutter(bool open, std::stop_token) override { shutterCommands.push_back(open); }
      std::pair<double, double> wavelengths(std::stop_token) override { return wl; }
      void setWavelengths(double ex, double em, std::stop_token) override { wl = { ex, em }; }
      bool wavelengthsAre(double ex, double em, std::stop_token) override {
        return wl.first == ex && wl.second == em;
      }
      bool supports(double ex, double em) const override {
        return ex == 340.0 && (em == 445.0 || em == 440.0 || em == 490.0);
      }
    };

  } // namespace test
} // namespace spectackler

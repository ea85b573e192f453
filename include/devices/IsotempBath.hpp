#pragma once
/** @file  IsotempBath.hpp
 *  @brief Thermo Isotemp 6200 circulator over CR-terminated ASCII.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <memory>
#include <stop_token>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Capabilities.hpp"
#include "core/DeviceLink.hpp"
#include "core/Instrument.hpp"
#include "core/Quantity.hpp"

namespace spectackler::devices {

  /**
 * @class IsotempBath
 * @brief Sample fields: `T_int`, `T_ext`, `T_act`.
 *
 *  Connection: `RSUM` must answer with a 4-character firmware checksum.
 *  Set commands succeed only on the literal "OK".
 */
  class IsotempBath : public core::Instrument, public core::Thermostat {
  public:
    using Setpoint = core::Decimal<2>;

    struct Options {
      core::LinearCalibration calibration{};
      bool externalProbe{ true };

      static Options fromJson(const nlohmann::json& j);
    };

    IsotempBath(std::string name, std::unique_ptr<core::DeviceLink> link, Options options,
                std::stop_token stop = {});

    core::Fields sample(std::stop_token stop) override;
    void shutdown(std::stop_token stop) override { setRunning(false, stop); }
    void disconnect() override { link_->disconnect(); }

    double temperatureSetpoint(std::stop_token stop) override;
    void setTemperatureSetpoint(double actual, std::stop_token stop) override;
    bool temperatureSetpointIs(double actual, std::stop_token stop) override;
    void setRunning(bool on, std::stop_token stop) override;
    core::PidGains pid(core::PidDrive drive, std::stop_token stop) override;
    void setPid(core::PidDrive drive, const core::PidGains& gains, std::stop_token stop) override;
    bool pidIs(core::PidDrive drive, const core::PidGains& gains, std::stop_token stop) override;

    /// `SE 1` routes control to the external probe.
    void setExternalProbe(bool on, std::stop_token stop);

    const std::string& firmwareChecksum() const { return rsum_; }

  private:
    std::string ask(const std::string& command, std::stop_token stop);
    double number(const std::string& command, std::stop_token stop);
    void set(const std::string& command, std::stop_token stop);

    std::unique_ptr<core::DeviceLink> link_;
    Options options_;
    std::string rsum_;
  };

} // namespace spectackler::devices

#pragma once
/** @file  NeslabBath.hpp
 *  @brief NESLAB RTE circulator over the binary NC protocol.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Capabilities.hpp"
#include "core/DeviceLink.hpp"
#include "core/Instrument.hpp"
#include "core/Quantity.hpp"
#include "protocols/NeslabCodec.hpp"

namespace spectackler::devices {

  /**
 * @class NeslabBath
 * @brief Sample fields: `T_int`, `T_ext`, `T_act` (control probe through the
 *        reference-to-actual calibration).
 *
 *  * Setpoints travel as Decimal<2> counts, PID bands as Decimal<1>/<2>.
 *  * Connection: the 5-byte status array must decode.
 */
  class NeslabBath : public core::Instrument, public core::Thermostat {
  public:
    using Setpoint = core::Decimal<2>;
    using Band = core::Decimal<1>;

    struct Options {
      protocols::neslab::Addressing addressing{};
      core::LinearCalibration calibration{};
      bool externalProbe{ true }; ///< T_act from the external RTD

      static Options fromJson(const nlohmann::json& j);
    };

    NeslabBath(std::string name, std::unique_ptr<core::DeviceLink> link, Options options,
               std::stop_token stop = {});

    core::Fields sample(std::stop_token stop) override;
    void shutdown(std::stop_token stop) override { setRunning(false, stop); }
    void disconnect() override { link_->disconnect(); }

    //---Thermostat------------------------------------------------------
    double temperatureSetpoint(std::stop_token stop) override;
    void setTemperatureSetpoint(double actual, std::stop_token stop) override;
    bool temperatureSetpointIs(double actual, std::stop_token stop) override;
    void setRunning(bool on, std::stop_token stop) override;
    core::PidGains pid(core::PidDrive drive, std::stop_token stop) override;
    void setPid(core::PidDrive drive, const core::PidGains& gains, std::stop_token stop) override;
    bool pidIs(core::PidDrive drive, const core::PidGains& gains, std::stop_token stop) override;

    //---NESLAB extras---------------------------------------------------
    std::vector<std::pair<std::string, bool>> status(std::stop_token stop);
    double lowFault(std::stop_token stop);
    void setLowFault(double limit, std::stop_token stop);
    double highFault(std::stop_token stop);
    void setHighFault(double limit, std::stop_token stop);

  private:
    protocols::Bytes query(std::uint8_t command, const protocols::Bytes& data,
                           std::stop_token stop);
    double value(std::uint8_t command, std::stop_token stop);

    std::unique_ptr<core::DeviceLink> link_;
    Options options_;
  };

} // namespace spectackler::devices

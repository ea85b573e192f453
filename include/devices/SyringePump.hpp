#pragma once
/** @file  SyringePump.hpp
 *  @brief ISCO 260D syringe pump over DASNET: pressure control, volume, dry-air output.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Capabilities.hpp"
#include "core/DeviceLink.hpp"
#include "core/Instrument.hpp"

namespace spectackler::devices {

  /**
 * @class SyringePump
 * @brief Sample fields: `vol` (mL), `P_act`, `air`.
 *
 *  * Connection: `REMOTE` must be acknowledged, then `CLEAR`.
 *  * The controller's digital output drives the dry-air valve.
 *  * Shutdown: air off, then `STOP`.
 */
  class SyringePump : public core::Instrument,
                      public core::PressureRegulator,
                      public core::AirValve {
  public:
    struct Options {
      char dest{ '1' };
      char source{ '0' };
      unsigned airOutput{ 0 };          ///< DIGITAL<n> wired to the valve
      double pressureResolution{ 1.0 }; ///< setpoint read-back granularity

      static Options fromJson(const nlohmann::json& j);
    };

    SyringePump(std::string name, std::unique_ptr<core::DeviceLink> link, Options options,
                std::stop_token stop = {});

    //---Instrument------------------------------------------------------
    core::Fields sample(std::stop_token stop) override;
    void shutdown(std::stop_token stop) override;
    void disconnect() override { link_->disconnect(); }

    //---PressureRegulator-----------------------------------------------
    double pressureSetpoint(std::stop_token stop) override;
    void setPressureSetpoint(double value, std::stop_token stop) override;
    bool pressureSetpointIs(double value, std::stop_token stop) override;
    double volume(std::stop_token stop) override;

    //---AirValve--------------------------------------------------------
    void setAir(bool on, std::stop_token stop) override;
    bool air(std::stop_token stop);

    void pause(std::stop_token stop); ///< `STOP`

  private:
    std::string command(const std::string& body, std::stop_token stop);
    double numberFrom(const std::string& body, std::stop_token stop);

    std::unique_ptr<core::DeviceLink> link_;
    Options options_;
  };

  /// Value after the first '=' and before any ',' ("PRESSA=1234.5,A" → 1234.5).
  std::optional<double> dasnetValue(const std::string& reply);

} // namespace spectackler::devices

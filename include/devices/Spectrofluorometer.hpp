#pragma once
/** @file  Spectrofluorometer.hpp
 *  @brief Shimadzu RF-5301 over the ENQ/ACK handshake protocol.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <memory>
#include <stop_token>
#include <string>
#include <utility>

#include "core/Capabilities.hpp"
#include "core/DeviceLink.hpp"
#include "core/Instrument.hpp"
#include "core/Quantity.hpp"

namespace spectackler::devices {

  /**
 * @class Spectrofluorometer
 * @brief Sample fields: `intensity`, `wl_ex`, `wl_em`.
 *
 *  * Only the closed command set the instrument is known to accept can be
 *    sent; wavelength pairs are limited to the stored presets.
 *  * Connection: pending ENQs are answered, the POST flag is read and the
 *    memory/optics self-test runs if the instrument was just powered on.
 *  * Shutdown: shutter closed.
 */
  class Spectrofluorometer : public core::Instrument,
                             public core::Shutter,
                             public core::Monochromator {
  public:
    using Wavelength = core::Decimal<1>;

    Spectrofluorometer(std::string name, std::unique_ptr<core::DeviceLink> link,
                       std::stop_token stop = {});

    core::Fields sample(std::stop_token stop) override;
    void shutdown(std::stop_token stop) override { setShutter(false, stop); }
    void disconnect() override { link_->disconnect(); }

    void setShutter(bool open, std::stop_token stop) override;

    std::pair<double, double> wavelengths(std::stop_token stop) override;
    void setWavelengths(double excitation, double emission, std::stop_token stop) override;
    bool wavelengthsAre(double excitation, double emission, std::stop_token stop) override;
    bool supports(double excitation, double emission) const override {
      return supportsWavelengths(excitation, emission);
    }

    /// True if the pair is one of the presets the command table can express.
    static bool supportsWavelengths(double excitation, double emission);

    /// "WA" + 4 hex digits of ex×10 + 4 hex digits of em×10.
    static std::string wavelengthMessage(double excitation, double emission);

    const std::string& serialNumber() const { return serial_; }
    const std::string& romVersion() const { return rom_; }
    double lampHours() const { return lampHours_; }

  private:
    std::string ask(const std::string& message, std::stop_token stop);
    double wavelength(const std::string& message, std::stop_token stop);
    void memoryCheck(std::stop_token stop);
    void opticsCheck(std::stop_token stop);

    std::unique_ptr<core::DeviceLink> link_;
    std::string serial_;
    std::string rom_;
    double lampHours_{ 0.0 };
  };

} // namespace spectackler::devices

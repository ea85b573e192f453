#pragma once
/** @file  AuxController.hpp
 *  @brief Auxiliary microcontroller: chamber climate, lamp interlock, polarizer wheels.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Capabilities.hpp"
#include "core/DeviceLink.hpp"
#include "core/Instrument.hpp"

namespace spectackler::devices {

  /**
 * @class AuxController
 * @brief Sample fields: `T_amb`, `H_amb`, `dewpt`, `pol_ex`, `pol_em`.
 *
 *  Connection switches the lamp interlock on and homes both wheels to index 0.
 *  Shutdown switches the lamp off and homes both wheels.
 */
  class AuxController : public core::Instrument, public core::FilterSelector {
  public:
    struct Options {
      std::vector<std::string> excitationFilters{ "0" };
      std::vector<std::string> emissionFilters{ "0" };

      static Options fromJson(const nlohmann::json& j);
    };

    AuxController(std::string name, std::unique_ptr<core::DeviceLink> link, Options options,
                  std::stop_token stop = {});

    core::Fields sample(std::stop_token stop) override;
    void shutdown(std::stop_token stop) override;
    void disconnect() override { link_->disconnect(); }

    std::string filter(core::Wheel wheel) const override;
    void setFilter(core::Wheel wheel, const std::string& label, std::stop_token stop) override;
    bool hasFilter(core::Wheel wheel, const std::string& label) const override;

    void setLamp(bool on, std::stop_token stop);

  private:
    std::string ask(const std::string& command, std::stop_token stop);
    double number(const std::string& command, std::stop_token stop);
    void moveWheel(core::Wheel wheel, std::size_t index, std::stop_token stop);

    std::unique_ptr<core::DeviceLink> link_;
    Options options_;
    std::size_t positionEx_{ 0 };
    std::size_t positionEm_{ 0 };
  };

} // namespace spectackler::devices

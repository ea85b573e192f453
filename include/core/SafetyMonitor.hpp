#pragma once
/** @file  SafetyMonitor.hpp
 *  @brief Leak and condensation interlocks evaluated every scheduler cycle.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <optional>
#include <stdexcept>
#include <string>

#include "core/Sample.hpp"

namespace spectackler::core {

  /// Fatal interlock; the run goes straight to the shutdown sequence.
  class SafetyViolation : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct SafetyConfig {
    std::string volumeField{ "vol" };
    double volDiff{ 20.0 };      ///< mL of cumulative displacement tolerated
    double dewTol{ 2.5 };        ///< °C margin above the ambient dewpoint
    double dewHysteresis{ 0.0 }; ///< extra margin before the valve closes again

    std::string sampleTempField{ "T_act" };
    std::string ambientTempField{ "T_amb" };
    std::string humidityField{ "H_amb" };
    std::string airField{ "air" };
  };

  /// Rule-of-thumb dewpoint, valid above ~50 % RH: T − (100 − RH)/5.
  double dewpoint(double relativeHumidity, double temperature);

  /**
 * @class SafetyMonitor
 * @brief Stateless checks against the merged latest fields of all instruments.
 *
 *  * Leak: fatal once `vol − vol0 > volDiff` (strict).
 *  * Condensation: valve ON when `T ≤ dewpt + dewTol` and the valve is off,
 *    OFF when `T > dewpt + dewTol + dewHysteresis` and the valve is on.
 *  * Checks whose inputs are missing from the fields are skipped.
 */
  class SafetyMonitor {
  public:
    struct Verdict {
      std::optional<std::string> fatal; ///< leak description, if any
      std::optional<bool> air;          ///< requested valve state; nullopt = leave as is
    };

    explicit SafetyMonitor(SafetyConfig config) : config_{ std::move(config) } {}

    void setBaselineVolume(double volume) { baseline_ = volume; }
    std::optional<double> baselineVolume() const { return baseline_; }

    Verdict evaluate(const Fields& fields) const;

    /// evaluate(), throwing SafetyViolation on a fatal verdict.
    std::optional<bool> enforce(const Fields& fields) const;

    const SafetyConfig& config() const { return config_; }

  private:
    SafetyConfig config_;
    std::optional<double> baseline_{};
  };

} // namespace spectackler::core

#pragma once
/** @file  Quantity.hpp
 *  @brief Fixed-point setpoint values and linear reference→actual calibration.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace spectackler {
  namespace core {

    constexpr std::int32_t pow10(unsigned places) { return places == 0 ? 1 : 10 * pow10(places - 1); }

    /**
 * @class Decimal
 * @brief Value with exactly \p Places decimal places, stored as integer counts.
 *
 *  Instruments that take scaled integers on the wire (0.01 °C, 0.1 nm …) convert
 *  through this type instead of multiplying at call sites.
 */
    template <unsigned Places> class Decimal {
    public:
      static constexpr std::int32_t kScale = pow10(Places);

      constexpr Decimal() = default;
      static Decimal fromCounts(std::int32_t counts) { return Decimal(counts); }
      static Decimal fromValue(double value) {
        return Decimal(static_cast<std::int32_t>(std::lround(value * kScale)));
      }

      static constexpr double resolution() { return 1.0 / kScale; }

      std::int32_t counts() const { return counts_; }
      double value() const { return static_cast<double>(counts_) / kScale; }

      /// Counts as the int16 most wire formats carry; throws std::out_of_range if it won't fit.
      std::int16_t toInt16() const {
        if (counts_ < INT16_MIN || counts_ > INT16_MAX)
          throw std::out_of_range("value does not fit a 16-bit wire field");
        return static_cast<std::int16_t>(counts_);
      }

      friend bool operator==(Decimal a, Decimal b) { return a.counts_ == b.counts_; }

    private:
      explicit Decimal(std::int32_t counts) : counts_{ counts } {}
      std::int32_t counts_{ 0 };
    };

    /// Slope and intercept convert from reference (instrument) to actual readings.
    struct LinearCalibration {
      double slope{ 1.0 };
      double intercept{ 0.0 };

      double ref2act(double reference) const { return reference * slope + intercept; }
      double act2ref(double actual) const { return (actual - intercept) / slope; }
    };

  } // namespace core
} // namespace spectackler

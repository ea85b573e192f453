/* @file SafetyMonitor.cpp
 * @brief leak + dewpoint interlocks
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/SafetyMonitor.hpp"

#include <cstdio>

namespace spectackler {
  namespace core {

    namespace {
      std::optional<double> numberOf(const Fields& fields, const std::string& key) {
        auto it = fields.find(key);
        if (it == fields.end())
          return std::nullopt;
        return numericValue(it->second);
      }
    } // namespace

    double dewpoint(double relativeHumidity, double temperature) {
      return temperature - (100.0 - relativeHumidity) / 5.0;
    }

    SafetyMonitor::Verdict SafetyMonitor::evaluate(const Fields& fields) const {
      Verdict verdict;

      if (baseline_) {
        if (const auto vol = numberOf(fields, config_.volumeField)) {
          const double displaced = *vol - *baseline_;
          if (displaced > config_.volDiff) {
            char buf[128];
            std::snprintf(buf, sizeof(buf),
                          "[SafetyMonitor] leak: %.3f mL displaced exceeds limit of %.3f mL",
                          displaced, config_.volDiff);
            verdict.fatal = buf;
          }
        }
      }

      const auto temp = numberOf(fields, config_.sampleTempField);
      const auto ambient = numberOf(fields, config_.ambientTempField);
      const auto humidity = numberOf(fields, config_.humidityField);
      if (temp && ambient && humidity) {
        const double limit = dewpoint(*humidity, *ambient) + config_.dewTol;
        const bool airOn = numberOf(fields, config_.airField).value_or(0.0) != 0.0;
        if (!airOn && *temp <= limit)
          verdict.air = true;
        else if (airOn && *temp > limit + config_.dewHysteresis)
          verdict.air = false;
      }
      return verdict;
    }

    std::optional<bool> SafetyMonitor::enforce(const Fields& fields) const {
      auto verdict = evaluate(fields);
      if (verdict.fatal)
        throw SafetyViolation(*verdict.fatal);
      return verdict.air;
    }

  } // namespace core
} // namespace spectackler

#pragma once
/** @file  Sample.hpp
 *  @brief Immutable, timestamped field → value snapshot of one instrument.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace spectackler {
  namespace core {

    /// Numeric reading, boolean status, or label (e.g. polarizer "V").
    using FieldValue = std::variant<double, bool, std::string>;
    using Fields = std::map<std::string, FieldValue>;

    /// Log/TSV rendering: shortest round-trippable number, "True"/"False", raw label.
    std::string formatValue(const FieldValue& value);

    /// Numeric view; booleans map to 0/1, labels have none.
    std::optional<double> numericValue(const FieldValue& value);

    class Sample {
    public:
      using time_point = std::chrono::steady_clock::time_point;

      Sample() = default;
      Sample(time_point taken, Fields fields) : taken_{ taken }, fields_{ std::move(fields) } {}

      time_point taken() const { return taken_; }
      const Fields& fields() const { return fields_; }

      std::optional<FieldValue> get(const std::string& field) const;
      std::optional<double> number(const std::string& field) const;

    private:
      time_point taken_{};
      Fields fields_{};
    };

  } // namespace core
} // namespace spectackler

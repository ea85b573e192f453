/* @file Sample.cpp
 * @brief field lookup and value formatting
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/Sample.hpp"

#include <cstdio>

namespace spectackler {
  namespace core {

    std::string formatValue(const FieldValue& value) {
      if (const auto* d = std::get_if<double>(&value)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.10g", *d);
        return buf;
      }
      if (const auto* b = std::get_if<bool>(&value))
        return *b ? "True" : "False";
      return std::get<std::string>(value);
    }

    std::optional<double> numericValue(const FieldValue& value) {
      if (const auto* d = std::get_if<double>(&value))
        return *d;
      if (const auto* b = std::get_if<bool>(&value))
        return *b ? 1.0 : 0.0;
      return std::nullopt;
    }

    std::optional<FieldValue> Sample::get(const std::string& field) const {
      auto it = fields_.find(field);
      if (it == fields_.end())
        return std::nullopt;
      return it->second;
    }

    std::optional<double> Sample::number(const std::string& field) const {
      auto it = fields_.find(field);
      if (it == fields_.end())
        return std::nullopt;
      return numericValue(it->second);
    }

  } // namespace core
} // namespace spectackler

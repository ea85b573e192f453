#pragma once
/** @file  ExperimentConfig.hpp
 *  @brief Typed, validated view of the run configuration document.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/SafetyMonitor.hpp"
#include "core/StatePlan.hpp"
#include "core/StateScheduler.hpp"
#include "io/SerialChannel.hpp"

namespace spectackler::core {

  struct InstrumentConfig {
    std::string role;         ///< pump | bath | spec | aux
    std::string driver;       ///< InstrumentFactory key
    io::SerialConfig serial;
    nlohmann::json options;   ///< driver-specific keys, validated by the driver
  };

  struct ExperimentConfig {
    static constexpr const char* kRoles[] = { "aux", "bath", "pump", "spec" }; ///< connection order

    std::vector<InstrumentConfig> instruments; ///< present roles, in connection order
    SchedulerConfig scheduler;
    SafetyConfig safety;
    std::vector<FieldRange> ranges;
    std::vector<SortKey> sort;
    std::size_t retryAttempts{ 5 };
    std::chrono::milliseconds poll{ 0 };

    /// Throws SetupError naming the offending key.
    static ExperimentConfig fromJson(const nlohmann::json& doc);

    const InstrumentConfig* instrument(const std::string& role) const;
  };

} // namespace spectackler::core

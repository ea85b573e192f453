#pragma once
/** @file  InstrumentFactory.hpp
 *  @brief Runtime registry that maps driver names to creators.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ExperimentConfig.hpp"
#include "core/Instrument.hpp"
#include "core/Logger.hpp"

namespace spectackler::core {

  /// Everything a driver needs to connect.
  struct DriverContext {
    const InstrumentConfig& config;
    std::shared_ptr<Logger> logger;
    std::size_t retryAttempts{ 5 };
    std::stop_token stop{};
  };

  /**
 * @class InstrumentFactory
 * @brief Register & instantiate drivers by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete drivers.
 *  * The driver is picked once, at construction; nothing dispatches on names later.
 */
  class InstrumentFactory {
  public:
    using Creator = std::function<std::unique_ptr<Instrument>(const DriverContext&)>;

    /// Register a driver under \p name.  Returns false on duplicate.
    bool registerDriver(const std::string& name, Creator maker);

    /// Connect a fresh instance; throws SetupError if the driver name is unknown.
    std::unique_ptr<Instrument> create(const DriverContext& ctx) const;

    bool knows(const std::string& name) const { return creators_.count(name) > 0; }
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace spectackler::core

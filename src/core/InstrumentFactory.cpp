/* @file InstrumentFactory.cpp
 * @brief driver registry
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/InstrumentFactory.hpp"

#include <algorithm>

using namespace spectackler::core;

bool InstrumentFactory::registerDriver(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<Instrument> InstrumentFactory::create(const DriverContext& ctx) const {
  auto it = creators_.find(ctx.config.driver);
  if (it == creators_.end())
    throw SetupError("[InstrumentFactory] unknown driver '" + ctx.config.driver + "' for " +
                     ctx.config.role);
  auto instrument = it->second(ctx);
  if (!instrument)
    throw SetupError("[InstrumentFactory] driver '" + ctx.config.driver + "' returned nothing");
  return instrument;
}

std::vector<std::string> InstrumentFactory::names() const {
  std::vector<std::string> out;
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

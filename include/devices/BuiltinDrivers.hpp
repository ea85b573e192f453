#pragma once
/** @file  BuiltinDrivers.hpp
 *  @brief Registers the shipped instrument drivers with an InstrumentFactory.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/InstrumentFactory.hpp"

namespace spectackler::devices {

  /// isco260d, neslab_rte, isotemp6200, rf5301, auxmcu
  void registerBuiltinDrivers(core::InstrumentFactory& factory);

} // namespace spectackler::devices

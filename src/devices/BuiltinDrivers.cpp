/* @file BuiltinDrivers.cpp
 * @brief driver name → (wire protocol, driver class) table
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "devices/BuiltinDrivers.hpp"

#include <memory>

#include "core/DeviceLink.hpp"
#include "devices/AuxController.hpp"
#include "devices/IsotempBath.hpp"
#include "devices/NeslabBath.hpp"
#include "devices/Spectrofluorometer.hpp"
#include "devices/SyringePump.hpp"
#include "protocols/AsciiCodec.hpp"
#include "protocols/DasnetCodec.hpp"
#include "protocols/NeslabCodec.hpp"
#include "protocols/ShimadzuCodec.hpp"

using spectackler::core::DeviceLink;
using spectackler::core::DriverContext;
using spectackler::core::Instrument;
using spectackler::core::InstrumentFactory;
namespace protocols = spectackler::protocols;

namespace {
  std::unique_ptr<DeviceLink> openLink(const DriverContext& ctx,
                                       std::unique_ptr<protocols::WireProtocol> protocol) {
    return DeviceLink::open(ctx.config.role, ctx.config.serial, std::move(protocol), ctx.logger,
                            ctx.retryAttempts);
  }
} // namespace

namespace spectackler::devices {

  void registerBuiltinDrivers(InstrumentFactory& factory) {
    factory.registerDriver("isco260d", [](const DriverContext& ctx) -> std::unique_ptr<Instrument> {
      auto options = SyringePump::Options::fromJson(ctx.config.options);
      return std::make_unique<SyringePump>(
          ctx.config.role, openLink(ctx, std::make_unique<protocols::DasnetProtocol>()),
          options, ctx.stop);
    });

    factory.registerDriver("neslab_rte", [](const DriverContext& ctx) -> std::unique_ptr<Instrument> {
      auto options = NeslabBath::Options::fromJson(ctx.config.options);
      return std::make_unique<NeslabBath>(
          ctx.config.role, openLink(ctx, std::make_unique<protocols::NeslabProtocol>()),
          options, ctx.stop);
    });

    factory.registerDriver("isotemp6200", [](const DriverContext& ctx) -> std::unique_ptr<Instrument> {
      auto options = IsotempBath::Options::fromJson(ctx.config.options);
      return std::make_unique<IsotempBath>(
          ctx.config.role, openLink(ctx, std::make_unique<protocols::AsciiProtocol>('\r')),
          options, ctx.stop);
    });

    factory.registerDriver("rf5301", [](const DriverContext& ctx) -> std::unique_ptr<Instrument> {
      return std::make_unique<Spectrofluorometer>(
          ctx.config.role, openLink(ctx, std::make_unique<protocols::ShimadzuProtocol>()),
          ctx.stop);
    });

    factory.registerDriver("auxmcu", [](const DriverContext& ctx) -> std::unique_ptr<Instrument> {
      auto options = AuxController::Options::fromJson(ctx.config.options);
      return std::make_unique<AuxController>(
          ctx.config.role, openLink(ctx, std::make_unique<protocols::AsciiProtocol>('\n')),
          options, ctx.stop);
    });
  }

} // namespace spectackler::devices

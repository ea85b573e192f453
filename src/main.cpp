/* @file main.cpp
 * @brief spectackler <config.json> <log.tsv>
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <csignal>
#include <ctime>
#include <exception>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include <pthread.h>
#include <unistd.h>

#include "core/Clock.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentConfig.hpp"
#include "core/InstrumentFactory.hpp"
#include "core/Logger.hpp"
#include "core/StatePlan.hpp"
#include "core/SystemCoordinator.hpp"
#include "devices/BuiltinDrivers.hpp"

using namespace spectackler;

namespace {
  /// SIGINT/SIGTERM are blocked process-wide and collected here, outside signal context.
  std::jthread watchSignals(std::stop_source run) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    return std::jthread([set, run](std::stop_token self) mutable {
      const timespec tick{ 0, 200'000'000 };
      while (!self.stop_requested()) {
        if (sigtimedwait(&set, nullptr, &tick) > 0) {
          std::cerr << "[main] interrupt, stopping run\n";
          run.request_stop();
          return;
        }
      }
    });
  }

  core::StatePlan loadPlan(const core::ExperimentConfig& config) {
    if (!isatty(STDIN_FILENO))
      return core::StatePlan::fromTable(std::cin);
    auto plan = core::StatePlan::fromRanges(config.ranges, config.sort);
    plan.writeTable(std::cout);
    std::cout.flush();
    return plan;
  }
} // namespace

int main(int argc, char* argv[]) {
  if (argc != 3) {
    std::cerr << "usage: " << argv[0] << " <config.json> <log.tsv>\n";
    return core::SystemCoordinator::kExitSetupFailed;
  }

  auto logger = std::make_shared<core::Logger>();
  auto errorMonitor = std::make_shared<core::ErrorMonitor>();

  core::ExperimentConfig config;
  core::StatePlan plan;
  try {
    core::ConfigLoader loader(argv[1]);
    config = core::ExperimentConfig::fromJson(loader.load());
    plan = loadPlan(config);
  } catch (const std::exception& e) {
    logger->error("main", e.what());
    return core::SystemCoordinator::kExitSetupFailed;
  }

  core::InstrumentFactory factory;
  devices::registerBuiltinDrivers(factory);

  std::stop_source stop;
  auto watcher = watchSignals(stop);

  core::SteadyClock clock;
  core::SystemCoordinator coordinator(std::move(config), factory, clock, logger, errorMonitor);
  const int code = coordinator.run(plan, argv[2], stop.get_token());

  logger->info("main", std::string("finished in state ") + core::toString(coordinator.state()));
  return code;
}

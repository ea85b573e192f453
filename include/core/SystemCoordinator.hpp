#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Owns one experiment run: instruments, pollers, scheduler, shutdown.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "core/Clock.hpp"
#include "core/DataLogger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentConfig.hpp"
#include "core/Instrument.hpp"
#include "core/InstrumentFactory.hpp"
#include "core/Logger.hpp"
#include "core/Poller.hpp"
#include "core/SafetyMonitor.hpp"
#include "core/StatePlan.hpp"
#include "core/StateScheduler.hpp"

namespace spectackler {
  namespace core {

    /**
 * @class SystemCoordinator
 * @brief BOOT → INIT → RUNNING → FINISHED | ERROR
 *
 *  INIT connects the configured instruments (aux, bath, pump, spec), binds
 *  plan columns to their capabilities and checks the plan against them before
 *  any actuator moves. Whatever happens afterwards, the shutdown sequence runs
 *  before run() returns.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, FINISHED, ERROR };

      static constexpr int kExitCompleted = 0;
      static constexpr int kExitSetupFailed = 1;
      static constexpr int kExitAborted = 2;

      SystemCoordinator(ExperimentConfig config, const InstrumentFactory& factory, Clock& clock,
                        std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errorMonitor);
      ~SystemCoordinator();

      // ---- Public API ----
      /// Full lifecycle; returns one of the kExit* codes.
      int run(const StatePlan& plan, const std::string& logPath, std::stop_token stop);

      void registerCallback(std::function<void(const SchedulerNotice&)> cb) {
        callback_ = std::move(cb);
      }

      State state() const { return currentState_; }
      Instrument* instrument(const std::string& role) const;
      std::size_t commandsIssued() const { return scheduler_ ? scheduler_->commandsIssued() : 0; }
      const DataLogger* dataLogger() const { return dataLogger_.get(); }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      struct Connected {
        std::string role;
        std::unique_ptr<Instrument> instrument;
      };

      void connect(std::stop_token stop);
      std::vector<SetpointBinding> buildBindings() const;
      void checkPlan(const StatePlan& plan) const;
      void prepareHardware(std::stop_token stop);
      void startPollers();
      void stopPollers();
      bool shutdown();
      void transitionTo(State next);
      int fail(const std::string& reason, int code);

      template <typename Capability> Capability* find() const {
        for (const auto& c : instruments_)
          if (auto* cap = dynamic_cast<Capability*>(c.instrument.get()))
            return cap;
        return nullptr;
      }

      ExperimentConfig config_;
      const InstrumentFactory& factory_;
      Clock& clock_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      SafetyMonitor safety_;

      std::vector<Connected> instruments_; ///< connection order
      std::vector<std::unique_ptr<Poller>> pollers_;
      std::unique_ptr<DataLogger> dataLogger_;
      std::unique_ptr<StateScheduler> scheduler_;
      std::function<void(const SchedulerNotice&)> callback_{};

      State currentState_{ State::BOOT };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace spectackler

#pragma once
/** @file  StateScheduler.hpp
 *  @brief Steps the apparatus through a StatePlan under safety supervision.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

// spectackler headers
#include "core/Capabilities.hpp"
#include "core/Clock.hpp"
#include "core/DataLogger.hpp"
#include "core/Instrument.hpp"
#include "core/Logger.hpp"
#include "core/SafetyMonitor.hpp"
#include "core/StatePlan.hpp"
#include "core/TrailingWindow.hpp"

namespace spectackler {
  namespace core {

    /// A device never reported back the value it was commanded to.
    class SetpointError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * How one group of plan columns reaches hardware. Both callbacks are direct
 * commands; the driver behind them pauses its own poller while they run.
 */
    struct SetpointBinding {
      std::string label;               ///< for log lines, e.g. "bath"
      std::vector<std::string> fields; ///< plan columns this binding consumes
      std::function<bool(const ExperimentState&, std::stop_token)> matches; ///< read-back == state
      std::function<void(const ExperimentState&, std::stop_token)> command; ///< write the state
    };

    enum class AdvanceMode { Equilibrium, Oscillation };

    struct OscillationSettings {
      std::string field{ "T_act" };
      std::size_t count{ 3 };
      Seconds timeout{ 3600.0 };
      double threshold{ 0.1 };
    };

    struct SchedulerConfig {
      std::chrono::milliseconds cycle{ 100 };
      unsigned readsPerState{ 15 };
      std::string headline{ "intensity" };
      bool autoShutter{ true };
      Seconds shutterSettle{ 0.0 };           ///< dye relaxation after a temperature change
      std::string settleTrigger{ "T_set" };   ///< setpoint whose change arms the settle delay
      AdvanceMode mode{ AdvanceMode::Equilibrium };
      std::vector<EquilibrationRule> rules;
      OscillationSettings oscillation;
      std::size_t setpointAttempts{ 5 };
    };

    enum class SchedulerEvent { StateBegin, SetpointsApplied, Equilibrated, Reading, StateComplete };

    const char* toString(SchedulerEvent e);

    struct SchedulerNotice {
      SchedulerEvent event;
      std::size_t state{ 0 };   ///< index into the plan
      Clock::time_point at{};   ///< scheduler clock
      std::string detail;
    };

    /**
 * @class StateScheduler
 * @brief For each state: ApplySetpoints → AwaitEquilibrium → Collect readings
 *        → Advance. Every cycle merges the latest mailbox contents, runs the
 *        SafetyMonitor and hands the row to the DataLogger.
 *
 *  * SafetyViolation, SetpointError and transport errors of direct commands
 *    propagate to the caller, which runs the shutdown sequence.
 *  * run() returns false if \p stop was triggered, true once every state is done.
 */
    class StateScheduler {
    public:
      StateScheduler(SchedulerConfig config, std::vector<Instrument*> instruments,
                     std::vector<SetpointBinding> bindings, SafetyMonitor& safety, Clock& clock,
                     std::shared_ptr<Logger> logger);

      void setDataLogger(DataLogger* log) { dataLogger_ = log; }
      void setShutter(Shutter* shutter) { shutter_ = shutter; }
      void setAirValve(AirValve* valve) { valve_ = valve; }
      void registerCallback(std::function<void(const SchedulerNotice&)> cb) {
        callback_ = std::move(cb);
      }

      /// Throws SetupError if a plan column has no binding or a state lacks a bound column.
      void validate(const StatePlan& plan) const;

      bool run(const StatePlan& plan, std::stop_token stop);

      /// Merged latest fields of every instrument (later instruments win on clashes).
      Fields mergeLatest() const;

      /// Number of setpoint commands issued so far (read-backs excluded).
      std::size_t commandsIssued() const { return commands_; }

    private:
      bool waitForMailboxes(std::stop_token stop);
      void applySetpoints(const ExperimentState& state, const std::set<std::string>& changed,
                          std::stop_token stop);
      Fields cycleRow(const ExperimentState& state, std::size_t index,
                      Clock::time_point now) const;
      void superviseSafety(const Fields& row, std::stop_token stop);
      bool sleepCycle(Clock::time_point cycleStart, std::stop_token stop);
      void notify(SchedulerEvent e, std::size_t state, std::string detail = {});
      bool runEquilibrium(const StatePlan& plan, std::size_t index,
                          const std::set<std::string>& changed, std::stop_token stop);
      bool runOscillation(const StatePlan& plan, std::size_t index, std::stop_token stop);
      bool equilibrationChanges(const ExperimentState& from, const ExperimentState& to) const;

      SchedulerConfig config_;
      std::vector<Instrument*> instruments_;
      std::vector<SetpointBinding> bindings_;
      SafetyMonitor& safety_;
      Clock& clock_;
      std::shared_ptr<Logger> logger_;

      DataLogger* dataLogger_{ nullptr };
      Shutter* shutter_{ nullptr };
      AirValve* valve_{ nullptr };
      std::function<void(const SchedulerNotice&)> callback_{};

      Clock::time_point runStart_{};
      std::size_t commands_{ 0 };
    };

    /// Columns that differ between consecutive states (all columns for the first).
    std::set<std::string> changedFields(const ExperimentState* previous,
                                        const ExperimentState& current);

  } // namespace core
} // namespace spectackler

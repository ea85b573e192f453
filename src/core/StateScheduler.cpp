/* @file StateScheduler.cpp
 * @brief setpoint application, equilibration, reading accumulation and safety supervision
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <ctime>
#include <map>
#include <optional>

// spectackler headers
#include "core/OscillationCounter.hpp"
#include "core/Retry.hpp"
#include "core/StateScheduler.hpp"

namespace spectackler {
  namespace core {

    namespace {
      std::string wallClock() {
        const std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y%m%d %H%M%S", &tm);
        return buf;
      }

      std::string describe(const ExperimentState& state) {
        std::string out;
        for (const auto& [name, value] : state.setpoints)
          out += (out.empty() ? "" : ", ") + name + "=" + formatValue(value);
        return out;
      }

      Clock::time_point::duration toDuration(Seconds s) {
        return std::chrono::duration_cast<Clock::time_point::duration>(s);
      }
    } // namespace

    const char* toString(SchedulerEvent e) {
      switch (e) {
      case SchedulerEvent::StateBegin:
        return "StateBegin";
      case SchedulerEvent::SetpointsApplied:
        return "SetpointsApplied";
      case SchedulerEvent::Equilibrated:
        return "Equilibrated";
      case SchedulerEvent::Reading:
        return "Reading";
      case SchedulerEvent::StateComplete:
        return "StateComplete";
      default:
        return "Unknown";
      }
    }

    std::set<std::string> changedFields(const ExperimentState* previous,
                                        const ExperimentState& current) {
      std::set<std::string> changed;
      for (const auto& [name, value] : current.setpoints) {
        if (previous == nullptr) {
          changed.insert(name);
          continue;
        }
        const auto before = previous->get(name);
        if (!before || formatValue(*before) != formatValue(value))
          changed.insert(name);
      }
      return changed;
    }

    StateScheduler::StateScheduler(SchedulerConfig config, std::vector<Instrument*> instruments,
                                   std::vector<SetpointBinding> bindings, SafetyMonitor& safety,
                                   Clock& clock, std::shared_ptr<Logger> logger)
        : config_(std::move(config)), instruments_(std::move(instruments)),
          bindings_(std::move(bindings)), safety_(safety), clock_(clock),
          logger_(std::move(logger)) {}

    void StateScheduler::validate(const StatePlan& plan) const {
      if (plan.empty())
        throw SetupError("[StateScheduler] plan has no states");
      for (const auto& column : plan.columns()) {
        const bool bound = std::any_of(bindings_.begin(), bindings_.end(), [&](const auto& b) {
          return std::find(b.fields.begin(), b.fields.end(), column) != b.fields.end();
        });
        if (!bound)
          throw SetupError("[StateScheduler] no connected instrument accepts plan column '" +
                           column + "'");
      }
      for (const auto& b : bindings_) {
        const bool used = std::any_of(b.fields.begin(), b.fields.end(), [&](const auto& f) {
          return std::find(plan.columns().begin(), plan.columns().end(), f) !=
                 plan.columns().end();
        });
        if (!used)
          continue;
        for (const auto& f : b.fields)
          if (std::find(plan.columns().begin(), plan.columns().end(), f) == plan.columns().end())
            throw SetupError("[StateScheduler] " + b.label + " needs plan column '" + f + "'");
      }
      if (config_.mode == AdvanceMode::Oscillation && config_.oscillation.count == 0)
        throw SetupError("[StateScheduler] oscillation count must be at least 1");
    }

    Fields StateScheduler::mergeLatest() const {
      Fields merged;
      for (const auto* inst : instruments_) {
        const auto snap = inst->mailbox().latest();
        if (!snap.sample)
          continue;
        for (const auto& [k, v] : snap.sample->fields())
          merged[k] = v;
      }
      return merged;
    }

    void StateScheduler::notify(SchedulerEvent e, std::size_t state, std::string detail) {
      if (callback_)
        callback_(SchedulerNotice{ e, state, clock_.now(), std::move(detail) });
    }

    bool StateScheduler::sleepCycle(Clock::time_point cycleStart, std::stop_token stop) {
      return clock_.sleepUntil(cycleStart + config_.cycle, stop);
    }

    bool StateScheduler::waitForMailboxes(std::stop_token stop) {
      for (;;) {
        const bool all = std::all_of(instruments_.begin(), instruments_.end(), [](const auto* i) {
          return i->mailbox().sequence() > 0;
        });
        if (all)
          return true;
        if (!sleepCycle(clock_.now(), stop))
          return false;
      }
    }

    void StateScheduler::applySetpoints(const ExperimentState& state,
                                        const std::set<std::string>& changed,
                                        std::stop_token stop) {
      for (const auto& b : bindings_) {
        const bool touched = std::any_of(b.fields.begin(), b.fields.end(),
                                         [&](const auto& f) { return changed.count(f) > 0; });
        const bool present = std::all_of(b.fields.begin(), b.fields.end(),
                                         [&](const auto& f) { return state.get(f).has_value(); });
        if (!touched || !present)
          continue;

        const auto result = retryBounded(config_.setpointAttempts, [&](std::size_t attempt) {
          if (b.matches(state, stop))
            return true;
          logger_->info("StateScheduler", b.label + ": setpoint round " + std::to_string(attempt) +
                                              "/" + std::to_string(config_.setpointAttempts));
          b.command(state, stop);
          ++commands_;
          return false;
        });
        if (!result && !b.matches(state, stop))
          throw SetpointError("[StateScheduler] " + b.label + " did not accept setpoint after " +
                              std::to_string(result.attempts) + " rounds");
      }
    }

    Fields StateScheduler::cycleRow(const ExperimentState& state, std::size_t index,
                                    Clock::time_point now) const {
      Fields row = mergeLatest();
      row["clock"] = wallClock();
      row["watch"] = std::round(Seconds(now - runStart_).count() * 1000.0) / 1000.0;
      row["state"] = static_cast<double>(index);
      for (const auto& [name, value] : state.setpoints)
        row[name] = value;
      return row;
    }

    void StateScheduler::superviseSafety(const Fields& row, std::stop_token stop) {
      if (!safety_.baselineVolume()) {
        auto it = row.find(safety_.config().volumeField);
        if (it != row.end())
          if (const auto v = numericValue(it->second))
            safety_.setBaselineVolume(*v);
      }

      const auto air = safety_.enforce(row); // SafetyViolation propagates
      if (air && valve_) {
        logger_->info("SafetyMonitor", std::string("dry air ") + (*air ? "ON" : "OFF"));
        valve_->setAir(*air, stop);
      }
    }

    bool StateScheduler::equilibrationChanges(const ExperimentState& from,
                                              const ExperimentState& to) const {
      const auto changed = changedFields(&from, to);
      return std::any_of(config_.rules.begin(), config_.rules.end(),
                         [&](const auto& r) { return changed.count(r.setpoint) > 0; });
    }

    bool StateScheduler::runEquilibrium(const StatePlan& plan, std::size_t index,
                                        const std::set<std::string>& changed,
                                        std::stop_token stop) {
      const ExperimentState& state = plan[index];
      const unsigned reads = state.reads.value_or(config_.readsPerState);

      std::vector<EquilibrationRule> rules = config_.rules;
      if (state.holdSeconds)
        for (auto& r : rules)
          r.minHold = Seconds(*state.holdSeconds);

      std::map<std::string, double> targets;
      for (const auto& [name, value] : state.setpoints)
        if (const auto n = numericValue(value))
          targets[name] = *n;

      EquilibriumTracker tracker(rules);
      tracker.begin(clock_.now(), targets, changed);

      const bool settleArmed = changed.count(config_.settleTrigger) > 0;
      bool equilibrated = false;
      Clock::time_point readyAt{};
      std::optional<std::string> lastHeadline;
      unsigned readings = 0;

      for (;;) {
        const auto now = clock_.now();
        const Fields row = cycleRow(state, index, now);
        superviseSafety(row, stop);
        if (dataLogger_)
          dataLogger_->record(row);

        if (!equilibrated) {
          tracker.observe(now, row);
          if (tracker.ready(now)) {
            equilibrated = true;
            readyAt = now;
            notify(SchedulerEvent::Equilibrated, index, tracker.forced() ? "timeout" : "in range");
            logger_->info("StateScheduler", "state " + std::to_string(index) +
                                                (tracker.forced() ? " force-advanced on timeout"
                                                                  : " equilibrated"));
            if (config_.autoShutter && shutter_)
              shutter_->setShutter(true, stop);
            if (auto it = row.find(config_.headline); it != row.end())
              lastHeadline = formatValue(it->second); // baseline, not counted
          }
        } else {
          auto it = row.find(config_.headline);
          const bool settling = settleArmed && now - readyAt < toDuration(config_.shutterSettle);
          if (it != row.end()) {
            const std::string value = formatValue(it->second);
            if (settling) {
              lastHeadline = value;
            } else if (!lastHeadline || *lastHeadline != value) {
              lastHeadline = value;
              ++readings;
              notify(SchedulerEvent::Reading, index, value);
            }
          }
          if (readings >= reads)
            return true;
        }

        if (equilibrated && reads == 0)
          return true;
        if (!sleepCycle(now, stop))
          return false;
      }
    }

    bool StateScheduler::runOscillation(const StatePlan& plan, std::size_t index,
                                        std::stop_token stop) {
      const ExperimentState& state = plan[index];
      const auto& osc = config_.oscillation;
      OscillationCounter counter(osc.threshold);
      const auto start = clock_.now();

      for (;;) {
        const auto now = clock_.now();
        const Fields row = cycleRow(state, index, now);
        superviseSafety(row, stop);
        if (dataLogger_)
          dataLogger_->record(row);

        if (auto it = row.find(osc.field); it != row.end()) {
          if (const auto v = numericValue(it->second)) {
            const auto before = counter.oscillations();
            counter.observe(*v);
            if (counter.oscillations() != before)
              notify(SchedulerEvent::Reading, index,
                     std::to_string(counter.oscillations()) + " oscillations");
          }
        }

        if (counter.oscillations() >= osc.count) {
          notify(SchedulerEvent::Equilibrated, index, "oscillations");
          return true;
        }
        if (now - start > toDuration(osc.timeout)) {
          logger_->warn("StateScheduler", "state " + std::to_string(index) + ": timeout after " +
                                              std::to_string(counter.oscillations()) +
                                              " oscillations");
          notify(SchedulerEvent::Equilibrated, index, "timeout");
          return true;
        }
        if (!sleepCycle(now, stop))
          return false;
      }
    }

    bool StateScheduler::run(const StatePlan& plan, std::stop_token stop) {
      validate(plan);
      runStart_ = clock_.now();

      logger_->info("StateScheduler", "waiting for first sample from every instrument");
      if (!waitForMailboxes(stop))
        return false;

      const ExperimentState* previous = nullptr;
      for (std::size_t i = 0; i < plan.size(); ++i) {
        const ExperimentState& state = plan[i];
        notify(SchedulerEvent::StateBegin, i, describe(state));
        logger_->info("StateScheduler", "state " + std::to_string(i + 1) + "/" +
                                            std::to_string(plan.size()) + ": " + describe(state));

        const auto changed = changedFields(previous, state);
        applySetpoints(state, changed, stop);
        notify(SchedulerEvent::SetpointsApplied, i);

        const bool done = (config_.mode == AdvanceMode::Oscillation)
                              ? runOscillation(plan, i, stop)
                              : runEquilibrium(plan, i, changed, stop);
        if (!done)
          return false;

        const bool last = (i + 1 == plan.size());
        if (config_.autoShutter && shutter_ && config_.mode == AdvanceMode::Equilibrium &&
            (last || equilibrationChanges(state, plan[i + 1])))
          shutter_->setShutter(false, stop);

        notify(SchedulerEvent::StateComplete, i);
        previous = &state;
      }
      logger_->info("StateScheduler", "all " + std::to_string(plan.size()) + " states complete");
      return true;
    }

  } // namespace core
} // namespace spectackler

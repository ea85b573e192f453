#pragma once
/** @file  TrailingWindow.hpp
 *  @brief Time-scoped sample buffers and the per-state equilibration test built on them.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/Clock.hpp"
#include "core/Sample.hpp"

namespace spectackler {
  namespace core {

    class TrailingWindow {
    public:
      using time_point = Clock::time_point;

      explicit TrailingWindow(Clock::time_point::duration horizon) : horizon_{ horizon } {}

      void add(time_point at, double value) { samples_.emplace_back(at, value); }

      /// Drops samples older than now − horizon, except the newest one at or before it.
      void prune(time_point now);

      /// True once the oldest retained sample is at least one horizon old.
      bool spans(time_point now) const;

      /// Inclusive band: |value − target| ≤ tolerance for every retained sample.
      bool allWithin(double target, double tolerance) const;

      std::size_t size() const { return samples_.size(); }
      void clear() { samples_.clear(); }

    private:
      Clock::time_point::duration horizon_;
      std::deque<std::pair<time_point, double>> samples_;
    };

    /// Which measured field must settle on which setpoint, and for how long.
    struct EquilibrationRule {
      std::string setpoint; ///< e.g. "T_set"
      std::string measured; ///< e.g. "T_act"
      Seconds minHold{ 0.0 };
      Seconds maxTimeout{ 0.0 };
      double tolerance{ 0.0 };
    };

    /**
 * @class EquilibriumTracker
 * @brief Decides when every setpoint changed by the current state has settled.
 *
 *  A field is in range once its window spans `minHold` with every sample inside
 *  the tolerance band, or once `maxTimeout` has elapsed since begin() (the state
 *  is force-advanced, not failed). Fields unchanged from the previous state are
 *  waived. Once every rule holds at the same instant the verdict latches until
 *  the next begin().
 */
    class EquilibriumTracker {
    public:
      using time_point = Clock::time_point;

      explicit EquilibriumTracker(std::vector<EquilibrationRule> rules);

      /// \p setpoints: target values of this state; \p changed: setpoint names that moved.
      void begin(time_point start, const std::map<std::string, double>& setpoints,
                 const std::set<std::string>& changed);

      void observe(time_point now, const Fields& fields);

      bool ready(time_point now);

      /// Rules still being waited on, for progress messages.
      std::vector<std::string> pending(time_point now);

      /// True if ready() was decided by the timeout of at least one rule.
      bool forced() const { return forced_; }

    private:
      struct Active {
        EquilibrationRule rule;
        double target{ 0.0 };
        TrailingWindow window;
      };

      static bool inBand(Active& active, time_point now);

      std::vector<EquilibrationRule> rules_;
      std::vector<Active> active_;
      time_point start_{};
      bool ready_{ false };
      bool forced_{ false };
    };

  } // namespace core
} // namespace spectackler

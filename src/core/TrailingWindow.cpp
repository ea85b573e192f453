/* @file TrailingWindow.cpp
 * @brief hold-time windows and equilibration bookkeeping
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/TrailingWindow.hpp"

#include <algorithm>
#include <cmath>

namespace spectackler {
  namespace core {

    namespace {
      Clock::time_point::duration toDuration(Seconds s) {
        return std::chrono::duration_cast<Clock::time_point::duration>(s);
      }
    } // namespace

    // The newest sample at or before the horizon stays: the value held from then on.
    void TrailingWindow::prune(time_point now) {
      const auto horizonStart = now - horizon_;
      while (samples_.size() > 1 && samples_[1].first <= horizonStart)
        samples_.pop_front();
    }

    bool TrailingWindow::spans(time_point now) const {
      return !samples_.empty() && samples_.front().first <= now - horizon_;
    }

    bool TrailingWindow::allWithin(double target, double tolerance) const {
      return std::all_of(samples_.begin(), samples_.end(), [&](const auto& s) {
        return std::fabs(s.second - target) <= tolerance;
      });
    }

    EquilibriumTracker::EquilibriumTracker(std::vector<EquilibrationRule> rules)
        : rules_(std::move(rules)) {}

    void EquilibriumTracker::begin(time_point start, const std::map<std::string, double>& setpoints,
                                   const std::set<std::string>& changed) {
      active_.clear();
      start_ = start;
      ready_ = false;
      forced_ = false;
      for (const auto& rule : rules_) {
        auto sp = setpoints.find(rule.setpoint);
        if (sp == setpoints.end() || changed.count(rule.setpoint) == 0)
          continue; // waived
        active_.push_back(Active{ rule, sp->second, TrailingWindow(toDuration(rule.minHold)) });
      }
    }

    void EquilibriumTracker::observe(time_point now, const Fields& fields) {
      for (auto& a : active_) {
        auto it = fields.find(a.rule.measured);
        if (it == fields.end())
          continue;
        if (const auto v = numericValue(it->second))
          a.window.add(now, *v);
      }
    }

    bool EquilibriumTracker::inBand(Active& a, time_point now) {
      a.window.prune(now);
      return a.window.spans(now) && a.window.allWithin(a.target, a.rule.tolerance);
    }

    bool EquilibriumTracker::ready(time_point now) {
      if (ready_)
        return true;
      bool all = true;
      bool timedOut = false;
      for (auto& a : active_) {
        if (inBand(a, now))
          continue;
        if (now - start_ >= toDuration(a.rule.maxTimeout))
          timedOut = true;
        else
          all = false;
      }
      ready_ = all;
      forced_ = all && timedOut;
      return ready_;
    }

    std::vector<std::string> EquilibriumTracker::pending(time_point now) {
      std::vector<std::string> names;
      for (auto& a : active_) {
        if (!inBand(a, now) && now - start_ < toDuration(a.rule.maxTimeout))
          names.push_back(a.rule.measured);
      }
      return names;
    }

  } // namespace core
} // namespace spectackler
